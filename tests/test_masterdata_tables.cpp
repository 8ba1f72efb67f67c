#include <gtest/gtest.h>

#include "aktk/file_stream.hpp"
#include "aktk/log.hpp"
#include "aktk/masterdata_tables.hpp"

#include <lz4.h>
#include <msgpack.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

namespace fs = std::filesystem;
using aktk::masterdata::Bytes;

Bytes ToBytes(const msgpack::sbuffer& buf) {
    return Bytes(reinterpret_cast<const std::uint8_t*>(buf.data()),
                 reinterpret_cast<const std::uint8_t*>(buf.data()) + buf.size());
}

std::string ToText(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

Bytes Lz4Compress(const Bytes& raw) {
    std::vector<char> out(static_cast<std::size_t>(LZ4_compressBound(static_cast<int>(raw.size()))));
    int len = LZ4_compress_default(reinterpret_cast<const char*>(raw.data()), out.data(), static_cast<int>(raw.size()),
                                   static_cast<int>(out.size()));
    EXPECT_GT(len, 0);
    return Bytes(out.begin(), out.begin() + len);
}

// ext 99 carrying a fixed int32 length and one LZ4 block.
Bytes WrapLz4Block(const Bytes& raw) {
    msgpack::sbuffer body;
    msgpack::packer<msgpack::sbuffer> body_pk(&body);
    body_pk.pack_fix_int32(static_cast<std::int32_t>(raw.size()));
    const Bytes block = Lz4Compress(raw);
    body.write(reinterpret_cast<const char*>(block.data()), block.size());

    msgpack::sbuffer out;
    msgpack::packer<msgpack::sbuffer> pk(&out);
    pk.pack_ext(body.size(), 99);
    pk.pack_ext_body(body.data(), body.size());
    return ToBytes(out);
}

// [{"name": "Marie", "id": 1}, {"name": "Lila", "id": 2}]
Bytes ItemTable() {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(2);
    pk.pack_map(2);
    pk.pack(std::string("name"));
    pk.pack(std::string("Marie"));
    pk.pack(std::string("id"));
    pk.pack(1);
    pk.pack_map(2);
    pk.pack(std::string("name"));
    pk.pack(std::string("Lila"));
    pk.pack(std::string("id"));
    pk.pack(2);
    return ToBytes(buf);
}

const char* const kItemJson = R"([{"name":"Marie","id":1},{"name":"Lila","id":2}])";

Bytes MixedTable() {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_map(6);
    pk.pack(1);
    pk.pack(std::string("one"));
    pk.pack(std::string("flag"));
    pk.pack_true();
    pk.pack(std::string("blob"));
    const char blob[] = {0x01, 0x02, 0x03};
    pk.pack_bin(3);
    pk.pack_bin_body(blob, 3);
    pk.pack(std::string("none"));
    pk.pack_nil();
    pk.pack(std::string("neg"));
    pk.pack(-5);
    pk.pack(std::string("half"));
    pk.pack_double(0.5);
    return ToBytes(buf);
}

const char* const kMixedJson = R"({"1":"one","flag":true,"blob":"AQID","none":null,"neg":-5,"half":0.5})";

struct TableSpec {
    std::string name;
    Bytes payload;
};

Bytes BuildArchive(const std::vector<TableSpec>& tables) {
    msgpack::sbuffer header;
    msgpack::packer<msgpack::sbuffer> pk(&header);
    pk.pack_map(static_cast<std::uint32_t>(tables.size()));
    std::size_t offset = 0;
    for (const auto& table : tables) {
        pk.pack(table.name);
        pk.pack_array(2);
        pk.pack(static_cast<std::int32_t>(offset));
        pk.pack(static_cast<std::int32_t>(table.payload.size()));
        offset += table.payload.size();
    }
    Bytes archive = ToBytes(header);
    for (const auto& table : tables) {
        archive.insert(archive.end(), table.payload.begin(), table.payload.end());
    }
    return archive;
}

class MasterDataTablesTest : public ::testing::Test {
protected:
    void SetUp() override {
        aktk::log::SetQuiet(true);
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("aktk_md_" + std::to_string(rd()) + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
        aktk::log::SetQuiet(false);
    }

    fs::path root_;
};

}  // namespace

TEST_F(MasterDataTablesTest, ReadsHeaderInOrder) {
    const Bytes item = WrapLz4Block(ItemTable());
    const Bytes mixed = MixedTable();
    const Bytes archive = BuildArchive({{"ItemMaster", item}, {"MixedMaster", mixed}});

    const auto index = aktk::masterdata::ReadTableIndex(archive);
    ASSERT_EQ(index.tables.size(), 2U);
    EXPECT_EQ(index.tables[0].name, "ItemMaster");
    EXPECT_EQ(index.tables[0].offset, 0);
    EXPECT_EQ(index.tables[0].size, static_cast<std::int64_t>(item.size()));
    EXPECT_EQ(index.tables[1].name, "MixedMaster");
    EXPECT_EQ(index.tables[1].offset, static_cast<std::int64_t>(item.size()));
    EXPECT_EQ(index.data_offset + item.size() + mixed.size(), archive.size());
}

TEST_F(MasterDataTablesTest, ExtractsEveryTableAsJson) {
    const Bytes archive = BuildArchive({{"ItemMaster", WrapLz4Block(ItemTable())}, {"MixedMaster", MixedTable()}});

    EXPECT_EQ(aktk::masterdata::ExtractTables(archive, root_ / "out"), 2U);
    EXPECT_EQ(ToText(aktk::filestream::ReadFile(root_ / "out" / "ItemMaster.json")), kItemJson);
    EXPECT_EQ(ToText(aktk::filestream::ReadFile(root_ / "out" / "MixedMaster.json")), kMixedJson);
}

TEST_F(MasterDataTablesTest, Lz4BlockIsUnwrapped) {
    const Bytes raw = ItemTable();
    const Bytes wrapped = WrapLz4Block(raw);
    EXPECT_EQ(aktk::masterdata::DecompressTable(wrapped.data(), wrapped.size()), raw);

    const Bytes plain = MixedTable();
    EXPECT_EQ(aktk::masterdata::DecompressTable(plain.data(), plain.size()), plain);
}

TEST_F(MasterDataTablesTest, Lz4BlockArrayIsConcatenated) {
    const Bytes raw = ItemTable();
    const std::size_t split = raw.size() / 2;
    const Bytes first(raw.begin(), raw.begin() + static_cast<std::ptrdiff_t>(split));
    const Bytes second(raw.begin() + static_cast<std::ptrdiff_t>(split), raw.end());

    msgpack::sbuffer lengths;
    msgpack::packer<msgpack::sbuffer> lengths_pk(&lengths);
    lengths_pk.pack_fix_int32(static_cast<std::int32_t>(first.size()));
    lengths_pk.pack_fix_int32(static_cast<std::int32_t>(second.size()));

    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(3);
    pk.pack_ext(lengths.size(), 98);
    pk.pack_ext_body(lengths.data(), lengths.size());
    for (const Bytes* part : {&first, &second}) {
        const Bytes block = Lz4Compress(*part);
        pk.pack_bin(static_cast<std::uint32_t>(block.size()));
        pk.pack_bin_body(reinterpret_cast<const char*>(block.data()), static_cast<std::uint32_t>(block.size()));
    }
    const Bytes table = ToBytes(buf);

    EXPECT_EQ(aktk::masterdata::DecompressTable(table.data(), table.size()), raw);
    EXPECT_EQ(aktk::masterdata::TableToJson(table.data(), table.size()), kItemJson);
}

TEST_F(MasterDataTablesTest, TimestampsAndExtensions) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(2);
    const char seconds[] = {0x65, 0x0D, static_cast<char>(0x93), 0x09};  // 1695388425
    pk.pack_ext(4, -1);
    pk.pack_ext_body(seconds, 4);
    const char payload[] = {0x01, 0x02, 0x03};
    pk.pack_ext(3, 7);
    pk.pack_ext_body(payload, 3);
    const Bytes table = ToBytes(buf);

    EXPECT_EQ(aktk::masterdata::TableToJson(table.data(), table.size()),
              R"(["2023-09-22T13:13:45.0000000Z",[7,"AQID"]])");
}

TEST_F(MasterDataTablesTest, TableOutsideArchiveIsRejected) {
    Bytes archive = BuildArchive({{"ItemMaster", ItemTable()}});
    archive.pop_back();
    EXPECT_THROW(aktk::masterdata::ExtractTables(archive, root_ / "out"), std::runtime_error);
}

TEST_F(MasterDataTablesTest, UnsafeTableNameIsRejected) {
    const Bytes archive = BuildArchive({{"../ItemMaster", ItemTable()}});
    EXPECT_THROW(aktk::masterdata::ExtractTables(archive, root_ / "out"), std::runtime_error);
    EXPECT_FALSE(fs::exists(root_ / "ItemMaster.json"));
}

TEST_F(MasterDataTablesTest, MalformedHeaderIsRejected) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(&buf);
    pk.pack_array(1);
    pk.pack(1);
    EXPECT_THROW(aktk::masterdata::ReadTableIndex(ToBytes(buf)), std::runtime_error);
    EXPECT_THROW(aktk::masterdata::ReadTableIndex(Bytes{0x81}), std::runtime_error);
}
