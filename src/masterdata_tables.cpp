#include "aktk/masterdata_tables.hpp"

#include "aktk/bundle.hpp"
#include "aktk/crypto.hpp"
#include "aktk/file_stream.hpp"
#include "aktk/log.hpp"

#include <lz4.h>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <climits>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace aktk::masterdata {

namespace {

using Json = nlohmann::ordered_json;

constexpr std::int8_t kLz4BlockArrayExt = 98;
constexpr std::int8_t kLz4BlockExt = 99;
constexpr std::int8_t kTimestampExt = -1;

msgpack::object_handle Unpack(const std::uint8_t* data, std::size_t len, std::size_t& offset, const char* what) {
    try {
        return msgpack::unpack(reinterpret_cast<const char*>(data), len, offset);
    } catch (const msgpack::unpack_error& exc) {
        throw std::runtime_error(std::string("Malformed ") + what + ": " + exc.what());
    }
}

bool IsInteger(const msgpack::object& obj) {
    return obj.type == msgpack::type::POSITIVE_INTEGER || obj.type == msgpack::type::NEGATIVE_INTEGER;
}

std::int64_t ToInt64(const msgpack::object& obj, const char* what) {
    if (obj.type == msgpack::type::POSITIVE_INTEGER) {
        if (obj.via.u64 > static_cast<std::uint64_t>(INT64_MAX)) {
            throw std::runtime_error(std::string(what) + " out of range");
        }
        return static_cast<std::int64_t>(obj.via.u64);
    }
    if (obj.type == msgpack::type::NEGATIVE_INTEGER) {
        return obj.via.i64;
    }
    throw std::runtime_error(std::string(what) + " is not an integer");
}

std::uint64_t LoadBE(const char* data, std::size_t width) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value = (value << 8) | static_cast<std::uint8_t>(data[i]);
    }
    return value;
}

// Round-trip ISO 8601 in UTC with 100ns precision, e.g. 2023-09-22T12:00:00.0000000Z.
std::string FormatTimestamp(const msgpack::object_ext& ext) {
    std::int64_t seconds = 0;
    std::uint32_t nanos = 0;
    if (ext.size == 4) {
        seconds = static_cast<std::int64_t>(LoadBE(ext.data(), 4));
    } else if (ext.size == 8) {
        std::uint64_t packed = LoadBE(ext.data(), 8);
        nanos = static_cast<std::uint32_t>(packed >> 34);
        seconds = static_cast<std::int64_t>(packed & 0x3FFFFFFFFULL);
    } else if (ext.size == 12) {
        nanos = static_cast<std::uint32_t>(LoadBE(ext.data(), 4));
        seconds = static_cast<std::int64_t>(LoadBE(ext.data() + 4, 8));
    } else {
        throw std::runtime_error("Invalid timestamp length " + std::to_string(ext.size));
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) {
        throw std::runtime_error("Timestamp out of range");
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%07uZ", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<unsigned>(nanos / 100));
    return buf;
}

Json ToJson(const msgpack::object& obj);

std::string KeyString(const msgpack::object& key) {
    if (key.type == msgpack::type::STR) {
        return std::string(key.via.str.ptr, key.via.str.size);
    }
    const Json converted = ToJson(key);
    if (converted.is_string()) {
        return converted.get<std::string>();
    }
    return converted.dump();
}

Json ToJson(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return nullptr;
        case msgpack::type::BOOLEAN:
            return obj.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return obj.via.u64;
        case msgpack::type::NEGATIVE_INTEGER:
            return obj.via.i64;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return obj.via.f64;
        case msgpack::type::STR:
            return std::string(obj.via.str.ptr, obj.via.str.size);
        case msgpack::type::BIN:
            return crypto::Base64Encode(reinterpret_cast<const std::uint8_t*>(obj.via.bin.ptr), obj.via.bin.size);
        case msgpack::type::ARRAY: {
            Json out = Json::array();
            for (std::uint32_t i = 0; i < obj.via.array.size; ++i) {
                out.push_back(ToJson(obj.via.array.ptr[i]));
            }
            return out;
        }
        case msgpack::type::MAP: {
            Json out = Json::object();
            for (std::uint32_t i = 0; i < obj.via.map.size; ++i) {
                const msgpack::object_kv& kv = obj.via.map.ptr[i];
                out[KeyString(kv.key)] = ToJson(kv.val);
            }
            return out;
        }
        case msgpack::type::EXT: {
            if (obj.via.ext.type() == kTimestampExt) {
                return FormatTimestamp(obj.via.ext);
            }
            Json out = Json::array();
            out.push_back(static_cast<int>(obj.via.ext.type()));
            out.push_back(crypto::Base64Encode(reinterpret_cast<const std::uint8_t*>(obj.via.ext.data()),
                                               obj.via.ext.size));
            return out;
        }
        default:
            throw std::runtime_error("Unsupported MessagePack type " + std::to_string(static_cast<int>(obj.type)));
    }
}

void Lz4DecodeInto(const char* src, std::size_t src_len, std::int64_t expected, Bytes& out) {
    if (expected < 0 || expected > INT_MAX || src_len > static_cast<std::size_t>(INT_MAX)) {
        throw std::runtime_error("Invalid LZ4 block length " + std::to_string(expected));
    }
    const std::size_t start = out.size();
    out.resize(start + static_cast<std::size_t>(expected));
    if (expected == 0) {
        return;
    }
    int decoded = LZ4_decompress_safe(src, reinterpret_cast<char*>(out.data() + start), static_cast<int>(src_len),
                                      static_cast<int>(expected));
    if (decoded != static_cast<int>(expected)) {
        throw std::runtime_error("LZ4 block decoded to " + std::to_string(decoded) + " bytes, expected "
                                 + std::to_string(expected));
    }
}

// ext 99: msgpack int (uncompressed length) followed by one raw LZ4 block.
Bytes DecodeLz4Block(const msgpack::object_ext& ext) {
    const auto* body = reinterpret_cast<const std::uint8_t*>(ext.data());
    std::size_t offset = 0;
    msgpack::object_handle length = Unpack(body, ext.size, offset, "Lz4Block length");
    Bytes out;
    Lz4DecodeInto(ext.data() + offset, ext.size - offset, ToInt64(length.get(), "Lz4Block length"), out);
    return out;
}

// [ext 98 (msgpack ints: uncompressed length of each block), bin block, bin block, ...]
Bytes DecodeLz4BlockArray(const msgpack::object& array) {
    const msgpack::object_ext& header = array.via.array.ptr[0].via.ext;
    const auto* body = reinterpret_cast<const std::uint8_t*>(header.data());
    std::vector<std::int64_t> lengths;
    std::size_t offset = 0;
    while (offset < header.size) {
        msgpack::object_handle length = Unpack(body, header.size, offset, "Lz4BlockArray header");
        lengths.push_back(ToInt64(length.get(), "Lz4BlockArray length"));
    }
    if (lengths.size() + 1 != array.via.array.size) {
        throw std::runtime_error("Lz4BlockArray lists " + std::to_string(lengths.size()) + " blocks but carries "
                                 + std::to_string(array.via.array.size - 1));
    }
    Bytes out;
    for (std::size_t i = 0; i < lengths.size(); ++i) {
        const msgpack::object& block = array.via.array.ptr[i + 1];
        if (block.type != msgpack::type::BIN) {
            throw std::runtime_error("Lz4BlockArray block " + std::to_string(i) + " is not binary");
        }
        Lz4DecodeInto(block.via.bin.ptr, block.via.bin.size, lengths[i], out);
    }
    return out;
}

}  // namespace

TableIndex ReadTableIndex(const Bytes& archive) {
    TableIndex index;
    msgpack::object_handle handle = Unpack(archive.data(), archive.size(), index.data_offset, "master data header");
    const msgpack::object& header = handle.get();
    if (header.type != msgpack::type::MAP) {
        throw std::runtime_error("Master data header is not a map");
    }
    for (std::uint32_t i = 0; i < header.via.map.size; ++i) {
        const msgpack::object_kv& kv = header.via.map.ptr[i];
        if (kv.key.type != msgpack::type::STR) {
            throw std::runtime_error("Master data header key " + std::to_string(i) + " is not a string");
        }
        TableEntry entry;
        entry.name.assign(kv.key.via.str.ptr, kv.key.via.str.size);
        if (kv.val.type != msgpack::type::ARRAY || kv.val.via.array.size != 2 || !IsInteger(kv.val.via.array.ptr[0])
            || !IsInteger(kv.val.via.array.ptr[1])) {
            throw std::runtime_error("Master data header entry " + entry.name + " is not [offset, size]");
        }
        entry.offset = ToInt64(kv.val.via.array.ptr[0], "table offset");
        entry.size = ToInt64(kv.val.via.array.ptr[1], "table size");
        index.tables.push_back(std::move(entry));
    }
    return index;
}

Bytes DecompressTable(const std::uint8_t* data, std::size_t len) {
    std::size_t offset = 0;
    msgpack::object_handle handle = Unpack(data, len, offset, "table");
    const msgpack::object& obj = handle.get();
    if (obj.type == msgpack::type::EXT && obj.via.ext.type() == kLz4BlockExt) {
        return DecodeLz4Block(obj.via.ext);
    }
    if (obj.type == msgpack::type::ARRAY && obj.via.array.size > 0
        && obj.via.array.ptr[0].type == msgpack::type::EXT && obj.via.array.ptr[0].via.ext.type() == kLz4BlockArrayExt) {
        return DecodeLz4BlockArray(obj);
    }
    return Bytes(data, data + len);
}

std::string TableToJson(const std::uint8_t* data, std::size_t len) {
    const Bytes raw = DecompressTable(data, len);
    std::size_t offset = 0;
    msgpack::object_handle handle = Unpack(raw.data(), raw.size(), offset, "table");
    return ToJson(handle.get()).dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::size_t ExtractTables(const Bytes& archive, const std::filesystem::path& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + output_dir.string() + ": " + ec.message());
    }

    const TableIndex index = ReadTableIndex(archive);
    const std::size_t available = archive.size() - index.data_offset;
    std::size_t written = 0;
    for (const auto& table : index.tables) {
        const std::string file_name = table.name + ".json";
        if (!IsSafeRelativePath(file_name) || std::filesystem::path(file_name).has_parent_path()) {
            throw std::runtime_error("Refusing to write table with unsafe name: " + table.name);
        }
        if (table.offset < 0 || table.size < 0 || static_cast<std::uint64_t>(table.offset) > available
            || static_cast<std::uint64_t>(table.size) > available - static_cast<std::size_t>(table.offset)) {
            throw std::runtime_error("Table " + table.name + " lies outside the archive");
        }

        std::ostringstream line;
        line << "dumping " << table.name << " @ 0x" << std::hex << std::setw(8) << std::setfill('0') << table.offset
             << " (0x" << std::setw(8) << table.size << ")";
        log::Info(line.str());

        const std::uint8_t* begin = archive.data() + index.data_offset + static_cast<std::size_t>(table.offset);
        const std::string json = TableToJson(begin, static_cast<std::size_t>(table.size));
        filestream::WriteFile(output_dir / file_name, Bytes(json.begin(), json.end()));
        ++written;
    }
    return written;
}

}  // namespace aktk::masterdata
