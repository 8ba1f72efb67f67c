#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace aktk::masterdata {

using Bytes = std::vector<std::uint8_t>;

struct TableEntry {
    std::string name;
    std::int64_t offset = 0;
    std::int64_t size = 0;
};

// The archive starts with a MessagePack map of table name to [offset, size];
// offsets are relative to data_offset, the first byte after that map.
struct TableIndex {
    std::vector<TableEntry> tables;
    std::size_t data_offset = 0;
};

TableIndex ReadTableIndex(const Bytes& archive);

// Unwraps Lz4Block (ext 99) and Lz4BlockArray (ext 98) payloads. Anything
// else is returned as is.
Bytes DecompressTable(const std::uint8_t* data, std::size_t len);

// One table as compact JSON. Map keys keep their serialized order.
std::string TableToJson(const std::uint8_t* data, std::size_t len);

// Writes <output_dir>/<name>.json for every table in the index and returns
// how many were written.
std::size_t ExtractTables(const Bytes& archive, const std::filesystem::path& output_dir);

}  // namespace aktk::masterdata
