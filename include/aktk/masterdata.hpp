#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace aktk::masterdata {

using Bytes = std::vector<std::uint8_t>;

// AES-128-CBC with key and IV taken from SHA-256(salt + version).
Bytes DecryptMasterData(const Bytes& blob, const std::string& version);
Bytes EncryptMasterData(const Bytes& plain, const std::string& version);

std::string MasterDataUrl(const std::string& base_url, const std::string& version);

}  // namespace aktk::masterdata
