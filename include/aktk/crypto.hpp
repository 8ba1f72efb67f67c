#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aktk::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes Md5(const std::uint8_t* data, std::size_t len);
Bytes Md5(const Bytes& data);
Bytes Sha256(std::string_view text);
Bytes Sha512(const std::uint8_t* data, std::size_t len);
Bytes Sha512(const Bytes& data);
Bytes Sha512(std::string_view text);

// AES-128-CBC with PKCS#7 padding.
Bytes Aes128CbcEncrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext);
Bytes Aes128CbcDecrypt(const Bytes& key, const Bytes& iv, const Bytes& blob);

// Standard base64 with padding, no line breaks.
std::string Base64Encode(const std::uint8_t* data, std::size_t len);

}  // namespace aktk::crypto
