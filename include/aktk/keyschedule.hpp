#pragma once

#include "aktk/bundle.hpp"
#include "aktk/constants.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace aktk::cipher {

struct KeyMaterial {
    std::array<std::uint8_t, constants::kCipherKeyLen> key{};
    std::array<std::uint8_t, constants::kNonceMaterialLen> nonce_material{};
};

// "<bundle_name>-<plain_size>-<content_hash>-<crc>"
std::string BuildKeyString(std::string_view bundle_name,
                           std::int64_t plain_size,
                           std::string_view content_hash,
                           std::int64_t crc);

KeyMaterial DeriveKeyMaterial(std::string_view bundle_name,
                              std::int64_t plain_size,
                              std::string_view content_hash,
                              std::int64_t crc);

// Plain size comes from the catalog (file_size - framing), not from the fetched bytes.
KeyMaterial DeriveKeyMaterial(const BundleDescriptor& bundle);

}  // namespace aktk::cipher
