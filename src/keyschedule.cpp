#include "aktk/keyschedule.hpp"

#include "aktk/crypto.hpp"

#include <algorithm>
#include <stdexcept>

namespace aktk::cipher {

std::string BuildKeyString(std::string_view bundle_name,
                           std::int64_t plain_size,
                           std::string_view content_hash,
                           std::int64_t crc) {
    std::string out;
    out.reserve(bundle_name.size() + content_hash.size() + 48);
    out.append(bundle_name);
    out.push_back('-');
    out += std::to_string(plain_size);
    out.push_back('-');
    out.append(content_hash);
    out.push_back('-');
    out += std::to_string(crc);
    return out;
}

KeyMaterial DeriveKeyMaterial(std::string_view bundle_name,
                              std::int64_t plain_size,
                              std::string_view content_hash,
                              std::int64_t crc) {
    const std::string key_string = BuildKeyString(bundle_name, plain_size, content_hash, crc);
    const crypto::Bytes base_hash = crypto::Sha512(key_string);
    const crypto::Bytes pool = crypto::Sha512(base_hash);
    if (base_hash.size() != constants::kNonceMaterialLen || pool.size() != constants::kNonceMaterialLen) {
        throw std::runtime_error("SHA-512 returned an unexpected digest length");
    }

    KeyMaterial material;
    std::copy_n(base_hash.begin(), material.key.size(), material.key.begin());
    std::copy_n(pool.begin(), material.nonce_material.size(), material.nonce_material.begin());
    return material;
}

KeyMaterial DeriveKeyMaterial(const BundleDescriptor& bundle) {
    return DeriveKeyMaterial(bundle.bundle_name,
                             bundle.file_size - static_cast<std::int64_t>(constants::kFramingSize),
                             bundle.content_hash,
                             bundle.crc);
}

}  // namespace aktk::cipher
