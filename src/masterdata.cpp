#include "aktk/masterdata.hpp"

#include "aktk/constants.hpp"
#include "aktk/crypto.hpp"

#include <stdexcept>
#include <utility>

namespace aktk::masterdata {

namespace {

std::pair<Bytes, Bytes> DeriveKeyIv(const std::string& version) {
    std::string seed(constants::kMasterDataSalt);
    seed += version;
    const Bytes digest = crypto::Sha256(seed);
    if (digest.size() != 32) {
        throw std::runtime_error("Unexpected SHA-256 digest length");
    }
    Bytes key(digest.begin(), digest.begin() + 16);
    Bytes iv(digest.begin() + 16, digest.end());
    return {std::move(key), std::move(iv)};
}

}  // namespace

Bytes DecryptMasterData(const Bytes& blob, const std::string& version) {
    auto [key, iv] = DeriveKeyIv(version);
    return crypto::Aes128CbcDecrypt(key, iv, blob);
}

Bytes EncryptMasterData(const Bytes& plain, const std::string& version) {
    auto [key, iv] = DeriveKeyIv(version);
    return crypto::Aes128CbcEncrypt(key, iv, plain);
}

std::string MasterDataUrl(const std::string& base_url, const std::string& version) {
    if (version.empty()) {
        throw std::runtime_error("Master data version is empty");
    }
    std::string url = base_url;
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    return url + version;
}

}  // namespace aktk::masterdata
