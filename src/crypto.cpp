#include "aktk/crypto.hpp"

#include "aktk/crypto_utils.hpp"

#include <openssl/evp.h>

#include <climits>
#include <stdexcept>
#include <string>

namespace aktk::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

Bytes Digest(const EVP_MD* md, const std::uint8_t* data, std::size_t len, const char* name) {
    detail::UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error(std::string(name) + " context allocation failed");
    }
    unsigned int out_len = 0;
    Bytes out(static_cast<std::size_t>(EVP_MD_size(md)));
    Ensure(EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1, "Digest init failed");
    if (len > 0) {
        Ensure(EVP_DigestUpdate(ctx.get(), data, len) == 1, "Digest update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "Digest final failed");
    out.resize(out_len);
    return out;
}

void CheckAesParams(const Bytes& key, const Bytes& iv) {
    if (key.size() != 16) {
        throw std::runtime_error("AES-128-CBC expects 16-byte key");
    }
    if (iv.size() != 16) {
        throw std::runtime_error("AES-128-CBC expects 16-byte IV");
    }
}

}  // namespace

Bytes Md5(const std::uint8_t* data, std::size_t len) {
    return Digest(EVP_md5(), data, len, "MD5");
}

Bytes Md5(const Bytes& data) {
    return Md5(data.data(), data.size());
}

Bytes Sha256(std::string_view text) {
    return Digest(EVP_sha256(), reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), "SHA-256");
}

Bytes Sha512(const std::uint8_t* data, std::size_t len) {
    return Digest(EVP_sha512(), data, len, "SHA-512");
}

Bytes Sha512(const Bytes& data) {
    return Sha512(data.data(), data.size());
}

Bytes Sha512(std::string_view text) {
    return Sha512(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

Bytes Aes128CbcEncrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext) {
    CheckAesParams(key, iv);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    Bytes out(plaintext.size() + 16);
    int out_len = 0;
    int total_len = 0;
    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) == 1,
           "AES-CBC init failed");
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext.data(),
                                 static_cast<int>(plaintext.size())) == 1,
               "AES-CBC encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-CBC final failed");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

Bytes Aes128CbcDecrypt(const Bytes& key, const Bytes& iv, const Bytes& blob) {
    CheckAesParams(key, iv);
    if (blob.empty() || blob.size() % 16 != 0) {
        throw std::runtime_error("AES-CBC ciphertext length must be a non-zero multiple of 16");
    }
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    Bytes out(blob.size() + 16);
    int out_len = 0;
    int total_len = 0;
    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) == 1,
           "AES-CBC init failed");
    Ensure(EVP_DecryptUpdate(ctx.get(), out.data(), &out_len, blob.data(), static_cast<int>(blob.size())) == 1,
           "AES-CBC decrypt failed");
    total_len += out_len;
    Ensure(EVP_DecryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1,
           "AES-CBC padding check failed");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

std::string Base64Encode(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return {};
    }
    if (len > static_cast<std::size_t>(INT_MAX / 4 * 3)) {
        throw std::runtime_error("Base64 input too large");
    }
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    Ensure(written >= 0, "Base64 encode failed");
    out.resize(static_cast<std::size_t>(written));
    return out;
}

}  // namespace aktk::crypto
