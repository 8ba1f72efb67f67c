#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace aktk::crypto::detail {

// RAII wrappers for OpenSSL resources
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

inline std::uint32_t LoadU32Le(const std::uint8_t* ptr) noexcept {
    return static_cast<std::uint32_t>(ptr[0])
           | (static_cast<std::uint32_t>(ptr[1]) << 8)
           | (static_cast<std::uint32_t>(ptr[2]) << 16)
           | (static_cast<std::uint32_t>(ptr[3]) << 24);
}

inline void StoreU32Le(std::uint8_t* out, std::uint32_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

inline std::uint16_t LoadU16Le(const std::uint8_t* ptr) noexcept {
    return static_cast<std::uint16_t>(ptr[0] | (ptr[1] << 8));
}

}  // namespace aktk::crypto::detail
