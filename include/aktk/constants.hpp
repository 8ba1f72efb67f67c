#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "aktk/env.hpp"

namespace aktk::constants {

// Container framing
inline constexpr std::size_t kHeaderSize = 0x0c;
inline constexpr std::size_t kHashSize = 0x10;
inline constexpr std::size_t kFramingSize = kHeaderSize + kHashSize;
inline constexpr std::uint32_t kContainerMagic = 0x6b746b41;  // "Aktk"
inline constexpr std::uint16_t kContainerVersion = 1;
inline constexpr int kContainerCompression = 3;

// Cascading cipher geometry
inline constexpr std::size_t kSubBlockSize = 0x40;
inline constexpr std::size_t kSubBlockCount = 8;
inline constexpr std::size_t kMegaBlockSize = kSubBlockSize * kSubBlockCount;
inline constexpr std::size_t kCipherKeyLen = 32;
inline constexpr std::size_t kNonceMaterialLen = 64;
inline constexpr std::size_t kNonceLen = 12;
inline constexpr std::array<int, kSubBlockCount> kRoundSchedule = {12, 8, 8, 8, 4, 4, 4, 4};

// Master data
inline constexpr std::string_view kMasterDataSalt = "wTmkW6hwnA6HXnItdXjZp/BSOdPuh2L9QzdM3bx1e54=";

// Endpoints
inline constexpr std::string_view kAssetBaseUrl = "https://asset.resleriana.jp/asset";
inline constexpr std::string_view kMasterDataBaseUrl = "https://asset.resleriana.jp/master_data";
inline constexpr std::string_view kVersionApiUrl = "https://gacha.lukefz.xyz/atelier";
inline constexpr std::string_view kCatalogFileName = "catalog.json";

// Download defaults
inline constexpr std::size_t kDefaultConcurrency = 16;
inline constexpr long kDefaultHttpTimeoutSeconds = 300;
inline constexpr long kConnectTimeoutSeconds = 30;
inline constexpr std::size_t kUnboundedPasses = 0;

inline std::size_t DefaultConcurrency() {
    return static_cast<std::size_t>(aktk::env::GetUnsigned("AKTK_CONCURRENCY", kDefaultConcurrency));
}

inline long HttpTimeoutSeconds() {
    return static_cast<long>(aktk::env::GetUnsigned("AKTK_HTTP_TIMEOUT",
                                                    static_cast<std::uint64_t>(kDefaultHttpTimeoutSeconds)));
}

inline std::size_t DefaultMaxPasses() {
    return static_cast<std::size_t>(aktk::env::GetUnsigned("AKTK_MAX_PASSES", kUnboundedPasses));
}

inline std::string AssetBaseUrl() {
    return aktk::env::GetOr("AKTK_ASSET_BASE_URL", kAssetBaseUrl);
}

inline std::string MasterDataBaseUrl() {
    return aktk::env::GetOr("AKTK_MASTERDATA_BASE_URL", kMasterDataBaseUrl);
}

inline std::string VersionApiUrl() {
    return aktk::env::GetOr("AKTK_VERSION_API_URL", kVersionApiUrl);
}

}  // namespace aktk::constants
