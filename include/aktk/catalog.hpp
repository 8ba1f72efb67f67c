#pragma once

#include "aktk/bundle.hpp"
#include "aktk/transport.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aktk::catalog {

enum class Platform {
    Android,
    iOS,
};

const char* PlatformName(Platform platform) noexcept;
std::optional<Platform> ParsePlatform(std::string_view name);

struct Catalog {
    std::vector<BundleDescriptor> bundles;
    std::string main_asset_label;
    std::string unique_build_id;
    int version = 0;
    std::vector<std::string> main_asset_bundles;
};

struct VersionSet {
    std::string asset_version;
    std::string master_data_version;
};

// Throws std::runtime_error naming the offending field.
Catalog ParseCatalog(const std::string& text);
Catalog LoadCatalogFile(const std::filesystem::path& path);

// Fetches catalog.json through a transport rooted at the asset base URL and
// keeps a copy of the raw text in output_root.
Catalog FetchCatalog(transport::Transport& transport, const std::filesystem::path& output_root);

// <asset_base>/<version>/<platform>/
std::string AssetBaseUrl(const std::string& asset_base, const std::string& version, Platform platform);

// Absent or mistyped fields come back as empty strings.
VersionSet ParseVersionSet(const std::string& text);
VersionSet FetchLatestVersions(transport::Transport& transport);

}  // namespace aktk::catalog
