#include "aktk/catalog.hpp"

#include "aktk/constants.hpp"
#include "aktk/file_stream.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace aktk::catalog {

namespace {

using nlohmann::json;

const json& RequireField(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw std::runtime_error("Catalog " + where + " is missing field " + key);
    }
    return *it;
}

std::string RequireString(const json& object, const char* key, const std::string& where) {
    const json& value = RequireField(object, key, where);
    if (value.is_null()) {
        return {};
    }
    if (!value.is_string()) {
        throw std::runtime_error("Catalog field " + std::string(key) + " in " + where + " is not a string");
    }
    return value.get<std::string>();
}

std::int64_t RequireInteger(const json& object, const char* key, const std::string& where) {
    const json& value = RequireField(object, key, where);
    if (!value.is_number_integer()) {
        throw std::runtime_error("Catalog field " + std::string(key) + " in " + where + " is not an integer");
    }
    return value.get<std::int64_t>();
}

std::string OptionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

BundleDescriptor ParseBundle(const json& entry, std::size_t index) {
    const std::string where = "bundle #" + std::to_string(index);
    if (!entry.is_object()) {
        throw std::runtime_error("Catalog " + where + " is not an object");
    }
    BundleDescriptor bundle;
    bundle.relative_path = RequireString(entry, "_relativePath", where);
    bundle.bundle_name = RequireString(entry, "_bundleName", where);
    bundle.content_hash = RequireString(entry, "_hash", where);
    bundle.crc = RequireInteger(entry, "_crc", where);
    bundle.file_size = RequireInteger(entry, "_fileSize", where);
    bundle.file_md5 = RequireString(entry, "_fileMd5", where);
    bundle.compression_mode = static_cast<int>(RequireInteger(entry, "_compression", where));
    bundle.user_data = RequireString(entry, "_userData", where);
    return bundle;
}

}  // namespace

const char* PlatformName(Platform platform) noexcept {
    switch (platform) {
        case Platform::Android:
            return "Android";
        case Platform::iOS:
            return "iOS";
    }
    return "Android";
}

std::optional<Platform> ParsePlatform(std::string_view name) {
    if (name == "Android" || name == "android") {
        return Platform::Android;
    }
    if (name == "iOS" || name == "ios") {
        return Platform::iOS;
    }
    return std::nullopt;
}

Catalog ParseCatalog(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& exc) {
        throw std::runtime_error(std::string("Failed to parse catalog: ") + exc.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Catalog root is not an object");
    }

    const json& file_catalog = RequireField(root, "_fileCatalog", "root");
    if (!file_catalog.is_object()) {
        throw std::runtime_error("Catalog field _fileCatalog is not an object");
    }
    const json& bundles = RequireField(file_catalog, "_bundles", "_fileCatalog");
    if (!bundles.is_array()) {
        throw std::runtime_error("Catalog field _bundles is not an array");
    }

    Catalog catalog;
    catalog.bundles.reserve(bundles.size());
    for (std::size_t i = 0; i < bundles.size(); ++i) {
        catalog.bundles.push_back(ParseBundle(bundles[i], i));
    }

    catalog.main_asset_label = OptionalString(root, "_mainAssetLabel");
    catalog.unique_build_id = OptionalString(root, "_uniqueBuildId");
    auto version = root.find("_version");
    if (version != root.end() && version->is_number_integer()) {
        catalog.version = version->get<int>();
    }
    auto main_bundles = root.find("_mainAssetBundles");
    if (main_bundles != root.end() && main_bundles->is_array()) {
        for (const auto& name : *main_bundles) {
            if (name.is_string()) {
                catalog.main_asset_bundles.push_back(name.get<std::string>());
            }
        }
    }
    return catalog;
}

Catalog LoadCatalogFile(const std::filesystem::path& path) {
    const auto raw = filestream::ReadFile(path);
    return ParseCatalog(std::string(raw.begin(), raw.end()));
}

Catalog FetchCatalog(transport::Transport& transport, const std::filesystem::path& output_root) {
    const transport::Bytes raw = transport.Fetch(std::string(constants::kCatalogFileName));
    filestream::WriteFile(output_root / constants::kCatalogFileName, raw);
    return ParseCatalog(std::string(raw.begin(), raw.end()));
}

std::string AssetBaseUrl(const std::string& asset_base, const std::string& version, Platform platform) {
    if (version.empty()) {
        throw std::runtime_error("Asset version is empty");
    }
    std::string url = asset_base;
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    return url + version + "/" + PlatformName(platform) + "/";
}

VersionSet ParseVersionSet(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& exc) {
        throw std::runtime_error(std::string("Failed to parse version response: ") + exc.what());
    }
    VersionSet versions;
    if (!root.is_object()) {
        return versions;
    }
    versions.asset_version = OptionalString(root, "assetVersion");
    versions.master_data_version = OptionalString(root, "masterDataVersion");
    return versions;
}

VersionSet FetchLatestVersions(transport::Transport& transport) {
    const transport::Bytes raw = transport.Fetch("version");
    return ParseVersionSet(std::string(raw.begin(), raw.end()));
}

}  // namespace aktk::catalog
