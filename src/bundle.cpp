#include "aktk/bundle.hpp"

#include "aktk/constants.hpp"

#include <filesystem>

namespace aktk {

bool UsesContainer(const BundleDescriptor& bundle) noexcept {
    return bundle.compression_mode == constants::kContainerCompression;
}

std::int64_t ExpectedPlainSize(const BundleDescriptor& bundle) noexcept {
    if (!UsesContainer(bundle)) {
        return bundle.file_size;
    }
    return bundle.file_size - static_cast<std::int64_t>(constants::kFramingSize);
}

bool IsSafeRelativePath(const std::string& relative_path) {
    if (relative_path.empty()) {
        return false;
    }
    std::filesystem::path path(relative_path);
    if (path.is_absolute() || path.has_root_name()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

}  // namespace aktk
