#pragma once

#include <cstdint>
#include <string>

namespace aktk {

struct BundleDescriptor {
    std::string relative_path;
    std::string bundle_name;
    std::string content_hash;
    std::int64_t crc = 0;
    std::int64_t file_size = 0;
    std::string file_md5;
    int compression_mode = 0;
    std::string user_data;
};

bool UsesContainer(const BundleDescriptor& bundle) noexcept;

// Size of the decoded file on disk: file_size minus framing for container bundles.
std::int64_t ExpectedPlainSize(const BundleDescriptor& bundle) noexcept;

// False for empty, absolute or rooted paths and for any ".." component.
bool IsSafeRelativePath(const std::string& relative_path);

}  // namespace aktk
