#pragma once

#include "aktk/bundle.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace aktk {

struct LocalDecryptStats {
    std::size_t decoded = 0;
    std::size_t failed = 0;
    std::size_t missing = 0;
};

// Decodes every bundle found under bundle_dir in place. Bundles without a
// file are counted as missing; decode or write failures are logged and
// counted, never thrown.
LocalDecryptStats DecryptLocalBundles(const std::vector<BundleDescriptor>& bundles,
                                      const std::filesystem::path& bundle_dir);

}  // namespace aktk
