#include "aktk/local_bundles.hpp"

#include "aktk/cli_colors.hpp"
#include "aktk/container.hpp"
#include "aktk/errors.hpp"
#include "aktk/file_stream.hpp"
#include "aktk/log.hpp"

#include <string>
#include <system_error>

namespace aktk {

LocalDecryptStats DecryptLocalBundles(const std::vector<BundleDescriptor>& bundles,
                                      const std::filesystem::path& bundle_dir) {
    LocalDecryptStats stats;
    for (const auto& bundle : bundles) {
        if (!IsSafeRelativePath(bundle.relative_path)) {
            ++stats.failed;
            log::Error("Failed to decrypt bundle " + bundle.relative_path + " ("
                       + ErrorKindName(ErrorKind::PersistenceFailure) + "): refusing to write outside "
                       + bundle_dir.string());
            continue;
        }
        const std::filesystem::path path = bundle_dir / bundle.relative_path;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            ++stats.missing;
            continue;
        }
        try {
            container::Bytes plain = container::DecodeBundle(filestream::ReadFile(path), bundle);
            filestream::WriteFile(path, plain);
            ++stats.decoded;
            log::Info(cli::BoldGreen("Successfully") + " decrypted bundle " + cli::BoldWhite(bundle.bundle_name) + ".");
        } catch (const BundleError& err) {
            ++stats.failed;
            log::Error("Failed to decrypt bundle " + bundle.relative_path + " (" + ErrorKindName(err.kind())
                       + "): " + err.what());
        } catch (const std::exception& exc) {
            ++stats.failed;
            log::Error("Failed to decrypt bundle " + bundle.relative_path + ": " + exc.what());
        }
    }
    return stats;
}

}  // namespace aktk
