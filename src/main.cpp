#include "aktk/catalog.hpp"
#include "aktk/cli_colors.hpp"
#include "aktk/constants.hpp"
#include "aktk/container.hpp"
#include "aktk/downloader.hpp"
#include "aktk/file_stream.hpp"
#include "aktk/local_bundles.hpp"
#include "aktk/log.hpp"
#include "aktk/masterdata.hpp"
#include "aktk/masterdata_tables.hpp"
#include "aktk/transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::atomic<aktk::download::Downloader*> g_active_downloader{nullptr};

void HandleInterrupt(int) {
    if (auto* downloader = g_active_downloader.load()) {
        downloader->Cancel();
    }
}

class InterruptScope {
public:
    explicit InterruptScope(aktk::download::Downloader& downloader) {
        g_active_downloader = &downloader;
        previous_ = std::signal(SIGINT, HandleInterrupt);
    }
    ~InterruptScope() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
        g_active_downloader = nullptr;
    }

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    void (*previous_)(int) = SIG_DFL;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  aktk download-bundles [version] [-p|--platform Android|iOS] [-o|--output <dir>] [-c|--concurrent <n>] [--max-passes <n>] [--retry-backoff <ms>]\n";
    std::cout << "  aktk decrypt-bundles <catalog> <bundle dir>\n";
    std::cout << "  aktk download-masterdata [version] [-o|--output <file>]\n";
    std::cout << "  aktk decrypt-masterdata <file> <version>\n";
    std::cout << "  aktk extract-masterdata <file> [-o|--output <dir>]\n";
    std::cout << "  aktk inspect <bundle file>\n";
    std::cout << "Global flags: --no-color, -q|--quiet\n";
}

std::size_t ParseCount(const std::string& value, const std::string& flag, bool allow_zero) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (!value.empty() && value.front() != '-') {
            parsed = std::stoull(value, &consumed, 10);
        }
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || (!allow_zero && parsed == 0)) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    return static_cast<std::size_t>(parsed);
}

struct BundleDownloadArgs {
    std::string version;
    aktk::catalog::Platform platform = aktk::catalog::Platform::Android;
    std::string output = "output";
    std::size_t concurrent = aktk::constants::DefaultConcurrency();
    std::size_t max_passes = aktk::constants::DefaultMaxPasses();
    std::size_t retry_backoff_ms = 0;
};

struct MasterDataDownloadArgs {
    std::string version;
    std::string output = "downloaded.masterdata";
};

BundleDownloadArgs ParseBundleDownloadArgs(const std::vector<std::string>& args) {
    BundleDownloadArgs opts;
    std::size_t idx = 0;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        auto value = [&]() -> const std::string& {
            if (idx + 1 >= args.size()) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return args[idx + 1];
        };
        if (flag == "-p" || flag == "--platform") {
            auto platform = aktk::catalog::ParsePlatform(value());
            if (!platform) {
                throw std::runtime_error("Unknown platform: " + value());
            }
            opts.platform = *platform;
            idx += 2;
        } else if (flag == "-o" || flag == "--output") {
            opts.output = value();
            idx += 2;
        } else if (flag == "-c" || flag == "--concurrent") {
            opts.concurrent = ParseCount(value(), flag, false);
            idx += 2;
        } else if (flag == "--max-passes") {
            opts.max_passes = ParseCount(value(), flag, true);
            idx += 2;
        } else if (flag == "--retry-backoff") {
            opts.retry_backoff_ms = ParseCount(value(), flag, true);
            idx += 2;
        } else if (!flag.empty() && flag.front() == '-') {
            throw std::runtime_error("Unknown flag: " + flag);
        } else if (opts.version.empty()) {
            opts.version = flag;
            idx += 1;
        } else {
            throw std::runtime_error("Unexpected argument: " + flag);
        }
    }
    return opts;
}

MasterDataDownloadArgs ParseMasterDataDownloadArgs(const std::vector<std::string>& args) {
    MasterDataDownloadArgs opts;
    std::size_t idx = 0;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-o" || flag == "--output") {
            if (idx + 1 >= args.size()) {
                throw std::runtime_error("Missing output path");
            }
            opts.output = args[idx + 1];
            idx += 2;
        } else if (!flag.empty() && flag.front() == '-') {
            throw std::runtime_error("Unknown flag: " + flag);
        } else if (opts.version.empty()) {
            opts.version = flag;
            idx += 1;
        } else {
            throw std::runtime_error("Unexpected argument: " + flag);
        }
    }
    return opts;
}

aktk::catalog::VersionSet LatestVersions() {
    aktk::transport::CurlOptions curl_opts;
    curl_opts.timeout_seconds = aktk::constants::HttpTimeoutSeconds();
    aktk::transport::CurlTransport api(aktk::constants::VersionApiUrl(), curl_opts);
    return aktk::catalog::FetchLatestVersions(api);
}

int RunDownloadBundles(const std::vector<std::string>& args) {
    BundleDownloadArgs opts = ParseBundleDownloadArgs(args);
    if (opts.version.empty()) {
        aktk::log::Info("Asset version not specified, obtaining latest version from server.");
        opts.version = LatestVersions().asset_version;
        if (opts.version.empty()) {
            aktk::log::Error("Failed to retrieve latest asset version.");
            return 1;
        }
        aktk::log::Info("Obtained latest asset version " + aktk::cli::BoldGreen("successfully."));
    }

    const std::filesystem::path output = std::filesystem::absolute(opts.output);
    std::filesystem::create_directories(output);

    aktk::transport::CurlOptions curl_opts;
    curl_opts.timeout_seconds = aktk::constants::HttpTimeoutSeconds();
    aktk::transport::CurlTransport transport(
        aktk::catalog::AssetBaseUrl(aktk::constants::AssetBaseUrl(), opts.version, opts.platform), curl_opts);

    aktk::log::Info("Downloading catalog for version " + opts.version + ".");
    aktk::catalog::Catalog catalog = aktk::catalog::FetchCatalog(transport, output);
    aktk::log::Info("Downloaded catalog " + aktk::cli::BoldGreen("successfully."));
    aktk::log::Info("Total asset count: " + std::to_string(catalog.bundles.size()));
    aktk::log::Info("Downloading assets. (Concurrent count: " + std::to_string(opts.concurrent) + ")");

    aktk::download::DownloadOptions dl_opts;
    dl_opts.output_root = output;
    dl_opts.concurrency = opts.concurrent;
    dl_opts.max_passes = opts.max_passes;
    dl_opts.retry_backoff = std::chrono::milliseconds(opts.retry_backoff_ms);
    dl_opts.show_progress = !aktk::log::IsQuiet();

    aktk::download::Downloader downloader(std::move(catalog.bundles), transport, dl_opts);
    aktk::download::DownloadReport report;
    {
        InterruptScope interrupt(downloader);
        report = downloader.Download();
    }
    if (!report.Complete()) {
        aktk::log::Error(std::to_string(report.remaining.size()) + " bundles were not downloaded.");
        return 1;
    }
    return 0;
}

int RunDecryptBundles(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        PrintUsage();
        return 2;
    }
    const std::filesystem::path catalog_path(args[0]);
    const std::filesystem::path bundle_dir(args[1]);
    if (!std::filesystem::is_regular_file(catalog_path)) {
        throw std::runtime_error("Catalog file not found: " + catalog_path.string());
    }
    if (!std::filesystem::is_directory(bundle_dir)) {
        throw std::runtime_error("Bundles directory not found: " + bundle_dir.string());
    }
    const aktk::catalog::Catalog catalog = aktk::catalog::LoadCatalogFile(catalog_path);
    const aktk::LocalDecryptStats stats = aktk::DecryptLocalBundles(catalog.bundles, bundle_dir);
    aktk::log::Info("Decrypted " + std::to_string(stats.decoded) + " bundles, " + std::to_string(stats.failed)
                    + " failed, " + std::to_string(stats.missing) + " not present.");
    return stats.failed == 0 ? 0 : 1;
}

int RunDownloadMasterData(const std::vector<std::string>& args) {
    MasterDataDownloadArgs opts = ParseMasterDataDownloadArgs(args);
    if (std::filesystem::is_directory(opts.output)) {
        throw std::runtime_error("Output path is a directory: " + opts.output);
    }
    if (opts.version.empty()) {
        aktk::log::Info("Master data version not specified, obtaining latest version from server.");
        opts.version = LatestVersions().master_data_version;
        if (opts.version.empty()) {
            aktk::log::Error("Failed to retrieve latest master data version.");
            return 1;
        }
        aktk::log::Info("Obtained latest master data version " + aktk::cli::BoldGreen("successfully."));
    }

    aktk::log::Info("Downloading master data for version " + opts.version + ".");
    aktk::transport::CurlOptions curl_opts;
    curl_opts.timeout_seconds = aktk::constants::HttpTimeoutSeconds();
    aktk::transport::CurlTransport transport(
        aktk::masterdata::MasterDataUrl(aktk::constants::MasterDataBaseUrl(), opts.version), curl_opts);
    const aktk::transport::Bytes encrypted = transport.Fetch("");
    aktk::log::Info("Downloaded master data " + aktk::cli::BoldGreen("successfully."));

    aktk::filestream::WriteFile(opts.output, aktk::masterdata::DecryptMasterData(encrypted, opts.version));
    aktk::log::Info("Wrote decrypted master data to " + opts.output);
    return 0;
}

int RunDecryptMasterData(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        PrintUsage();
        return 2;
    }
    const std::filesystem::path path(args[0]);
    if (!std::filesystem::is_regular_file(path)) {
        throw std::runtime_error("Master data file not found: " + path.string());
    }
    const auto encrypted = aktk::filestream::ReadFile(path);
    aktk::filestream::WriteFile(path, aktk::masterdata::DecryptMasterData(encrypted, args[1]));
    aktk::log::Info("Decrypted master data.");
    return 0;
}

int RunExtractMasterData(const std::vector<std::string>& args) {
    std::string input;
    std::string output = "masterdata_output";
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-o" || arg == "--output") {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Missing value for " + arg);
            }
            output = args[++i];
        } else if (input.empty()) {
            input = arg;
        } else {
            PrintUsage();
            return 2;
        }
    }
    if (input.empty()) {
        PrintUsage();
        return 2;
    }
    if (!std::filesystem::is_regular_file(input)) {
        throw std::runtime_error("The provided master data does not exist: " + input);
    }
    if (std::filesystem::is_regular_file(output)) {
        throw std::runtime_error("Output path is an existing file: " + output);
    }
    const std::size_t count = aktk::masterdata::ExtractTables(aktk::filestream::ReadFile(input), output);
    aktk::log::Info("Extracted " + std::to_string(count) + " tables to " + output + ".");
    return 0;
}

int RunInspect(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return 2;
    }
    const auto data = aktk::filestream::ReadFile(args[0]);
    if (data.size() < aktk::constants::kFramingSize) {
        throw std::runtime_error("File is shorter than the container framing (" + std::to_string(data.size())
                                 + " bytes)");
    }
    const aktk::container::InspectResult info = aktk::container::Inspect(data);
    std::cout << "magic: 0x" << std::hex << std::setw(8) << std::setfill('0') << info.header.magic << std::dec
              << std::setfill(' ') << "\n";
    std::cout << "version: " << info.header.version << "\n";
    std::cout << "reserved: " << info.header.reserved << "\n";
    std::cout << "encrypted: " << info.header.encrypted << "\n";
    std::cout << "header_valid: " << (info.header_valid ? "yes" : "no") << "\n";
    std::cout << "payload_len: " << info.payload_len << " bytes\n";
    std::cout << "hash: " << (info.hash_matches ? aktk::cli::Green("match") : aktk::cli::Red("mismatch")) << "\n";
    return info.header_valid && info.hash_matches ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--no-color") {
            aktk::cli::SetColorsEnabled(false);
        } else if (arg == "-q" || arg == "--quiet") {
            aktk::log::SetQuiet(true);
        } else {
            args.push_back(std::move(arg));
        }
    }
    if (args.empty()) {
        PrintUsage();
        return 2;
    }
    const std::string command = args.front();
    args.erase(args.begin());
    try {
        if (command == "download-bundles") {
            return RunDownloadBundles(args);
        }
        if (command == "decrypt-bundles") {
            return RunDecryptBundles(args);
        }
        if (command == "download-masterdata") {
            return RunDownloadMasterData(args);
        }
        if (command == "decrypt-masterdata") {
            return RunDecryptMasterData(args);
        }
        if (command == "extract-masterdata") {
            return RunExtractMasterData(args);
        }
        if (command == "inspect") {
            return RunInspect(args);
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}
