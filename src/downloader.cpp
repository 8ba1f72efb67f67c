#include "aktk/downloader.hpp"

#include "aktk/cli_colors.hpp"
#include "aktk/container.hpp"
#include "aktk/errors.hpp"
#include "aktk/file_stream.hpp"
#include "aktk/log.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace aktk::download {

namespace {

namespace fs = std::filesystem;

// Runs fn(i) for i in [0, count) on up to `workers` threads; each thread
// claims the next index until the range is exhausted or stop becomes true.
// Returns how many indices were claimed.
template <typename Fn>
std::size_t ParallelFor(std::size_t count, std::size_t workers, const std::atomic<bool>& stop, Fn&& fn) {
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        while (!stop.load()) {
            std::size_t idx = next.fetch_add(1);
            if (idx >= count) {
                break;
            }
            fn(idx);
        }
    };

    workers = std::min(workers, count);
    if (workers <= 1) {
        worker();
        return std::min(next.load(), count);
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
    } catch (...) {
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    return std::min(next.load(), count);
}

}  // namespace

Downloader::Downloader(std::vector<BundleDescriptor> bundles,
                       transport::Transport& transport,
                       DownloadOptions options)
    : bundles_(std::move(bundles)), transport_(transport), options_(std::move(options)) {
    if (options_.concurrency == 0) {
        options_.concurrency = 1;
    }
}

fs::path Downloader::TargetPath(const BundleDescriptor& bundle) const {
    if (!IsSafeRelativePath(bundle.relative_path)) {
        throw BundleError(ErrorKind::PersistenceFailure,
                          "Refusing to write outside the output directory: " + bundle.relative_path);
    }
    return options_.output_root / fs::path(bundle.relative_path);
}

void Downloader::PrepareDirectories() const {
    std::error_code ec;
    fs::create_directories(options_.output_root, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + options_.output_root.string() + ": "
                                 + ec.message());
    }

    std::set<fs::path> parents;
    for (const auto& bundle : bundles_) {
        if (bundle.relative_path.find('/') == std::string::npos || !IsSafeRelativePath(bundle.relative_path)) {
            continue;
        }
        parents.insert(fs::path(bundle.relative_path).parent_path());
    }
    for (const auto& parent : parents) {
        fs::create_directories(options_.output_root / parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + (options_.output_root / parent).string() + ": "
                                     + ec.message());
        }
    }
}

std::vector<std::size_t> Downloader::ExistingTargets() const {
    std::vector<std::size_t> existing;
    std::error_code ec;
    for (std::size_t i = 0; i < bundles_.size(); ++i) {
        if (!IsSafeRelativePath(bundles_[i].relative_path)) {
            continue;
        }
        if (fs::exists(options_.output_root / bundles_[i].relative_path, ec)) {
            existing.push_back(i);
        }
    }
    return existing;
}

bool Downloader::NeedsDownload(const BundleDescriptor& bundle) const {
    if (!IsSafeRelativePath(bundle.relative_path)) {
        return true;
    }
    std::error_code ec;
    const fs::path path = options_.output_root / bundle.relative_path;
    if (!fs::is_regular_file(path, ec)) {
        return true;
    }
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return true;
    }
    // Size only; file_md5 is not consulted.
    return static_cast<std::int64_t>(size) != ExpectedPlainSize(bundle);
}

std::vector<BundleDescriptor> Downloader::VerifyExisting(const std::vector<std::size_t>& existing,
                                                        std::vector<BundleDescriptor>* skipped) {
    finished_ = 0;
    std::vector<std::uint8_t> needs(bundles_.size(), 1);
    ParallelFor(existing.size(), options_.concurrency, cancelled_, [&](std::size_t idx) {
        const std::size_t bundle_idx = existing[idx];
        needs[bundle_idx] = NeedsDownload(bundles_[bundle_idx]) ? 1 : 0;
        finished_.fetch_add(1);
    });

    std::vector<BundleDescriptor> pending;
    for (std::size_t i = 0; i < bundles_.size(); ++i) {
        if (needs[i]) {
            pending.push_back(bundles_[i]);
        } else if (skipped) {
            skipped->push_back(bundles_[i]);
        }
    }
    return pending;
}

void Downloader::RecordFailure(const BundleDescriptor& bundle) {
    std::lock_guard<std::mutex> lock(failed_mutex_);
    failed_.push_back(bundle);
}

bool Downloader::DownloadOne(const BundleDescriptor& bundle) {
    try {
        const fs::path path = TargetPath(bundle);
        container::Bytes plain = container::DecodeBundle(transport_.Fetch(bundle.relative_path), bundle);
        try {
            filestream::WriteFile(path, plain);
        } catch (const std::exception& exc) {
            throw BundleError(ErrorKind::PersistenceFailure, exc.what());
        }
        finished_.fetch_add(1);
        return true;
    } catch (const BundleError& err) {
        const std::string line = "Failed to download bundle " + bundle.relative_path
                                 + ". This download will be retried later. Reason (" + ErrorKindName(err.kind())
                                 + "): " + err.what();
        if (err.kind() == ErrorKind::ProtocolCorruption) {
            log::Error(line);
        } else {
            log::Warn(line);
        }
    } catch (const std::exception& exc) {
        log::Error("Failed to download bundle " + bundle.relative_path + " (" +
                   ErrorKindName(ErrorKind::ProtocolCorruption) + "): " + exc.what());
    }
    RecordFailure(bundle);
    finished_.fetch_add(1);
    return false;
}

std::vector<BundleDescriptor> Downloader::RunPass(const std::vector<BundleDescriptor>& bundles,
                                                  std::size_t concurrency,
                                                  PassStats* stats) {
    finished_ = 0;
    {
        std::lock_guard<std::mutex> lock(failed_mutex_);
        failed_.clear();
    }
    concurrency = std::max<std::size_t>(1, concurrency);

    std::unique_ptr<log::ProgressLine> progress;
    if (options_.show_progress) {
        progress = std::make_unique<log::ProgressLine>("Downloading assets", finished_, bundles.size());
    }
    std::size_t claimed = ParallelFor(bundles.size(), concurrency, cancelled_,
                                      [&](std::size_t idx) { DownloadOne(bundles[idx]); });
    if (progress) {
        progress->Stop();
    }

    std::vector<BundleDescriptor> remaining;
    {
        std::lock_guard<std::mutex> lock(failed_mutex_);
        remaining = failed_;
    }
    if (stats) {
        stats->attempted = claimed;
        stats->failed = remaining.size();
        stats->concurrency = std::min(concurrency, std::max<std::size_t>(1, bundles.size()));
    }
    remaining.insert(remaining.end(), bundles.begin() + static_cast<std::ptrdiff_t>(claimed), bundles.end());
    return remaining;
}

void Downloader::BackoffBeforeRetry() {
    auto deadline = std::chrono::steady_clock::now() + options_.retry_backoff;
    while (!cancelled_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

DownloadReport Downloader::Download() {
    DownloadReport report;
    PrepareDirectories();

    std::vector<BundleDescriptor> pending = bundles_;
    const std::vector<std::size_t> existing = ExistingTargets();
    if (!existing.empty()) {
        log::Info("Checking already downloaded assets. This might take a long time.");
        std::unique_ptr<log::ProgressLine> progress;
        if (options_.show_progress) {
            progress = std::make_unique<log::ProgressLine>("Verifying downloaded assets", finished_,
                                                            existing.size());
        }
        pending = VerifyExisting(existing, &report.skipped);
        report.verified = existing.size();
        if (progress) {
            progress->Stop();
        }
        log::Info(std::to_string(report.skipped.size()) + " assets are already up to date.");
    }

    std::size_t concurrency = options_.concurrency;
    while (!pending.empty() && !cancelled_.load()) {
        if (options_.max_passes != constants::kUnboundedPasses && report.passes.size() >= options_.max_passes) {
            log::Warn("Giving up after " + std::to_string(report.passes.size()) + " passes; "
                      + std::to_string(pending.size()) + " bundles still failing.");
            break;
        }
        if (!report.passes.empty() && options_.retry_backoff.count() > 0) {
            BackoffBeforeRetry();
            if (cancelled_.load()) {
                break;
            }
        }

        log::Info("Starting asset download (" + std::to_string(pending.size()) + " bundles, "
                  + std::to_string(concurrency) + " concurrent).");
        PassStats stats;
        pending = RunPass(pending, concurrency, &stats);
        report.passes.push_back(stats);

        if (!pending.empty() && !cancelled_.load()) {
            log::Warn("Some bundles failed to download. Retrying them.");
            concurrency = 1;
        }
    }

    report.remaining = std::move(pending);
    report.cancelled = cancelled_.load();
    if (report.cancelled) {
        log::Warn("Download cancelled; " + std::to_string(report.remaining.size()) + " bundles not downloaded.");
    } else if (report.remaining.empty()) {
        log::Info("Downloaded all bundles " + cli::BoldGreen("successfully."));
    }
    return report;
}

void Downloader::Cancel() noexcept {
    cancelled_ = true;
    transport_.Cancel();
}

}  // namespace aktk::download
