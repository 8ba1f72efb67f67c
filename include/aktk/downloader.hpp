#pragma once

#include "aktk/bundle.hpp"
#include "aktk/constants.hpp"
#include "aktk/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

namespace aktk::download {

struct DownloadOptions {
    std::filesystem::path output_root;
    std::size_t concurrency = constants::DefaultConcurrency();
    // 0 keeps retrying until every bundle succeeds.
    std::size_t max_passes = constants::DefaultMaxPasses();
    std::chrono::milliseconds retry_backoff{0};
    bool show_progress = false;
};

struct PassStats {
    std::size_t attempted = 0;
    std::size_t failed = 0;
    std::size_t concurrency = 0;
};

struct DownloadReport {
    std::vector<PassStats> passes;
    std::size_t verified = 0;
    std::vector<BundleDescriptor> skipped;
    std::vector<BundleDescriptor> remaining;
    bool cancelled = false;

    bool Complete() const noexcept { return remaining.empty() && !cancelled; }
};

// Materializes decoded bundles under output_root. Per-bundle failures are
// collected and retried with a single worker until none remain (or the
// pass cap is hit); they never abort the batch.
class Downloader {
public:
    Downloader(std::vector<BundleDescriptor> bundles,
               transport::Transport& transport,
               DownloadOptions options);

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    DownloadReport Download();

    // Creates output_root and every parent directory named by a relative path.
    void PrepareDirectories() const;

    // Indices of bundles whose target path already exists on disk.
    std::vector<std::size_t> ExistingTargets() const;

    // Size check of the files at the given indices. Bundles with no file are
    // pending without a check. Returns the bundles that still need a download,
    // in catalog order; skipped receives the ones left alone.
    std::vector<BundleDescriptor> VerifyExisting(const std::vector<std::size_t>& existing,
                                                 std::vector<BundleDescriptor>* skipped = nullptr);

    // One download pass. Returns the bundles that did not succeed.
    std::vector<BundleDescriptor> RunPass(const std::vector<BundleDescriptor>& bundles,
                                          std::size_t concurrency,
                                          PassStats* stats = nullptr);

    std::filesystem::path TargetPath(const BundleDescriptor& bundle) const;

    void Cancel() noexcept;
    bool cancelled() const noexcept { return cancelled_.load(); }

    // Completed verifications or download attempts in the current pass.
    const std::atomic<std::uint64_t>& finished_counter() const noexcept { return finished_; }

private:
    bool DownloadOne(const BundleDescriptor& bundle);
    bool NeedsDownload(const BundleDescriptor& bundle) const;
    void RecordFailure(const BundleDescriptor& bundle);
    void BackoffBeforeRetry();

    std::vector<BundleDescriptor> bundles_;
    transport::Transport& transport_;
    DownloadOptions options_;

    std::atomic<std::uint64_t> finished_{0};
    std::atomic<bool> cancelled_{false};
    std::mutex failed_mutex_;
    std::vector<BundleDescriptor> failed_;
};

}  // namespace aktk::download
