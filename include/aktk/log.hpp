#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace aktk::log {

// Line writers shared by every worker thread; lines never interleave.
void Info(const std::string& line);
void Warn(const std::string& line);
void Error(const std::string& line);

void SetQuiet(bool quiet);
bool IsQuiet();

// Redraws "label: done/total (pct%)" on stderr from a background thread
// until destroyed. The counter is only read.
class ProgressLine {
public:
    ProgressLine(std::string label,
                 const std::atomic<std::uint64_t>& counter,
                 std::uint64_t total,
                 std::chrono::milliseconds interval = std::chrono::milliseconds(100));
    ~ProgressLine();

    ProgressLine(const ProgressLine&) = delete;
    ProgressLine& operator=(const ProgressLine&) = delete;

    void Stop();

private:
    void Draw(std::uint64_t done);

    std::string label_;
    const std::atomic<std::uint64_t>& counter_;
    std::uint64_t total_ = 0;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

}  // namespace aktk::log
