#include "aktk/log.hpp"

#include "aktk/cli_colors.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

namespace aktk::log {

namespace {

std::mutex g_console_mutex;
std::atomic<bool> g_quiet{false};

void WriteLine(std::ostream& os, const std::string& prefix, const std::string& line) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    os << prefix << ' ' << line << '\n';
    os.flush();
}

}  // namespace

void Info(const std::string& line) {
    if (g_quiet.load()) {
        return;
    }
    WriteLine(std::cout, aktk::cli::BoldWhite("INFO:"), line);
}

void Warn(const std::string& line) {
    WriteLine(std::cout, aktk::cli::BoldYellow("WARN:"), line);
}

void Error(const std::string& line) {
    WriteLine(std::cerr, aktk::cli::BoldRed("ERR:"), line);
}

void SetQuiet(bool quiet) {
    g_quiet = quiet;
}

bool IsQuiet() {
    return g_quiet.load();
}

ProgressLine::ProgressLine(std::string label,
                           const std::atomic<std::uint64_t>& counter,
                           std::uint64_t total,
                           std::chrono::milliseconds interval)
    : label_(std::move(label)), counter_(counter), total_(total), interval_(interval) {
    thread_ = std::thread([this]() {
        std::uint64_t last = 0;
        Draw(last);
        while (running_.load()) {
            std::this_thread::sleep_for(interval_);
            std::uint64_t current = counter_.load();
            if (current != last) {
                Draw(current);
                last = current;
            }
        }
    });
}

ProgressLine::~ProgressLine() {
    Stop();
}

void ProgressLine::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    Draw(counter_.load());
    if (g_quiet.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << '\n';
}

void ProgressLine::Draw(std::uint64_t done) {
    if (g_quiet.load()) {
        return;
    }
    std::uint64_t shown = std::min(done, total_);
    std::uint64_t pct = total_ == 0 ? 100 : (shown * 100) / total_;
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << '\r' << label_ << ": " << shown << '/' << total_ << " (" << pct << "%)";
    std::cerr.flush();
}

}  // namespace aktk::log
