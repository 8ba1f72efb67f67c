#include "aktk/cli_colors.hpp"

#include "aktk/env.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace aktk::cli {

namespace {
    std::atomic<bool> g_colors_enabled{true};
    std::once_flag g_colors_checked;
    std::atomic<bool> g_colors_forced{false};

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors() {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE) {
            return false;
        }

        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) {
            return false;
        }

        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hOut, mode) != 0;
    }
#endif

    void DetectColors(std::ostream& os) {
        if (g_colors_forced.load()) {
            return;
        }
        if (aktk::env::IsEnabled("AKTK_NO_COLOR")) {
            g_colors_enabled = false;
            return;
        }
        // Auto-detect: check if output is a TTY
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr) {
            is_tty = isatty(fileno(stderr)) != 0;
        }

        bool enabled = is_tty;
#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            enabled = EnableWindowsAnsiColors();
        }
#endif
        g_colors_enabled = enabled;
    }
}

bool ColorsEnabled(std::ostream& os) {
    std::call_once(g_colors_checked, [&os]() { DetectColors(os); });
    return g_colors_enabled.load();
}

void SetColorsEnabled(bool enabled) {
    g_colors_forced = true;
    g_colors_enabled = enabled;
}

std::string Colorize(const std::string& text, const char* color) {
    if (!ColorsEnabled()) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace aktk::cli
