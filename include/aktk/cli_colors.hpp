#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace aktk::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";
    constexpr const char* BOLD_WHITE = "\033[1;37m";
}

// Check if colors should be enabled for the given stream
bool ColorsEnabled(std::ostream& os = std::cout);

// Set whether colors are enabled (--no-color, AKTK_NO_COLOR)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color);

inline std::string Red(const std::string& text) { return Colorize(text, color::RED); }
inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }

inline std::string BoldRed(const std::string& text) { return Colorize(text, color::BOLD_RED); }
inline std::string BoldGreen(const std::string& text) { return Colorize(text, color::BOLD_GREEN); }
inline std::string BoldYellow(const std::string& text) { return Colorize(text, color::BOLD_YELLOW); }
inline std::string BoldWhite(const std::string& text) { return Colorize(text, color::BOLD_WHITE); }

}  // namespace aktk::cli
