#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace aktk::env {

std::string Get(std::string_view name);
std::string GetOr(std::string_view name, std::string_view fallback);
bool IsEnabled(std::string_view name, bool default_value = false);

// Positive integer from the environment; unset, zero or malformed values yield fallback.
std::uint64_t GetUnsigned(std::string_view name, std::uint64_t fallback);

}  // namespace aktk::env
