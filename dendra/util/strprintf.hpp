#pragma once

// printf-like routines that return std::string.

#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace dendra {
namespace util {

// Format with '{}' placeholders.
template <typename... Args>
std::string pprintf(const char* fmt, Args&&... args) {
    return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
}

} // namespace util
} // namespace dendra
