#pragma once

#include <dendra/assert_macro.hpp>

namespace dendra {

// Print the failed condition with its location to std::cerr and abort.
[[noreturn]]
void abort_on_failed_assertion(const char* assertion, const char* file, int line, const char* func);

} // namespace dendra
