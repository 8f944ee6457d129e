#include <cstdlib>
#include <iostream>

#include <dendra/assert.hpp>

namespace dendra {

void abort_on_failed_assertion(const char* assertion, const char* file, int line, const char* func) {
    // abort() does not flush std::cerr.
    std::cerr << "dendra: " << file << ':' << line << " " << func
              << ": assertion '" << assertion << "' failed" << std::endl;
    std::abort();
}

} // namespace dendra
