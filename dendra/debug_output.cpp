#include <iostream>
#include <mutex>
#include <ostream>

#include <dendra/debug_output.hpp>

#include "io/debug.hpp"

namespace dendra {

namespace {

std::mutex debug_mutex;

#ifdef DENDRA_HAVE_DEBUG_OUTPUT
std::ostream* debug_out = &std::cerr;
#else
std::ostream* debug_out = nullptr;
#endif

} // anonymous namespace

void set_debug_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    debug_out = out;
}

std::ostream* debug_stream() {
    std::lock_guard<std::mutex> lock(debug_mutex);
    return debug_out;
}

namespace io {

debug_line::debug_line():
    active_(debug_stream()!=nullptr)
{}

debug_line::~debug_line() {
    if (!active_) return;

    std::lock_guard<std::mutex> lock(debug_mutex);
    if (debug_out) {
        *debug_out << "dendra: " << buf_.str() << std::endl;
    }
}

} // namespace io
} // namespace dendra
