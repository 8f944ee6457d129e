#pragma once

// DEBUG << ...;
//
// Emit one diagnostic line to the debug stream. The streamed values are
// formatted only when a debug stream is set.

#include <sstream>

#define DEBUG dendra::io::debug_line()

namespace dendra {
namespace io {

// Collects a line and writes it, prefixed with "dendra: ", on destruction.
// Lines from concurrent writers do not interleave.
class debug_line {
public:
    debug_line();
    ~debug_line();

    debug_line(const debug_line&) = delete;
    debug_line& operator=(const debug_line&) = delete;

    template <typename T>
    debug_line& operator<<(const T& x) {
        if (active_) buf_ << x;
        return *this;
    }

private:
    bool active_;
    std::ostringstream buf_;
};

} // namespace io
} // namespace dendra
