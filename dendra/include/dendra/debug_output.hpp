#pragma once

#include <iosfwd>

namespace dendra {

// Destination of the library's diagnostic lines, such as the sizes of a
// network as it is set up. A null stream disables them; this is the default
// unless dendra is configured with DENDRA_WITH_DEBUG_OUTPUT, which starts with
// std::cerr. The stream is not owned and must outlive its use.
void set_debug_stream(std::ostream* out);
std::ostream* debug_stream();

} // namespace dendra
