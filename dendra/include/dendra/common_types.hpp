#pragma once

/*
 * Common definitions for index and value types used across the
 * dendra library.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace dendra {

// Floating point type for voltages, states, parameters and conductances.

using fvm_value_type = double;

// Signed index type; the value -1 is reserved as the 'no parent' sentinel
// in parent arrays.

using fvm_index_type = std::int32_t;

// For sizes of compartment, branch and edge collections.

using fvm_size_type = std::make_unsigned_t<fvm_index_type>;

// For identifying cells within a network.

using cell_gid_type = std::uint32_t;

// For storing time values [ms]

using time_type = double;

constexpr fvm_index_type no_parent = -1;

} // namespace dendra
