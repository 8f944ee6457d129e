#pragma once

/* Classes for representing a mechanism schema: the ordered parameter
 * and state fields a channel or synapse declares.
 */

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <dendra/common_types.hpp>

namespace dendra {

struct mechanism_field_spec {
    std::string name;
    std::string units;

    double default_value = 0;
    double lower_bound = std::numeric_limits<double>::lowest();
    double upper_bound = std::numeric_limits<double>::max();

    bool valid(double x) const { return x>=lower_bound && x<=upper_bound; }
};

struct mechanism_info {
    // Parameter fields may vary across the instances of a mechanism, but are
    // constant in time.
    std::vector<mechanism_field_spec> parameters;

    // State fields vary in time and across instances.
    std::vector<mechanism_field_spec> state;

    std::optional<std::size_t> parameter_index(const std::string& name) const;
    std::optional<std::size_t> state_index(const std::string& name) const;
};

} // namespace dendra
