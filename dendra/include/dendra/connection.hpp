#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/mechanism.hpp>

namespace dendra {

// A compartment addressed by cell, cell-local branch and segment.
struct comp_location {
    cell_gid_type cell = 0;
    fvm_index_type branch = 0;
    fvm_index_type seg = 0;

    bool operator==(const comp_location&) const = default;
};

// One declared synapse instance, before global re-indexing.
struct connection {
    comp_location pre;
    comp_location post;
};

// A group of connections sharing one synapse mechanism. Parameter values
// override the mechanism defaults for every connection of the group.
struct connectivity {
    synapse_ptr synapse_type;
    std::vector<connection> conns;
    std::unordered_map<std::string, double> parameters;
};

} // namespace dendra
