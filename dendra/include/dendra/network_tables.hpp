#pragma once

#include <string>
#include <vector>

#include <dendra/common_types.hpp>

namespace dendra {

// Global compartment index and the global branch and cell that own it.
struct node_table {
    std::vector<fvm_index_type> comp_index;
    std::vector<fvm_index_type> branch_index;
    std::vector<fvm_index_type> cell_index;

    std::size_t size() const { return comp_index.size(); }
};

// One row per non-root branch.
struct branch_edge_table {
    std::vector<fvm_index_type> parent_branch_index;
    std::vector<fvm_index_type> child_branch_index;

    std::size_t size() const { return child_branch_index.size(); }
};

// One row per synapse edge, in connectivity group order.
struct synapse_edge_table {
    std::vector<fvm_index_type> pre_comp_index;
    std::vector<fvm_index_type> post_comp_index;
    std::vector<std::string> type;
    std::vector<fvm_size_type> group;

    std::size_t size() const { return pre_comp_index.size(); }
};

} // namespace dendra
