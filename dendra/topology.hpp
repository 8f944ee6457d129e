#pragma once

// Branch-tree topology of cells and of the merged network.

#include <vector>

#include <dendra/cell_description.hpp>
#include <dendra/common_types.hpp>
#include <dendra/network_tables.hpp>

namespace dendra {

using index_array = std::vector<fvm_index_type>;
using level_list = std::vector<index_array>;

// Check the branch tree of a cell: exactly one root, parent indices in
// range, no cycles, per-compartment vectors of the right size and channel
// placements on existing branches.
// Throws bad_parent_index, bad_topology or table_size_mismatch.
void validate_cell(const cell_description& cell, cell_gid_type gid);

// Group the branches of a tree by depth: level 0 holds the root(s), level
// k+1 the children of branches in level k. Branches within a level are in
// ascending order. The parent vector must describe a forest.
level_list branch_levels(const index_array& parents);

// Concatenate per-cell parent vectors into one network-wide vector, shifting
// every non-root entry of cell c by offsets[c]. Roots stay no_parent.
index_array merge_parents(const std::vector<const index_array*>& parents, const index_array& offsets);

// Merge level k of every cell into global level k, shifting the branches
// of cell c by offsets[c].
level_list merge_levels(const std::vector<level_list>& levels, const index_array& offsets);

// One edge per non-root branch, in ascending child order.
branch_edge_table make_branch_edges(const index_array& parents);

} // namespace dendra
