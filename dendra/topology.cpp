#include <algorithm>
#include <string>
#include <vector>

#include <dendra/dendraexcept.hpp>

#include "topology.hpp"
#include "util/span.hpp"
#include "util/strprintf.hpp"

namespace dendra {

namespace {

void check_compartment_vector(const std::vector<double>& v, const char* name, const cell_description& cell) {
    if (!v.empty() && v.size()!=cell.num_compartments()) {
        throw table_size_mismatch(name, v.size(), cell.num_compartments());
    }
}

} // anonymous namespace

void validate_cell(const cell_description& cell, cell_gid_type gid) {
    const auto nbranch = fvm_index_type(cell.parents.size());

    if (nbranch==0) {
        throw bad_topology(gid, "cell has no branches");
    }
    if (cell.nseg==0) {
        throw bad_topology(gid, "branches must have at least one compartment");
    }

    unsigned nroot = 0;
    for (auto b: util::make_span(nbranch)) {
        auto p = cell.parents[b];
        if (p==no_parent) {
            ++nroot;
        }
        else if (p<0 || p>=nbranch || p==b) {
            throw bad_parent_index(gid, b, p);
        }
    }
    if (nroot!=1) {
        throw bad_topology(gid, util::pprintf("expected exactly one root branch, found {}", nroot));
    }

    // Every branch must reach the root within nbranch steps.
    for (auto b: util::make_span(nbranch)) {
        auto p = b;
        fvm_index_type steps = 0;
        while (p!=no_parent) {
            if (++steps>nbranch) {
                throw bad_topology(gid, util::pprintf("branch {} is part of a cycle", b));
            }
            p = cell.parents[p];
        }
    }

    check_compartment_vector(cell.radius, "radius", cell);
    check_compartment_vector(cell.length, "length", cell);
    check_compartment_vector(cell.axial_resistivity, "axial_resistivity", cell);
    check_compartment_vector(cell.capacitance, "capacitance", cell);

    for (const auto& placement: cell.channels) {
        if (!placement.mech) {
            throw bad_topology(gid, "channel placement without a mechanism");
        }
        for (auto b: placement.branches) {
            if (b<0 || b>=nbranch) {
                throw bad_topology(gid,
                    util::pprintf("channel {} placed on branch {} of a cell with {} branches",
                                  placement.mech->name(), b, nbranch));
            }
        }
    }
}

level_list branch_levels(const index_array& parents) {
    const auto n = parents.size();

    // Depth of each branch, filled in parent before child order by
    // repeated passes; a forest of n branches needs at most n passes.
    std::vector<int> depth(n, -1);
    std::size_t assigned = 0;
    int max_depth = -1;
    while (assigned<n) {
        auto previous = assigned;
        for (std::size_t b = 0; b<n; ++b) {
            if (depth[b]>=0) continue;
            auto p = parents[b];
            if (p==no_parent) {
                depth[b] = 0;
            }
            else if (depth[p]>=0) {
                depth[b] = depth[p]+1;
            }
            else {
                continue;
            }
            max_depth = std::max(max_depth, depth[b]);
            ++assigned;
        }
        if (assigned==previous) {
            throw dendra_internal_error("branch_levels: parent vector does not describe a forest");
        }
    }

    level_list levels(max_depth+1);
    for (std::size_t b = 0; b<n; ++b) {
        levels[depth[b]].push_back(fvm_index_type(b));
    }
    return levels;
}

index_array merge_parents(const std::vector<const index_array*>& parents, const index_array& offsets) {
    index_array merged;
    for (auto c: util::count_along(parents)) {
        for (auto p: *parents[c]) {
            merged.push_back(p==no_parent? no_parent: p+offsets[c]);
        }
    }
    return merged;
}

level_list merge_levels(const std::vector<level_list>& levels, const index_array& offsets) {
    level_list merged;
    for (auto c: util::count_along(levels)) {
        const auto& cell_levels = levels[c];
        if (merged.size()<cell_levels.size()) {
            merged.resize(cell_levels.size());
        }
        for (auto k: util::count_along(cell_levels)) {
            for (auto b: cell_levels[k]) {
                merged[k].push_back(b+offsets[c]);
            }
        }
    }
    return merged;
}

branch_edge_table make_branch_edges(const index_array& parents) {
    branch_edge_table edges;
    for (auto b: util::count_along(parents)) {
        if (parents[b]!=no_parent) {
            edges.parent_branch_index.push_back(parents[b]);
            edges.child_branch_index.push_back(fvm_index_type(b));
        }
    }
    return edges;
}

} // namespace dendra
