#pragma once

// Axial coupling conductances of the compartment tree.
//
// All conductances are in [mS/cm²]: the axial conductance between the
// centres of two neighbouring compartments, divided by the membrane area of
// the compartment it acts on.

#include <utility>
#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/network_tables.hpp>

namespace dendra {

// Conductance between neighbouring compartments 1 and 2, per membrane area
// of compartment 1. Radii and lengths in [µm], resistivities in [Ω·cm].
fvm_value_type coupling_conductance(fvm_value_type r1, fvm_value_type r2,
                                    fvm_value_type ra1, fvm_value_type ra2,
                                    fvm_value_type l1, fvm_value_type l2);

struct cable_conductances {
    using array = std::vector<fvm_value_type>;

    // Within branches, flattened as branch*(nseg-1) + k for the pair of
    // segments (k, k+1):
    //   fwd acts on segment k+1, bwd acts on segment k.
    array coupling_fwd;
    array coupling_bwd;

    // Across branch points, indexed by child branch, zero for roots:
    //   fwd acts on the last compartment of the parent branch,
    //   bwd acts on the first compartment of the child branch.
    array branch_fwd;
    array branch_bwd;

    // Per compartment, the sum of every coupling conductance acting on it.
    array summed;
};

// Intra-branch conductances of one branch of nseg compartments. Writes nseg-1
// values to fwd and bwd and nseg values to summed.
void init_branch_conds(unsigned nseg,
                       const fvm_value_type* ra, const fvm_value_type* radius, const fvm_value_type* length,
                       fvm_value_type* fwd, fvm_value_type* bwd, fvm_value_type* summed);

// Conductances across one branch point, from the parent's last compartment
// to the child's first. Returns {fwd, bwd}.
std::pair<fvm_value_type, fvm_value_type> init_junction_conds(
    fvm_value_type ra_parent, fvm_value_type ra_child,
    fvm_value_type r_parent, fvm_value_type r_child,
    fvm_value_type l_parent, fvm_value_type l_child);

// Add the branch point conductances to the summed conductances of the
// compartments they act on.
void update_summed_coupling_conds(std::vector<fvm_value_type>& summed,
                                  unsigned nseg,
                                  const branch_edge_table& edges,
                                  const std::vector<fvm_value_type>& branch_fwd,
                                  const std::vector<fvm_value_type>& branch_bwd);

// All coupling conductances of a compartment tree. Geometry columns are per
// compartment, branch-major.
cable_conductances compute_cable_conductances(unsigned nseg,
                                              const std::vector<fvm_index_type>& parents,
                                              const fvm_value_type* radius,
                                              const fvm_value_type* length,
                                              const fvm_value_type* ra);

} // namespace dendra
