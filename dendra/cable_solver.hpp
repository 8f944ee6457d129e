#pragma once

#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/dendraexcept.hpp>

#include "conductances.hpp"
#include "util/span.hpp"

namespace dendra {

// Backward Euler step of the cable equation on a forest of compartments,
// solved exactly by Gaussian elimination along the tree (Hines).
//
// The matrix is not symmetric: each coupling conductance is normalized by the
// area of the compartment it acts on. For compartment i with parent p:
//
//   row i:  -u_up[i]   in column p
//   row p:  -u_down[i] in column i
//
// u_up and u_down hold the negated conductances.

struct cable_solver {
    using value_type = fvm_value_type;
    using index_type = fvm_index_type;
    using array      = std::vector<value_type>;
    using const_view = const array&;
    using iarray     = std::vector<index_type>;

    iarray parent_index;  // per compartment, no_parent for the roots of cells
    iarray order;         // every compartment after its parent

    array d;              // [mS/cm²]
    array u_up;           // [mS/cm²]
    array u_down;         // [mS/cm²]
    array invariant_d;    // [mS/cm²] invariant part of matrix diagonal

    cable_solver() = default;

    // branch_parents: parent branch of each branch
    // levels: branches grouped so that each branch is in a later level than its parent
    cable_solver(unsigned nseg,
                 const iarray& branch_parents,
                 const std::vector<iarray>& levels,
                 const cable_conductances& g):
        parent_index(branch_parents.size()*nseg, no_parent),
        d(branch_parents.size()*nseg, 0),
        u_up(size(), 0),
        u_down(size(), 0),
        invariant_d(g.summed)
    {
        if (invariant_d.size()!=size()) {
            throw dendra_internal_error("cable_solver: conductance and compartment counts differ");
        }

        for (const auto& level: levels) {
            for (auto b: level) {
                for (auto k: util::make_span(nseg)) {
                    const index_type i = b*nseg + k;
                    order.push_back(i);
                    if (k>0) {
                        parent_index[i] = i-1;
                        u_up[i] = -g.coupling_fwd[b*(nseg-1) + k-1];
                        u_down[i] = -g.coupling_bwd[b*(nseg-1) + k-1];
                    }
                    else if (branch_parents[b]!=no_parent) {
                        parent_index[i] = branch_parents[b]*nseg + nseg-1;
                        u_up[i] = -g.branch_bwd[b];
                        u_down[i] = -g.branch_fwd[b];
                    }
                }
            }
        }

        if (order.size()!=size()) {
            throw dendra_internal_error("cable_solver: levels do not cover every branch exactly once");
        }
    }

    std::size_t size() const { return parent_index.size(); }

    // Setup and solve the cable equation
    // * expects the voltage from its first argument
    // * will likewise overwrite the first argument with the solution
    //   dt           [ms]
    //   capacitance  [µF/cm²]
    //   coef         [mS/cm²]  membrane current = coef·V + constant
    //   constant     [µA/cm²]
    void solve(array& rhs, value_type dt, const_view capacitance, const_view coef, const_view constant) {
        const value_type oodt = 1./dt;  // [1/ms]
        for (auto i: util::make_span(size())) {
            const auto gi = oodt*capacitance[i];   // [mS/cm²]
            d[i] = gi + invariant_d[i] + coef[i];
            rhs[i] = gi*rhs[i] - constant[i];       // [µA/cm²]
        }
        solve(rhs);
    }

    // Solve with the diagonal already assembled.
    // Afterwards rhs will contain the solution.
    void solve(array& rhs) {
        value_type* const r_ = rhs.data();
        value_type* const d_ = d.data();
        const index_type* const p_ = parent_index.data();

        // backward sweep: leaves to roots
        for (auto k = order.size(); k-->0;) {
            const auto i = order[k];
            const auto pi = p_[i];
            if (pi!=no_parent) {
                const auto factor = u_down[i]/d_[i];
                d_[pi] -= factor*u_up[i];
                r_[pi] -= factor*r_[i];
            }
        }
        // forward sweep: roots to leaves
        for (auto i: order) {
            const auto pi = p_[i];
            if (pi!=no_parent) {
                r_[i] -= u_up[i]*r_[pi];
            }
            r_[i] /= d_[i];
        }
    }
};

} // namespace dendra
