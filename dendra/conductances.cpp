#include <tuple>
#include <utility>
#include <vector>

#include <dendra/dendraexcept.hpp>

#include "conductances.hpp"
#include "topology.hpp"
#include "util/span.hpp"

namespace dendra {

fvm_value_type coupling_conductance(fvm_value_type r1, fvm_value_type r2,
                                    fvm_value_type ra1, fvm_value_type ra2,
                                    fvm_value_type l1, fvm_value_type l2)
{
    // [µm³/(µm·Ω·cm·µm³)] = [1/(Ω·cm·µm)] = 1e4 [S/cm²] = 1e7 [mS/cm²]
    return 1e7*r1*r2*r2/(l1*(ra1*l1*r2*r2 + ra2*l2*r1*r1));
}

void init_branch_conds(unsigned nseg,
                       const fvm_value_type* ra, const fvm_value_type* radius, const fvm_value_type* length,
                       fvm_value_type* fwd, fvm_value_type* bwd, fvm_value_type* summed)
{
    for (unsigned k = 0; k<nseg; ++k) summed[k] = 0;

    for (unsigned k = 0; k+1<nseg; ++k) {
        fwd[k] = coupling_conductance(radius[k+1], radius[k], ra[k+1], ra[k], length[k+1], length[k]);
        bwd[k] = coupling_conductance(radius[k], radius[k+1], ra[k], ra[k+1], length[k], length[k+1]);
        summed[k+1] += fwd[k];
        summed[k] += bwd[k];
    }
}

std::pair<fvm_value_type, fvm_value_type> init_junction_conds(
    fvm_value_type ra_parent, fvm_value_type ra_child,
    fvm_value_type r_parent, fvm_value_type r_child,
    fvm_value_type l_parent, fvm_value_type l_child)
{
    return {
        coupling_conductance(r_parent, r_child, ra_parent, ra_child, l_parent, l_child),
        coupling_conductance(r_child, r_parent, ra_child, ra_parent, l_child, l_parent)
    };
}

void update_summed_coupling_conds(std::vector<fvm_value_type>& summed,
                                  unsigned nseg,
                                  const branch_edge_table& edges,
                                  const std::vector<fvm_value_type>& branch_fwd,
                                  const std::vector<fvm_value_type>& branch_bwd)
{
    // Scatter-add: a parent with several children accumulates every one.
    for (auto e: util::make_span(edges.size())) {
        auto child = edges.child_branch_index[e];
        auto parent = edges.parent_branch_index[e];
        summed[parent*nseg + nseg-1] += branch_fwd[child];
        summed[child*nseg] += branch_bwd[child];
    }
}

cable_conductances compute_cable_conductances(unsigned nseg,
                                              const std::vector<fvm_index_type>& parents,
                                              const fvm_value_type* radius,
                                              const fvm_value_type* length,
                                              const fvm_value_type* ra)
{
    if (nseg==0) {
        throw dendra_internal_error("compute_cable_conductances: nseg must be positive");
    }

    const auto nbranch = parents.size();
    cable_conductances g;
    g.coupling_fwd.assign(nbranch*(nseg-1), 0.);
    g.coupling_bwd.assign(nbranch*(nseg-1), 0.);
    g.summed.assign(nbranch*nseg, 0.);
    g.branch_fwd.assign(nbranch, 0.);
    g.branch_bwd.assign(nbranch, 0.);

    for (auto b: util::make_span(nbranch)) {
        auto c = b*nseg;
        auto e = b*(nseg-1);
        init_branch_conds(nseg, ra+c, radius+c, length+c,
                          g.coupling_fwd.data()+e, g.coupling_bwd.data()+e, g.summed.data()+c);
    }

    auto edges = make_branch_edges(parents);
    for (auto e: util::make_span(edges.size())) {
        auto child = edges.child_branch_index[e];
        auto last = edges.parent_branch_index[e]*nseg + nseg-1;
        auto first = child*nseg;
        std::tie(g.branch_fwd[child], g.branch_bwd[child]) =
            init_junction_conds(ra[last], ra[first], radius[last], radius[first], length[last], length[first]);
    }
    update_summed_coupling_conds(g.summed, nseg, edges, g.branch_fwd, g.branch_bwd);

    return g;
}

} // namespace dendra
