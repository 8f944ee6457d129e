#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <dendra/dendraexcept.hpp>
#include <dendra/math.hpp>
#include <dendra/network.hpp>
#include <dendra/simulation.hpp>

#include "cable_solver.hpp"
#include "conductances.hpp"
#include "io/debug.hpp"
#include "util/span.hpp"

namespace dendra {

using util::make_span;
using util::count_along;

class simulation_state {
public:
    using value_type = fvm_value_type;
    using array = std::vector<value_type>;

    // Voltage offset [mV] for the finite difference slope of channel currents.
    static constexpr value_type delta_v = 1e-3;

    explicit simulation_state(network& net);

    time_type step(time_type dt);

    network& net_;
    cable_solver solver_;
    time_type t_ = 0;

    array area_;          // [µm²]
    array capacitance_;   // [µF/cm²]
    array coef_;          // [mS/cm²]
    array constant_;      // [µA/cm²]
    array syn_current_;   // [µA/cm²]
    array mem_current_;   // [µA/cm²]
    array voltage_;       // [mV]

    // Per-group buffers for the advanced states, swapped into the network on
    // a successful step.
    std::vector<field_table> channel_next_;
    std::vector<field_table> synapse_next_;

    // Per-lane scratch.
    array v_lane_, i_lo_, i_hi_, syn_coef_, syn_const_;

    std::vector<trace> traces_;

private:
    void sample();
    void check_finite(const field_table& table, const std::string& mech, time_type t) const;
};

simulation_state::simulation_state(network& net):
    net_(net)
{
    if (!net.initialized_morph()) throw init_order_error("simulation", "init_morph");
    if (!net.initialized_conds()) throw init_order_error("simulation", "init_conds");
    if (!net.initialized_syns()) throw init_order_error("simulation", "init_syns");
    net.validate();

    cable_conductances g;
    g.coupling_fwd = net.coupling_conds_fwd();
    g.coupling_bwd = net.coupling_conds_bwd();
    g.branch_fwd = net.branch_conds_fwd();
    g.branch_bwd = net.branch_conds_bwd();
    g.summed = net.summed_coupling_conds();
    solver_ = cable_solver(net.nseg(), net.comb_parents(), net.comb_branches_in_each_level(), g);

    const auto n = net.num_compartments();
    const auto radius = net.param("radius");
    const auto length = net.param("length");
    area_.resize(n);
    for (auto i: make_span(n)) {
        area_[i] = math::area_cylinder(radius[i], length[i]);
    }
    capacitance_ = net.param("capacitance");

    coef_.assign(n, 0);
    constant_.assign(n, 0);
    syn_current_.assign(n, 0);
    mem_current_.assign(n, 0);

    for (const auto& group: net.channels()) channel_next_.push_back(group.state);
    for (const auto& group: net.synapses()) synapse_next_.push_back(group.state);

    for (auto comp: net.recordings()) {
        traces_.push_back({comp, {}, {}});
    }
    sample();
}

void simulation_state::sample() {
    const auto v = net_.comp_state()[0];
    for (auto& tr: traces_) {
        tr.time.push_back(t_);
        tr.voltage.push_back(v[tr.comp]);
    }
}

void simulation_state::check_finite(const field_table& table, const std::string& mech, time_type t) const {
    for (auto f: make_span(table.num_fields())) {
        auto col = table[f];
        for (auto i: make_span(table.width())) {
            if (!std::isfinite(col[i])) {
                throw numerical_error(mech+"_"+table.names()[f], i, t);
            }
        }
    }
}

time_type simulation_state::step(time_type dt) {
    if (!(dt>0) || !std::isfinite(dt)) {
        throw bad_time_step(dt);
    }

    const auto n = solver_.size();
    const auto v = net_.comp_state()[0];
    voltage_.assign(v, v+n);

    std::fill(coef_.begin(), coef_.end(), 0.);
    std::fill(constant_.begin(), constant_.end(), 0.);
    std::fill(syn_current_.begin(), syn_current_.end(), 0.);
    std::fill(mem_current_.begin(), mem_current_.end(), 0.);

    // Synapses: scatter the linear current of each edge into its
    // postsynaptic compartment.
    for (auto g: count_along(net_.synapses())) {
        const auto& group = net_.synapses()[g];
        const auto w = group.state.width();
        if (!w) continue;

        syn_coef_.assign(w, 0);
        syn_const_.assign(w, 0);
        group.mech->step(group.state, dt, voltage_, group.params, group.pre_index,
                         synapse_next_[g], syn_coef_, syn_const_);

        for (auto e: make_span(w)) {
            const auto post = group.post_index[e];
            coef_[post] += syn_coef_[e];
            constant_[post] += syn_const_[e];
            syn_current_[post] += syn_coef_[e]*voltage_[post] + syn_const_[e];
        }
    }

    // Channels: linearize i(V) ≈ i(V0) + (V-V0)·di/dV with the new states.
    for (auto g: count_along(net_.channels())) {
        const auto& group = net_.channels()[g];
        const auto w = group.node_index.size();
        if (!w) continue;

        v_lane_.resize(w);
        i_lo_.resize(w);
        i_hi_.resize(w);
        for (auto i: make_span(w)) {
            v_lane_[i] = voltage_[group.node_index[i]];
        }

        group.mech->update_states(group.state, dt, v_lane_, group.params, channel_next_[g]);
        group.mech->compute_current(channel_next_[g], v_lane_, group.params, i_lo_);
        for (auto& x: v_lane_) x += delta_v;
        group.mech->compute_current(channel_next_[g], v_lane_, group.params, i_hi_);

        for (auto i: make_span(w)) {
            const auto c = group.node_index[i];
            const auto slope = (i_hi_[i]-i_lo_[i])/delta_v;
            coef_[c] += slope;
            constant_[c] += i_lo_[i] - slope*voltage_[c];
            mem_current_[c] += i_lo_[i];
        }
    }

    // Stimuli: [nA]/[µm²] = 1e5 [µA/cm²], inward.
    for (const auto& stim: net_.stimuli()) {
        constant_[stim.comp] -= 1e5*stim.clamp.current(t_)/area_[stim.comp];
    }

    solver_.solve(voltage_, dt, capacitance_, coef_, constant_);

    const auto t_next = t_+dt;
    for (auto i: make_span(n)) {
        if (!std::isfinite(voltage_[i])) {
            throw numerical_error("voltage", fvm_size_type(i), t_next);
        }
    }
    for (auto g: count_along(channel_next_)) {
        check_finite(channel_next_[g], net_.channels()[g].name(), t_next);
    }
    for (auto g: count_along(synapse_next_)) {
        check_finite(synapse_next_[g], net_.synapses()[g].name(), t_next);
    }

    std::copy(voltage_.begin(), voltage_.end(), net_.comp_state()[0]);
    for (auto g: count_along(channel_next_)) {
        std::swap(net_.channels()[g].state, channel_next_[g]);
    }
    for (auto g: count_along(synapse_next_)) {
        std::swap(net_.synapses()[g].state, synapse_next_[g]);
    }

    t_ = t_next;
    sample();
    return t_;
}

simulation::simulation(network& net):
    impl_(new simulation_state(net))
{
    DEBUG << "simulation: " << net.num_compartments() << " compartments, "
          << net.recordings().size() << " recordings, " << net.stimuli().size() << " stimuli";
}

simulation::~simulation() = default;
simulation::simulation(simulation&&) = default;
simulation& simulation::operator=(simulation&&) = default;

time_type simulation::step(time_type dt) {
    return impl_->step(dt);
}

time_type simulation::run(time_type t_final, time_type dt) {
    if (!(dt>0) || !std::isfinite(dt)) {
        throw bad_time_step(dt);
    }
    // A remainder below rounding error of dt is not stepped.
    while (t_final-impl_->t_ > 1e-9*dt) {
        impl_->step(std::min(dt, t_final-impl_->t_));
    }
    return impl_->t_;
}

time_type simulation::time() const {
    return impl_->t_;
}

const std::vector<trace>& simulation::traces() const {
    return impl_->traces_;
}

const std::vector<fvm_value_type>& simulation::synaptic_current() const {
    return impl_->syn_current_;
}

const std::vector<fvm_value_type>& simulation::membrane_current() const {
    return impl_->mem_current_;
}

} // namespace dendra
