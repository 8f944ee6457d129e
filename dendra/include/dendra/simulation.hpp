#pragma once

#include <memory>
#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/network.hpp>

namespace dendra {

// Voltage samples of one recorded compartment, one per time point.
struct trace {
    fvm_index_type comp;
    std::vector<time_type> time;        // [ms]
    std::vector<fvm_value_type> voltage; // [mV]
};

class simulation_state;

// Advances the voltages and mechanism states of a fully initialized network
// by backward Euler steps of the cable equation.
//
// Per step:
//   1. synapses: advance gating states and linearize the synaptic currents,
//      using the states from the start of the step;
//   2. channels: advance gating states, then linearize the channel currents
//      around the current voltage with the new states;
//   3. stimuli: add the clamp currents at the start of the step;
//   4. solve the implicit voltage update along the compartment tree.
//
// All phases read the voltages from the start of the step. A step that
// produces a non-finite voltage or state throws numerical_error and leaves
// the network at the last good step.
//
// The network must outlive the simulation, and its topology, conductances and
// table layouts must not change while the simulation exists.
class simulation {
public:
    explicit simulation(network& net);
    ~simulation();

    simulation(simulation&&);
    simulation& operator=(simulation&&);

    // Advance by dt [ms] and return the new time.
    time_type step(time_type dt);

    // Step to t_final [ms] with steps of at most dt; the last step may be
    // shorter. Returns the new time.
    time_type run(time_type t_final, time_type dt);

    time_type time() const;

    // Samples at every completed step, including time 0, for the
    // compartments recorded on the network at construction.
    const std::vector<trace>& traces() const;

    // Currents of the last step per compartment [µA/cm²], outward positive,
    // evaluated at the voltage from the start of the step.
    const std::vector<fvm_value_type>& synaptic_current() const;
    const std::vector<fvm_value_type>& membrane_current() const;

private:
    std::unique_ptr<simulation_state> impl_;
};

} // namespace dendra
