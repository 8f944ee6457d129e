#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/field_table.hpp>
#include <dendra/mechinfo.hpp>

namespace dendra {

// Ion channel mechanisms.
//
// A channel holds no per-instance data: parameters and states live in
// field_tables owned by the network, laid out according to info(), with one
// lane per compartment that carries the channel. Both operations read only
// their inputs and write only their outputs, lane by lane.
//
//   voltage [mV], one value per lane
//   current [µA/cm²], outward positive

class channel {
public:
    using value_type = fvm_value_type;
    using array      = std::vector<value_type>;
    using const_view = const array&;

    virtual ~channel() = default;

    virtual std::string name() const = 0;
    virtual const mechanism_info& info() const = 0;

    // Advance the gating states in `state` by dt [ms], writing them to
    // `new_state` (same layout).
    virtual void update_states(const field_table& state,
                               value_type dt,
                               const_view voltage,
                               const field_table& params,
                               field_table& new_state) const = 0;

    // Transmembrane current at the given voltage.
    virtual void compute_current(const field_table& state,
                                 const_view voltage,
                                 const field_table& params,
                                 array& current) const = 0;
};

using channel_ptr = std::shared_ptr<const channel>;

// A channel that computes as `base` under a new name.
//
// Placements of the derived channel form their own group with their own
// parameter and state columns, addressed as `<name>_<field>`, so one channel
// type can be inserted several times with independent values. `defaults`
// overrides parameter default values of the base; an unknown parameter throws
// no_such_parameter, an out of bounds value invalid_parameter_value.
channel_ptr derive_channel(std::string name, channel_ptr base,
                           const std::vector<std::pair<std::string, double>>& defaults = {});

// Chemical synapse mechanisms.
//
// One lane per synapse edge. `voltage` is the full per-compartment voltage
// vector; `pre_index` maps each edge to its presynaptic compartment.
// The current carried by an edge into its postsynaptic compartment is
//
//     i = voltage_term·V_post + constant_term   [µA/cm²]
//
// evaluated by the caller.

class synapse {
public:
    using value_type = fvm_value_type;
    using index_type = fvm_index_type;
    using array      = std::vector<value_type>;
    using iarray     = std::vector<index_type>;
    using const_view = const array&;

    virtual ~synapse() = default;

    virtual std::string name() const = 0;
    virtual const mechanism_info& info() const = 0;

    virtual void step(const field_table& state,
                      value_type dt,
                      const_view voltage,
                      const field_table& params,
                      const iarray& pre_index,
                      field_table& new_state,
                      array& voltage_term,
                      array& constant_term) const = 0;
};

using synapse_ptr = std::shared_ptr<const synapse>;

} // namespace dendra
