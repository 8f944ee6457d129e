#include <string>

#include <dendra/dendraexcept.hpp>

#include "util/strprintf.hpp"

namespace dendra {

using dendra::util::pprintf;

dendra_exception::dendra_exception(const std::string& what):
    std::runtime_error{what}
{}

dendra_internal_error::dendra_internal_error(const std::string& what):
    std::logic_error(what)
{}

inconsistent_nseg::inconsistent_nseg(cell_gid_type gid, unsigned nseg, unsigned expected):
    dendra_exception(pprintf("Model building error on cell {}: {} compartments per branch, but the network uses {}.", gid, nseg, expected)),
    gid(gid), nseg(nseg), expected(expected)
{}

bad_geometry::bad_geometry(const std::string& field, fvm_size_type comp, double value):
    dendra_exception(pprintf("Model building error: {} of compartment {} must be positive and finite, got {}.", field, comp, value)),
    field(field), comp(comp), value(value)
{}

bad_parent_index::bad_parent_index(cell_gid_type gid, fvm_index_type branch, fvm_index_type parent):
    dendra_exception(pprintf("Model building error on cell {}: branch {} has parent {} which is not a branch of the cell.", gid, branch, parent)),
    gid(gid), branch(branch), parent(parent)
{}

bad_topology::bad_topology(cell_gid_type gid, const std::string& msg):
    dendra_exception(pprintf("Model building error on cell {}: {}.", gid, msg)),
    gid(gid)
{}

bad_connection::bad_connection(std::size_t group, std::size_t index, const std::string& msg):
    dendra_exception(pprintf("Model building error in connectivity {}, connection {}: {}.", group, index, msg)),
    group(group), index(index)
{}

table_size_mismatch::table_size_mismatch(const std::string& field, std::size_t size, std::size_t expected):
    dendra_exception(pprintf("field {} has {} values, expected {}", field, size, expected)),
    field(field), size(size), expected(expected)
{}

no_such_parameter::no_such_parameter(const std::string& mech_name, const std::string& param_name):
    dendra_exception(pprintf("mechanism {} has no parameter {}", mech_name, param_name)),
    mech_name(mech_name),
    param_name(param_name)
{}

no_such_state::no_such_state(const std::string& mech_name, const std::string& state_name):
    dendra_exception(pprintf("mechanism {} has no state variable {}", mech_name, state_name)),
    mech_name(mech_name),
    state_name(state_name)
{}

invalid_parameter_value::invalid_parameter_value(const std::string& mech_name, const std::string& param_name, double value):
    dendra_exception(pprintf("invalid parameter value for mechanism {} parameter {}: {}", mech_name, param_name, value)),
    mech_name(mech_name),
    param_name(param_name),
    value(value)
{}

no_such_mechanism::no_such_mechanism(const std::string& mech_name):
    dendra_exception(pprintf("no mechanism {} in catalogue", mech_name)),
    mech_name(mech_name)
{}

duplicate_mechanism::duplicate_mechanism(const std::string& mech_name):
    dendra_exception(pprintf("mechanism {} already exists", mech_name)),
    mech_name(mech_name)
{}

init_order_error::init_order_error(const std::string& phase, const std::string& requires_phase):
    dendra_exception(pprintf("{} requires {} to have run first", phase, requires_phase)),
    phase(phase),
    requires_phase(requires_phase)
{}

immutable_topology::immutable_topology(const std::string& field):
    dendra_exception(pprintf("{} can not be changed after conductances have been initialized", field)),
    field(field)
{}

bad_time_step::bad_time_step(time_type dt):
    dendra_exception(pprintf("time step must be positive and finite, got {}", dt)),
    dt(dt)
{}

numerical_error::numerical_error(const std::string& what, fvm_size_type index, time_type t):
    dendra_exception(pprintf("non-finite {} at index {} at time {} ms", what, index, t)),
    index(index),
    t(t)
{}

} // namespace dendra
