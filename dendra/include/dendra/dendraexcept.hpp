#pragma once

#include <stdexcept>
#include <string>

#include <dendra/common_types.hpp>

// dendra-specific exception hierarchy.

namespace dendra {

// Internal logic error (if these are thrown,
// there is a bug in the library.)

struct dendra_internal_error: std::logic_error {
    dendra_internal_error(const std::string&);
};

// Common base-class for dendra run-time errors.

struct dendra_exception: std::runtime_error {
    dendra_exception(const std::string&);
};

// Model construction errors:

struct inconsistent_nseg: dendra_exception {
    inconsistent_nseg(cell_gid_type gid, unsigned nseg, unsigned expected);
    cell_gid_type gid;
    unsigned nseg;
    unsigned expected;
};

struct bad_geometry: dendra_exception {
    bad_geometry(const std::string& field, fvm_size_type comp, double value);
    std::string field;
    fvm_size_type comp;
    double value;
};

struct bad_parent_index: dendra_exception {
    bad_parent_index(cell_gid_type gid, fvm_index_type branch, fvm_index_type parent);
    cell_gid_type gid;
    fvm_index_type branch;
    fvm_index_type parent;
};

struct bad_topology: dendra_exception {
    bad_topology(cell_gid_type gid, const std::string& msg);
    cell_gid_type gid;
};

struct bad_connection: dendra_exception {
    bad_connection(std::size_t group, std::size_t index, const std::string& msg);
    std::size_t group;
    std::size_t index;
};

// Parameter and state table errors:

struct table_size_mismatch: dendra_exception {
    table_size_mismatch(const std::string& field, std::size_t size, std::size_t expected);
    std::string field;
    std::size_t size;
    std::size_t expected;
};

struct no_such_parameter: dendra_exception {
    no_such_parameter(const std::string& mech_name, const std::string& param_name);
    std::string mech_name;
    std::string param_name;
};

struct no_such_state: dendra_exception {
    no_such_state(const std::string& mech_name, const std::string& state_name);
    std::string mech_name;
    std::string state_name;
};

struct invalid_parameter_value: dendra_exception {
    invalid_parameter_value(const std::string& mech_name, const std::string& param_name, double value);
    std::string mech_name;
    std::string param_name;
    double value;
};

// Mechanism catalogue errors:

struct no_such_mechanism: dendra_exception {
    explicit no_such_mechanism(const std::string& mech_name);
    std::string mech_name;
};

struct duplicate_mechanism: dendra_exception {
    explicit duplicate_mechanism(const std::string& mech_name);
    std::string mech_name;
};

// Network set up and simulation errors:

struct init_order_error: dendra_exception {
    init_order_error(const std::string& phase, const std::string& requires_phase);
    std::string phase;
    std::string requires_phase;
};

struct immutable_topology: dendra_exception {
    explicit immutable_topology(const std::string& field);
    std::string field;
};

struct bad_time_step: dendra_exception {
    explicit bad_time_step(time_type dt);
    time_type dt;
};

struct numerical_error: dendra_exception {
    numerical_error(const std::string& what, fvm_size_type index, time_type t);
    fvm_size_type index;
    time_type t;
};

} // namespace dendra
