#pragma once

#include <string>
#include <vector>

#include <dendra/cell_description.hpp>
#include <dendra/dendraexcept.hpp>
#include <dendra/mechcat.hpp>
#include <dendra/network.hpp>
#include <dendra/simulation.hpp>
#include <dendra/stimulus.hpp>

#include <nlohmann/json.hpp>

#define DENDRAIO_JSONIO_VERSION 1

namespace dendraio {

struct jsonio_error: public dendra::dendra_exception {
    jsonio_error(const std::string& msg);
};

// Input in JSON not used
struct jsonio_unused_input: jsonio_error {
    explicit jsonio_unused_input(const std::string& key);
};

struct jsonio_missing_field: jsonio_error {
    explicit jsonio_missing_field(const std::string& field);
};

struct jsonio_version_error: jsonio_error {
    explicit jsonio_version_error(const unsigned version);
};

struct jsonio_type_error: jsonio_error {
    explicit jsonio_type_error(const std::string& type);
};

// Documents are wrapped as {"version": 1, "type": <type>, "data": <data>}.
//
// "cell-description" data:
//   {"nseg": 2, "parents": [-1, 0],
//    "radius": [...], "length": [...], "axial-resistivity": [...],
//    "capacitance": [...], "init-membrane-potential": -65,
//    "channels": [{"mechanism": "hh", "branches": [0], "parameters": {"gna": 100}}]}
// where only nseg and parents are required; channel mechanisms are looked up
// in the catalogue.
//
// "current-clamp" data:
//   {"envelope": [[t0, amplitude0], [t1, amplitude1], ...]}

dendra::cell_description load_cell_description(
    const nlohmann::json&,
    const dendra::mechanism_catalogue& = dendra::global_default_catalogue());

dendra::i_clamp load_i_clamp(const nlohmann::json&);

nlohmann::json write_json(const dendra::cell_description&);
nlohmann::json write_json(const dendra::i_clamp&);

// Export the derived tables of an initialized network: nodes, branch and
// synapse edges, and every parameter and state column by qualified name.
nlohmann::json write_json(const dendra::network&);

// Voltage traces as a list of {"compartment", "time", "voltage"} records.
nlohmann::json write_json(const std::vector<dendra::trace>&);

} // namespace dendraio
