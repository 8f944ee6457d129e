#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <dendra/cell_description.hpp>
#include <dendra/mechcat.hpp>
#include <dendra/network.hpp>
#include <dendra/simulation.hpp>
#include <dendra/stimulus.hpp>

#include <dendraio/jsonio.hpp>

#include "json_helpers.hpp"

namespace dendraio {

using dendra::fvm_index_type;

jsonio_error::jsonio_error(const std::string& msg):
    dendra_exception(msg)
{}

jsonio_unused_input::jsonio_unused_input(const std::string& key):
    jsonio_error("Unused input parameter: \"" + key + "\"")
{}

jsonio_missing_field::jsonio_missing_field(const std::string& field):
    jsonio_error("Missing \"" + field + "\" field.")
{}

jsonio_version_error::jsonio_version_error(const unsigned ver):
    jsonio_error("Unsupported version: \"" + std::to_string(ver) + "\".")
{}

jsonio_type_error::jsonio_type_error(const std::string& type):
    jsonio_error("Unsupported type: \"" + type + "\".")
{}

namespace {

nlohmann::json wrap(const char* type, nlohmann::json data) {
    return nlohmann::json{{"version", DENDRAIO_JSONIO_VERSION}, {"type", type}, {"data", std::move(data)}};
}

nlohmann::json unwrap(const nlohmann::json& doc, const std::string& type) {
    if (!doc.is_object()) {
        throw jsonio_error("Expected a JSON object.");
    }
    if (!doc.count("version")) {
        throw jsonio_missing_field("version");
    }
    if (auto version = doc.at("version").get<unsigned>(); version!=DENDRAIO_JSONIO_VERSION) {
        throw jsonio_version_error(version);
    }
    if (!doc.count("type")) {
        throw jsonio_missing_field("type");
    }
    if (!doc.count("data")) {
        throw jsonio_missing_field("data");
    }
    if (auto t = doc.at("type").get<std::string>(); t!=type) {
        throw jsonio_type_error(t);
    }
    return doc.at("data");
}

void optional_column(std::vector<double>& column, const char* name, nlohmann::json& j) {
    if (auto v = find_and_remove_json<std::vector<double>>(name, j)) {
        column = std::move(*v);
    }
}

dendra::cell_description cell_from_json(nlohmann::json j, const dendra::mechanism_catalogue& catalogue) {
    dendra::cell_description cell;
    cell.nseg = require_and_remove_json<unsigned>("nseg", j);
    cell.parents = require_and_remove_json<std::vector<fvm_index_type>>("parents", j);

    optional_column(cell.radius, "radius", j);
    optional_column(cell.length, "length", j);
    optional_column(cell.axial_resistivity, "axial-resistivity", j);
    optional_column(cell.capacitance, "capacitance", j);

    if (auto v = find_and_remove_json<double>("init-membrane-potential", j)) {
        cell.init_voltage = *v;
    }

    if (auto channels = find_and_remove_json<std::vector<nlohmann::json>>("channels", j)) {
        for (auto& c: *channels) {
            auto name = require_and_remove_json<std::string>("mechanism", c);
            auto branches = find_and_remove_json<std::vector<fvm_index_type>>("branches", c);
            auto parameters = find_and_remove_json<std::unordered_map<std::string, double>>("parameters", c);
            throw_if_not_empty(c);

            cell.insert(catalogue.channel(name),
                        branches.value_or(std::vector<fvm_index_type>{}),
                        parameters.value_or(std::unordered_map<std::string, double>{}));
        }
    }

    throw_if_not_empty(j);
    return cell;
}

dendra::i_clamp i_clamp_from_json(nlohmann::json j) {
    dendra::i_clamp clamp;
    for (const auto& [t, amplitude]: require_and_remove_json<std::vector<std::pair<double, double>>>("envelope", j)) {
        clamp.envelope.push_back({t, amplitude});
    }
    throw_if_not_empty(j);
    return clamp;
}

} // anonymous namespace

// Conversion failures inside nlohmann (wrong value types) are reported as
// jsonio_error.

dendra::cell_description load_cell_description(const nlohmann::json& doc, const dendra::mechanism_catalogue& catalogue) {
    try {
        return cell_from_json(unwrap(doc, "cell-description"), catalogue);
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_error(e.what());
    }
}

dendra::i_clamp load_i_clamp(const nlohmann::json& doc) {
    try {
        return i_clamp_from_json(unwrap(doc, "current-clamp"));
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_error(e.what());
    }
}

nlohmann::json write_json(const dendra::cell_description& cell) {
    nlohmann::json data;
    data["nseg"] = cell.nseg;
    data["parents"] = cell.parents;
    if (!cell.radius.empty()) data["radius"] = cell.radius;
    if (!cell.length.empty()) data["length"] = cell.length;
    if (!cell.axial_resistivity.empty()) data["axial-resistivity"] = cell.axial_resistivity;
    if (!cell.capacitance.empty()) data["capacitance"] = cell.capacitance;
    data["init-membrane-potential"] = cell.init_voltage;

    for (const auto& p: cell.channels) {
        nlohmann::json c;
        c["mechanism"] = p.mech->name();
        if (!p.branches.empty()) c["branches"] = p.branches;
        if (!p.parameters.empty()) c["parameters"] = p.parameters;
        data["channels"].push_back(std::move(c));
    }
    return wrap("cell-description", std::move(data));
}

nlohmann::json write_json(const dendra::i_clamp& clamp) {
    nlohmann::json envelope = nlohmann::json::array();
    for (const auto& p: clamp.envelope) {
        envelope.push_back({p.t, p.amplitude});
    }
    return wrap("current-clamp", {{"envelope", std::move(envelope)}});
}

nlohmann::json write_json(const dendra::network& net) {
    nlohmann::json data;

    const auto& nodes = net.nodes();
    data["nodes"] = {
        {"comp_index", nodes.comp_index},
        {"branch_index", nodes.branch_index},
        {"cell_index", nodes.cell_index}
    };

    const auto& branch_edges = net.branch_edges();
    data["branch_edges"] = {
        {"parent_branch_index", branch_edges.parent_branch_index},
        {"child_branch_index", branch_edges.child_branch_index}
    };

    const auto& syn_edges = net.syn_edges();
    data["syn_edges"] = {
        {"pre_comp_index", syn_edges.pre_comp_index},
        {"post_comp_index", syn_edges.post_comp_index},
        {"type", syn_edges.type},
        {"group", syn_edges.group}
    };

    data["params"] = nlohmann::json::object();
    for (const auto& name: net.param_names()) {
        data["params"][name] = net.param(name);
    }
    data["states"] = nlohmann::json::object();
    for (const auto& name: net.state_names()) {
        data["states"][name] = net.state(name);
    }

    return wrap("network", std::move(data));
}

nlohmann::json write_json(const std::vector<dendra::trace>& traces) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& tr: traces) {
        data.push_back({
            {"compartment", tr.comp},
            {"time", tr.time},
            {"voltage", tr.voltage}
        });
    }
    return wrap("traces", std::move(data));
}

} // namespace dendraio
