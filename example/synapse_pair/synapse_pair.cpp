/*
 * Two Hodgkin-Huxley cells coupled by a glutamate synapse.
 *
 * A current clamp drives the presynaptic cell; the distal end of its dendrite
 * excites the proximal compartment of the postsynaptic cell.
 */

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <dendra/connection.hpp>
#include <dendra/mechcat.hpp>
#include <dendra/network.hpp>
#include <dendra/simulation.hpp>
#include <dendra/stimulus.hpp>

#include <dendraio/jsonio.hpp>

#include <sup/json_params.hpp>

struct pair_params {
    pair_params() = default;

    // Optional cell description file, used for both cells.
    std::string cell_file;

    unsigned nseg = 2;
    double radius = 10.;               // [µm]
    double length = 20.;               // [µm]
    double stim_onset = 5.;            // [ms]
    double stim_duration = 40.;        // [ms]
    double stim_amplitude = 0.2;       // [nA]
    double synapse_gs = 0.5;           // [mS/cm²]
    double duration = 60.;             // [ms]
    double dt = 0.025;                 // [ms]
    std::string output = "voltages.json";
};

pair_params read_options(int argc, char** argv);

dendra::cell_description make_cell(const pair_params& params) {
    if (!params.cell_file.empty()) {
        return dendraio::load_cell_description(sup::read_json_file(params.cell_file));
    }

    const auto& cat = dendra::global_default_catalogue();
    dendra::cell_description cell(params.nseg, {dendra::no_parent});
    cell.radius.assign(cell.num_compartments(), params.radius);
    cell.length.assign(cell.num_compartments(), params.length);
    cell.init_voltage = -65.;
    cell.insert(cat.channel("hh"));
    return cell;
}

int main(int argc, char** argv) {
    try {
        auto params = read_options(argc, argv);

        auto cell = make_cell(params);
        const auto last = dendra::fvm_index_type(cell.nseg-1);

        dendra::connectivity syn;
        syn.synapse_type = dendra::global_default_catalogue().synapse("glutamate");
        syn.conns.push_back({{0, 0, last}, {1, 0, 0}});
        syn.parameters["gs"] = params.synapse_gs;

        dendra::network net({cell, cell}, {syn});
        net.init_morph();
        net.init_conds();
        net.init_syns();

        net.cell(0).branch(0).comp(0).stimulate(
            dendra::i_clamp::box(params.stim_onset, params.stim_duration, params.stim_amplitude));

        const auto pre = net.compartment_index({0, 0, last});
        const auto post = net.compartment_index({1, 0, 0});
        net.record(pre);
        net.record(post);

        std::cout << "compartments:    " << net.num_compartments() << "\n";
        std::cout << "synapse edges:   " << net.syn_edges().size() << "\n";
        std::cout << "running simulation\n" << std::endl;

        dendra::simulation sim(net);
        sim.run(params.duration, params.dt);

        for (const auto& tr: sim.traces()) {
            double vmax = tr.voltage.front();
            for (auto v: tr.voltage) vmax = std::max(vmax, v);
            std::cout << "compartment " << tr.comp << ": peak " << vmax << " mV\n";
        }

        std::ofstream file(params.output);
        if (!file.good()) {
            std::cerr << "Warning: unable to open file " << params.output << " for trace output\n";
        }
        else {
            file << std::setw(1) << dendraio::write_json(sim.traces()) << "\n";
        }
    }
    catch (std::exception& e) {
        std::cerr << "exception caught in synapse_pair example: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

pair_params read_options(int argc, char** argv) {
    using sup::param_from_json;

    pair_params params;
    if (argc<2) {
        std::cout << "Using default parameters.\n";
        return params;
    }
    if (argc>2) {
        throw std::runtime_error("More than one command line option is not permitted.");
    }

    std::string fname = argv[1];
    std::cout << "Loading parameters from file: " << fname << "\n";
    auto json = sup::read_json_file(fname);

    param_from_json(params.cell_file, "cell", json);
    param_from_json(params.nseg, "nseg", json);
    param_from_json(params.radius, "radius", json);
    param_from_json(params.length, "length", json);
    param_from_json(params.stim_onset, "stim-onset", json);
    param_from_json(params.stim_duration, "stim-duration", json);
    param_from_json(params.stim_amplitude, "stim-amplitude", json);
    param_from_json(params.synapse_gs, "synapse-gs", json);
    param_from_json(params.duration, "duration", json);
    param_from_json(params.dt, "dt", json);
    param_from_json(params.output, "output", json);

    if (!json.empty()) {
        for (auto it=json.begin(); it!=json.end(); ++it) {
            std::cout << "  Warning: unused input parameter: \"" << it.key() << "\"\n";
        }
        std::cout << "\n";
    }

    return params;
}
