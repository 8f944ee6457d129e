/*
 * Passive diffusion of membrane voltage along a chain of three branches.
 *
 * The root branch starts depolarized, the rest at rest; without channels the
 * voltage relaxes to the area-weighted mean of the initial voltages.
 */

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <dendra/math.hpp>
#include <dendra/network.hpp>
#include <dendra/simulation.hpp>

#include <dendraio/jsonio.hpp>

#include <sup/json_params.hpp>

struct chain_params {
    chain_params() = default;

    unsigned nseg = 4;
    double radius = 1.0;             // [µm]
    double length = 10.0;            // [µm]
    double axial_resistivity = 100.; // [Ω·cm]
    double v_root = -20.;            // [mV]
    double v_rest = -70.;            // [mV]
    double duration = 50.;           // [ms]
    double dt = 0.025;               // [ms]
    std::string output = "chain.json";
};

chain_params read_options(int argc, char** argv);

int main(int argc, char** argv) {
    try {
        auto params = read_options(argc, argv);

        dendra::cell_description cell(params.nseg, {dendra::no_parent, 0, 1});
        cell.init_voltage = params.v_rest;

        dendra::network net({cell});
        net.init_morph();
        net.set_param("radius", params.radius);
        net.set_param("length", params.length);
        net.set_param("axial_resistivity", params.axial_resistivity);
        net.init_conds();
        net.init_syns();

        auto root = net.cell(0).branch(0);
        root.set_state("voltage", params.v_root);

        const auto n = net.num_compartments();
        net.record(0);
        net.record(dendra::fvm_index_type(n-1));

        auto area_weighted_mean = [&]() {
            const auto v = net.state("voltage");
            const auto r = net.param("radius");
            const auto l = net.param("length");
            double sum = 0, area = 0;
            for (std::size_t i = 0; i<v.size(); ++i) {
                auto a = dendra::math::area_cylinder(r[i], l[i]);
                sum += a*v[i];
                area += a;
            }
            return sum/area;
        };

        const auto mean = area_weighted_mean();
        std::cout << "compartments: " << n << "\n";
        std::cout << "initial area-weighted mean: " << mean << " mV\n";

        dendra::simulation sim(net);
        sim.run(params.duration, params.dt);

        const auto v = net.state("voltage");
        auto [lo, hi] = std::minmax_element(v.begin(), v.end());
        std::cout << std::setprecision(8);
        std::cout << "final voltage range: [" << *lo << ", " << *hi << "] mV\n";
        std::cout << "final area-weighted mean: " << area_weighted_mean() << " mV\n";

        std::ofstream file(params.output);
        if (!file.good()) {
            std::cerr << "Warning: unable to open file " << params.output << " for trace output\n";
        }
        else {
            file << std::setw(1) << dendraio::write_json(sim.traces()) << "\n";
        }
    }
    catch (std::exception& e) {
        std::cerr << "exception caught in chain example: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

chain_params read_options(int argc, char** argv) {
    using sup::param_from_json;

    chain_params params;
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

    param_from_json(params.nseg, "nseg", json);
    param_from_json(params.radius, "radius", json);
    param_from_json(params.length, "length", json);
    param_from_json(params.axial_resistivity, "axial-resistivity", json);
    param_from_json(params.v_root, "v-root", json);
    param_from_json(params.v_rest, "v-rest", json);
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
