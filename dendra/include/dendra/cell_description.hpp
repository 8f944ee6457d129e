#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <dendra/common_types.hpp>
#include <dendra/mechanism.hpp>

namespace dendra {

// Default physical properties of the cable.
struct cable_defaults {
    static constexpr double radius = 1.0;               // [µm]
    static constexpr double length = 10.0;              // [µm]
    static constexpr double axial_resistivity = 5000.0; // [Ω·cm]
    static constexpr double capacitance = 1.0;          // [µF/cm²]
    static constexpr double init_voltage = -70.0;       // [mV]
};

// A channel inserted on a set of branches of a cell, with optional
// per-placement parameter values. An empty branch list selects every branch.
struct channel_placement {
    channel_ptr mech;
    std::vector<fvm_index_type> branches;
    std::unordered_map<std::string, double> parameters;
};

// Description of one cell: a rooted tree of branches, each divided into
// nseg compartments.
//
// Segment 0 of a branch is proximal: a child branch attaches its first
// compartment to the last compartment of its parent branch.
//
// Per-compartment geometry vectors are indexed by branch*nseg + segment;
// an empty vector selects the default value for every compartment.
struct cell_description {
    unsigned nseg = 1;

    // Parent branch of each branch; exactly one branch (the root) has
    // parent no_parent (-1).
    std::vector<fvm_index_type> parents = {no_parent};

    std::vector<double> radius;            // [µm]
    std::vector<double> length;            // [µm]
    std::vector<double> axial_resistivity; // [Ω·cm]
    std::vector<double> capacitance;       // [µF/cm²]

    double init_voltage = cable_defaults::init_voltage; // [mV]

    std::vector<channel_placement> channels;

    cell_description() = default;
    cell_description(unsigned nseg, std::vector<fvm_index_type> parents):
        nseg(nseg), parents(std::move(parents))
    {}

    fvm_size_type num_branches() const { return fvm_size_type(parents.size()); }
    fvm_size_type num_compartments() const { return num_branches()*nseg; }

    cell_description& insert(channel_ptr mech,
                             std::vector<fvm_index_type> branches = {},
                             std::unordered_map<std::string, double> parameters = {})
    {
        channels.push_back({std::move(mech), std::move(branches), std::move(parameters)});
        return *this;
    }
};

} // namespace dendra
