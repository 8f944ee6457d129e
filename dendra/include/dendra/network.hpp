#pragma once

#include <string>
#include <vector>

#include <dendra/cell_description.hpp>
#include <dendra/common_types.hpp>
#include <dendra/connection.hpp>
#include <dendra/field_table.hpp>
#include <dendra/mechanism.hpp>
#include <dendra/network_tables.hpp>
#include <dendra/stimulus.hpp>

namespace dendra {

class network;

// Every compartment that carries one channel, with the parameters and states
// of each instance. Lanes are in ascending compartment order.
struct channel_group {
    channel_ptr mech;
    std::vector<fvm_index_type> node_index;
    field_table params;
    field_table state;

    std::string name() const { return mech->name(); }
};

// The synapse edges of one connectivity, one lane per connection. The
// compartment indices are filled in by network::init_syns.
struct synapse_group {
    synapse_ptr mech;
    std::vector<connection> conns;
    std::vector<fvm_index_type> pre_index;
    std::vector<fvm_index_type> post_index;
    field_table params;
    field_table state;

    std::string name() const { return mech->name(); }
};

struct stimulus_site {
    fvm_index_type comp;
    i_clamp clamp;
};

// A contiguous range [first, last) of global compartment indices of a
// network, addressing the parameters and states of those compartments and of
// the mechanisms placed on them.
//
// Field names are either a compartment field ("radius", "length",
// "axial_resistivity", "capacitance" and the state "voltage") or a mechanism
// field qualified by the mechanism name, e.g. "hh_gna" or "glutamate_s".
// Synapse fields address the edges whose postsynaptic compartment lies in
// the range, and require init_syns.
class compartment_range {
public:
    compartment_range(network* net, fvm_index_type first, fvm_index_type last):
        net_(net), first_(first), last_(last)
    {}

    fvm_size_type size() const { return fvm_size_type(last_-first_); }
    fvm_index_type first() const { return first_; }
    fvm_index_type last() const { return last_; }
    std::vector<fvm_index_type> indices() const;

    void set_param(const std::string& name, double value) const;
    void set_state(const std::string& name, double value) const;

    // One value per compartment, or per mechanism instance in the range.
    std::vector<double> param(const std::string& name) const;
    std::vector<double> state(const std::string& name) const;

    void stimulate(const i_clamp& clamp) const;
    void record() const;

protected:
    network* net_;
    fvm_index_type first_;
    fvm_index_type last_;
};

class compartment_view: public compartment_range {
public:
    using compartment_range::compartment_range;
};

class branch_view: public compartment_range {
public:
    branch_view(network* net, fvm_index_type branch, fvm_index_type first, fvm_index_type last):
        compartment_range(net, first, last), branch_(branch)
    {}

    // Global branch index.
    fvm_index_type index() const { return branch_; }

    // Throws std::out_of_range if seg is not a segment of the branch.
    compartment_view comp(fvm_index_type seg) const;

private:
    fvm_index_type branch_;
};

class cell_view: public compartment_range {
public:
    cell_view(network* net, cell_gid_type gid, fvm_index_type first, fvm_index_type last):
        compartment_range(net, first, last), gid_(gid)
    {}

    cell_gid_type gid() const { return gid_; }
    fvm_size_type num_branches() const;

    // Cell-local branch index; throws std::out_of_range if absent.
    branch_view branch(fvm_index_type b) const;

private:
    cell_gid_type gid_;
};

// A network of multi-compartment cells connected by synapses.
//
// Construction validates the cells and connections and allocates every
// parameter and state table at its final size. The derived data is then
// computed in three phases, which must run in order:
//
//   init_morph: branch prefix sums, merged parents and levels, node table
//   init_conds: axial coupling conductances
//   init_syns:  global synapse endpoints, synapse and branch edge tables
//
// Each phase recomputes its data from scratch when run again; re-running
// init_morph invalidates the two later phases.
class network {
public:
    using value_type = fvm_value_type;
    using index_type = fvm_index_type;
    using size_type  = fvm_size_type;

    explicit network(std::vector<cell_description> cells, std::vector<connectivity> connectivities = {});

    network(const network&) = default;
    network(network&&) = default;
    network& operator=(const network&) = default;
    network& operator=(network&&) = default;

    void init_morph();
    void init_conds();
    void init_syns();

    bool initialized_morph() const { return initialized_morph_; }
    bool initialized_conds() const { return initialized_conds_; }
    bool initialized_syns() const { return initialized_syns_; }
    bool initialized() const { return initialized_morph_ && initialized_conds_ && initialized_syns_; }

    unsigned nseg() const { return nseg_; }
    size_type num_cells() const { return size_type(cells_.size()); }
    size_type num_branches() const { return total_nbranches_; }
    size_type num_compartments() const { return total_nbranches_*nseg_; }

    const std::vector<cell_description>& cells() const { return cells_; }

    // Available after init_morph.
    const std::vector<index_type>& nbranches_per_cell() const;
    const std::vector<index_type>& cumsum_nbranches() const;
    const std::vector<index_type>& comb_parents() const;
    const std::vector<std::vector<index_type>>& comb_branches_in_each_level() const;
    const node_table& nodes() const;

    // Global compartment index of a location; throws std::out_of_range.
    index_type compartment_index(const comp_location& loc) const;

    // Location of a global compartment index; throws std::out_of_range.
    comp_location compartment_location(index_type comp) const;

    // Available after init_conds. See cable_conductances for the layout.
    const std::vector<value_type>& coupling_conds_fwd() const;
    const std::vector<value_type>& coupling_conds_bwd() const;
    const std::vector<value_type>& branch_conds_fwd() const;
    const std::vector<value_type>& branch_conds_bwd() const;
    const std::vector<value_type>& summed_coupling_conds() const;

    // Available after init_syns.
    const synapse_edge_table& syn_edges() const;
    const branch_edge_table& branch_edges() const;

    // Compartment parameters: radius, length, axial_resistivity, capacitance.
    const field_table& comp_params() const { return comp_params_; }
    // Compartment state: voltage.
    const field_table& comp_state() const { return comp_state_; }
    field_table& comp_state() { return comp_state_; }

    std::vector<channel_group>& channels() { return channels_; }
    const std::vector<channel_group>& channels() const { return channels_; }
    std::vector<synapse_group>& synapses() { return synapses_; }
    const std::vector<synapse_group>& synapses() const { return synapses_; }

    // Set a field for the whole network. Geometry parameters are immutable
    // once init_conds has run.
    void set_param(const std::string& name, double value);
    void set_state(const std::string& name, double value);

    // Set every value of a field, in the lane order of param() and state().
    // Throws table_size_mismatch if the length differs; values are checked as
    // above before any is written.
    void set_param(const std::string& name, const std::vector<double>& values);
    void set_state(const std::string& name, const std::vector<double>& values);

    // Every value of a field, in lane order.
    std::vector<double> param(const std::string& name) const;
    std::vector<double> state(const std::string& name) const;

    // Name of every addressable parameter and state field.
    std::vector<std::string> param_names() const;
    std::vector<std::string> state_names() const;

    // Views; require init_morph.
    cell_view cell(cell_gid_type gid);
    compartment_view comp(index_type comp);

    void stimulate(index_type comp, i_clamp clamp);
    void record(index_type comp);
    const std::vector<stimulus_site>& stimuli() const { return stimuli_; }
    const std::vector<index_type>& recordings() const { return recordings_; }

    // Check that every parameter and state table has the width implied by
    // the topology and connectivity. Throws table_size_mismatch.
    void validate() const;

private:
    friend class compartment_range;

    enum class field_kind { param, state };

    void require_morph(const char* phase) const;
    void require_conds(const char* phase) const;
    void require_syns(const char* phase) const;

    void set_field(field_kind kind, const std::string& name, index_type first, index_type last, double value);
    void set_field_values(field_kind kind, const std::string& name, const std::vector<double>& values);
    std::vector<double> get_field(field_kind kind, const std::string& name, index_type first, index_type last) const;

    unsigned nseg_ = 0;
    std::vector<cell_description> cells_;
    size_type total_nbranches_ = 0;

    field_table comp_params_;
    field_table comp_state_;
    std::vector<channel_group> channels_;
    std::vector<synapse_group> synapses_;

    std::vector<stimulus_site> stimuli_;
    std::vector<index_type> recordings_;

    bool initialized_morph_ = false;
    bool initialized_conds_ = false;
    bool initialized_syns_ = false;

    // init_morph
    std::vector<index_type> nbranches_per_cell_;
    std::vector<index_type> cumsum_nbranches_;
    std::vector<index_type> comb_parents_;
    std::vector<std::vector<index_type>> comb_branches_in_each_level_;
    node_table nodes_;

    // init_conds
    std::vector<value_type> coupling_conds_fwd_;
    std::vector<value_type> coupling_conds_bwd_;
    std::vector<value_type> branch_conds_fwd_;
    std::vector<value_type> branch_conds_bwd_;
    std::vector<value_type> summed_coupling_conds_;

    // init_syns
    synapse_edge_table syn_edges_;
    branch_edge_table branch_edges_;
};

} // namespace dendra
