#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <dendra/dendraexcept.hpp>
#include <dendra/network.hpp>

#include "conductances.hpp"
#include "io/debug.hpp"
#include "topology.hpp"
#include "util/partition.hpp"
#include "util/span.hpp"
#include "util/strprintf.hpp"

namespace dendra {

using util::make_span;
using util::count_along;
using util::pprintf;

namespace {

// Compartment parameter columns, in table order.
enum comp_field { field_radius, field_length, field_axial_resistivity, field_capacitance };

const std::vector<std::string> comp_param_names = {"radius", "length", "axial_resistivity", "capacitance"};
const std::vector<std::string> comp_state_names = {"voltage"};

bool is_geometry(const std::string& name) {
    return name=="radius" || name=="length" || name=="axial_resistivity";
}

bool is_positive_finite(double x) {
    return std::isfinite(x) && x>0;
}

template <typename Mech>
void apply_parameters(const Mech& mech, field_table& params, fvm_size_type lane,
                      const std::unordered_map<std::string, double>& values)
{
    const auto& info = mech.info();
    for (const auto& [name, value]: values) {
        auto i = info.parameter_index(name);
        if (!i) {
            throw no_such_parameter(mech.name(), name);
        }
        if (!info.parameters[*i].valid(value)) {
            throw invalid_parameter_value(mech.name(), name, value);
        }
        params[fvm_size_type(*i)][lane] = value;
    }
}

void check_location(const comp_location& loc, const char* end, const std::vector<cell_description>& cells,
                    std::size_t group, std::size_t index)
{
    if (loc.cell>=cells.size()) {
        throw bad_connection(group, index,
            pprintf("{} cell {} is not in a network of {} cells", end, loc.cell, cells.size()));
    }
    const auto& cell = cells[loc.cell];
    if (loc.branch<0 || loc.branch>=fvm_index_type(cell.num_branches())) {
        throw bad_connection(group, index,
            pprintf("{} branch {} is not a branch of cell {}", end, loc.branch, loc.cell));
    }
    if (loc.seg<0 || loc.seg>=fvm_index_type(cell.nseg)) {
        throw bad_connection(group, index,
            pprintf("{} segment {} is not in [0, {})", end, loc.seg, cell.nseg));
    }
}

} // anonymous namespace

// Location of one addressable column.
struct network_field_ref {
    enum owner_kind { compartment, channel, synapse };

    owner_kind owner;
    std::size_t group;
    fvm_size_type column;
};

network::network(std::vector<cell_description> cells, std::vector<connectivity> connectivities):
    cells_(std::move(cells))
{
    if (cells_.empty()) {
        throw dendra_exception("Model building error: a network requires at least one cell.");
    }

    nseg_ = cells_.front().nseg;
    for (auto gid: count_along(cells_)) {
        const auto& cell = cells_[gid];
        if (cell.nseg!=nseg_) {
            throw inconsistent_nseg(cell_gid_type(gid), cell.nseg, nseg_);
        }
        validate_cell(cell, cell_gid_type(gid));
        total_nbranches_ += cell.num_branches();
    }

    const auto ncomp = num_compartments();
    std::vector<size_type> ncomp_per_cell;
    for (const auto& cell: cells_) ncomp_per_cell.push_back(cell.num_compartments());
    const auto comp_divs = util::make_partition<index_type>(ncomp_per_cell);

    // Compartment parameters and state.
    comp_params_ = field_table(comp_param_names, ncomp);
    comp_state_ = field_table(comp_state_names, ncomp);

    const std::pair<const std::vector<double> cell_description::*, double> columns[] = {
        {&cell_description::radius,            cable_defaults::radius},
        {&cell_description::length,            cable_defaults::length},
        {&cell_description::axial_resistivity, cable_defaults::axial_resistivity},
        {&cell_description::capacitance,       cable_defaults::capacitance},
    };
    for (auto gid: count_along(cells_)) {
        const auto& cell = cells_[gid];
        const auto off = comp_divs[gid];
        for (auto f: count_along(columns)) {
            const auto& values = cell.*(columns[f].first);
            auto col = comp_params_[size_type(f)];
            for (auto k: make_span(cell.num_compartments())) {
                auto x = values.empty()? columns[f].second: values[k];
                if (!is_positive_finite(x)) {
                    throw bad_geometry(comp_param_names[f], off+k, x);
                }
                col[off+k] = x;
            }
        }
        std::fill(comp_state_[0]+off, comp_state_[0]+comp_divs[gid+1], cell.init_voltage);
    }

    // Channels: one group per channel name, with the parameter values of
    // later placements taking precedence on shared compartments.
    std::vector<std::map<index_type, std::unordered_map<std::string, double>>> placed;
    for (auto gid: count_along(cells_)) {
        const auto& cell = cells_[gid];
        for (const auto& p: cell.channels) {
            auto name = p.mech->name();
            auto it = std::find_if(channels_.begin(), channels_.end(),
                [&](const channel_group& g) { return g.name()==name; });
            if (it==channels_.end()) {
                channels_.push_back({p.mech, {}, {}, {}});
                placed.emplace_back();
                it = channels_.end()-1;
            }
            else if (it->mech!=p.mech) {
                throw duplicate_mechanism(name);
            }
            auto& sites = placed[it-channels_.begin()];

            std::vector<index_type> branches = p.branches;
            if (branches.empty()) {
                branches.resize(cell.num_branches());
                std::iota(branches.begin(), branches.end(), 0);
            }
            for (auto b: branches) {
                for (auto k: make_span(nseg_)) {
                    auto& values = sites[comp_divs[gid] + index_type(b*nseg_ + k)];
                    for (const auto& kv: p.parameters) values[kv.first] = kv.second;
                }
            }
        }
    }
    for (auto g: count_along(channels_)) {
        auto& group = channels_[g];
        const auto& info = group.mech->info();
        const auto n = size_type(placed[g].size());
        group.params = field_table(info.parameters, n);
        group.state = field_table(info.state, n);
        size_type lane = 0;
        for (const auto& [comp, values]: placed[g]) {
            group.node_index.push_back(comp);
            apply_parameters(*group.mech, group.params, lane++, values);
        }
    }

    // Synapses: one group per connectivity.
    for (auto g: count_along(connectivities)) {
        auto& c = connectivities[g];
        if (!c.synapse_type) {
            throw bad_connection(g, 0, "connectivity has no synapse type");
        }
        auto name = c.synapse_type->name();
        for (const auto& ch: channels_) {
            if (ch.name()==name) throw duplicate_mechanism(name);
        }
        for (const auto& s: synapses_) {
            if (s.name()==name && s.mech!=c.synapse_type) throw duplicate_mechanism(name);
        }
        for (auto i: count_along(c.conns)) {
            check_location(c.conns[i].pre, "presynaptic", cells_, g, i);
            check_location(c.conns[i].post, "postsynaptic", cells_, g, i);
        }

        const auto& info = c.synapse_type->info();
        const auto n = size_type(c.conns.size());
        synapse_group group{c.synapse_type, std::move(c.conns), {}, {},
                            field_table(info.parameters, n), field_table(info.state, n)};
        for (auto lane: make_span(n)) {
            apply_parameters(*group.mech, group.params, lane, c.parameters);
        }
        synapses_.push_back(std::move(group));
    }

    DEBUG << "network: " << num_cells() << " cells, " << num_branches() << " branches, "
          << num_compartments() << " compartments, " << channels_.size() << " channel groups, "
          << synapses_.size() << " synapse groups";
}

void network::require_morph(const char* phase) const {
    if (!initialized_morph_) throw init_order_error(phase, "init_morph");
}

void network::require_conds(const char* phase) const {
    if (!initialized_conds_) throw init_order_error(phase, "init_conds");
}

void network::require_syns(const char* phase) const {
    if (!initialized_syns_) throw init_order_error(phase, "init_syns");
}

void network::init_morph() {
    nbranches_per_cell_.clear();
    for (const auto& cell: cells_) {
        nbranches_per_cell_.push_back(index_type(cell.num_branches()));
    }
    cumsum_nbranches_ = util::make_partition<index_type>(nbranches_per_cell_);

    std::vector<const index_array*> parents;
    std::vector<level_list> levels;
    for (const auto& cell: cells_) {
        parents.push_back(&cell.parents);
        levels.push_back(branch_levels(cell.parents));
    }
    comb_parents_ = merge_parents(parents, cumsum_nbranches_);
    comb_branches_in_each_level_ = merge_levels(levels, cumsum_nbranches_);

    const auto ncomp = index_type(num_compartments());
    nodes_ = node_table{};
    nodes_.comp_index.resize(ncomp);
    std::iota(nodes_.comp_index.begin(), nodes_.comp_index.end(), 0);
    for (auto i: make_span(ncomp)) {
        nodes_.branch_index.push_back(i/index_type(nseg_));
    }
    for (auto gid: count_along(cells_)) {
        nodes_.cell_index.insert(nodes_.cell_index.end(), cells_[gid].num_compartments(), index_type(gid));
    }

    initialized_morph_ = true;
    initialized_conds_ = false;
    initialized_syns_ = false;

    DEBUG << "init_morph: " << comb_branches_in_each_level_.size() << " levels";
}

void network::init_conds() {
    require_morph("init_conds");

    auto g = compute_cable_conductances(nseg_, comb_parents_,
                                        comp_params_[field_radius],
                                        comp_params_[field_length],
                                        comp_params_[field_axial_resistivity]);

    coupling_conds_fwd_ = std::move(g.coupling_fwd);
    coupling_conds_bwd_ = std::move(g.coupling_bwd);
    branch_conds_fwd_ = std::move(g.branch_fwd);
    branch_conds_bwd_ = std::move(g.branch_bwd);
    summed_coupling_conds_ = std::move(g.summed);

    initialized_conds_ = true;
}

void network::init_syns() {
    require_morph("init_syns");

    syn_edges_ = synapse_edge_table{};
    for (auto g: count_along(synapses_)) {
        auto& group = synapses_[g];
        group.pre_index.clear();
        group.post_index.clear();
        for (const auto& c: group.conns) {
            group.pre_index.push_back(compartment_index(c.pre));
            group.post_index.push_back(compartment_index(c.post));
        }
        const auto name = group.name();
        syn_edges_.pre_comp_index.insert(syn_edges_.pre_comp_index.end(), group.pre_index.begin(), group.pre_index.end());
        syn_edges_.post_comp_index.insert(syn_edges_.post_comp_index.end(), group.post_index.begin(), group.post_index.end());
        syn_edges_.type.insert(syn_edges_.type.end(), group.conns.size(), name);
        syn_edges_.group.insert(syn_edges_.group.end(), group.conns.size(), size_type(g));
    }

    branch_edges_ = make_branch_edges(comb_parents_);

    initialized_syns_ = true;

    DEBUG << "init_syns: " << syn_edges_.size() << " synapse edges, " << branch_edges_.size() << " branch edges";
}

const std::vector<fvm_index_type>& network::nbranches_per_cell() const {
    require_morph("nbranches_per_cell");
    return nbranches_per_cell_;
}

const std::vector<fvm_index_type>& network::cumsum_nbranches() const {
    require_morph("cumsum_nbranches");
    return cumsum_nbranches_;
}

const std::vector<fvm_index_type>& network::comb_parents() const {
    require_morph("comb_parents");
    return comb_parents_;
}

const std::vector<std::vector<fvm_index_type>>& network::comb_branches_in_each_level() const {
    require_morph("comb_branches_in_each_level");
    return comb_branches_in_each_level_;
}

const node_table& network::nodes() const {
    require_morph("nodes");
    return nodes_;
}

fvm_index_type network::compartment_index(const comp_location& loc) const {
    require_morph("compartment_index");
    if (loc.cell>=num_cells()
        || loc.branch<0 || loc.branch>=nbranches_per_cell_[loc.cell]
        || loc.seg<0 || loc.seg>=index_type(nseg_))
    {
        throw std::out_of_range(pprintf("no compartment at cell {} branch {} segment {}", loc.cell, loc.branch, loc.seg));
    }
    return (cumsum_nbranches_[loc.cell] + loc.branch)*index_type(nseg_) + loc.seg;
}

comp_location network::compartment_location(index_type comp) const {
    require_morph("compartment_location");
    if (comp<0 || comp>=index_type(num_compartments())) {
        throw std::out_of_range(pprintf("no compartment {} in network of {} compartments", comp, num_compartments()));
    }
    const auto branch = comp/index_type(nseg_);
    const auto cell = util::partition_view(cumsum_nbranches_).index(branch);
    return {cell_gid_type(cell), branch-cumsum_nbranches_[cell], comp%index_type(nseg_)};
}

const std::vector<fvm_value_type>& network::coupling_conds_fwd() const {
    require_conds("coupling_conds_fwd");
    return coupling_conds_fwd_;
}

const std::vector<fvm_value_type>& network::coupling_conds_bwd() const {
    require_conds("coupling_conds_bwd");
    return coupling_conds_bwd_;
}

const std::vector<fvm_value_type>& network::branch_conds_fwd() const {
    require_conds("branch_conds_fwd");
    return branch_conds_fwd_;
}

const std::vector<fvm_value_type>& network::branch_conds_bwd() const {
    require_conds("branch_conds_bwd");
    return branch_conds_bwd_;
}

const std::vector<fvm_value_type>& network::summed_coupling_conds() const {
    require_conds("summed_coupling_conds");
    return summed_coupling_conds_;
}

const synapse_edge_table& network::syn_edges() const {
    require_syns("syn_edges");
    return syn_edges_;
}

const branch_edge_table& network::branch_edges() const {
    require_syns("branch_edges");
    return branch_edges_;
}

// Columns addressed by a field name: a compartment field, or the field of
// every mechanism group whose name qualifies it.
static std::vector<network_field_ref> resolve_field(
    bool param, const std::string& name,
    const field_table& comp_table,
    const std::vector<channel_group>& channels,
    const std::vector<synapse_group>& synapses)
{
    if (auto col = comp_table.find(name)) {
        return {{network_field_ref::compartment, 0, *col}};
    }

    std::vector<network_field_ref> refs;
    std::string mech;
    auto match = [&](const std::string& mech_name, const field_table& table) -> std::optional<fvm_size_type> {
        auto prefix = mech_name+"_";
        if (name.compare(0, prefix.size(), prefix)!=0) return std::nullopt;
        mech = mech_name;
        return table.find(name.substr(prefix.size()));
    };

    for (auto g: count_along(channels)) {
        const auto& group = channels[g];
        if (auto col = match(group.name(), param? group.params: group.state)) {
            refs.push_back({network_field_ref::channel, g, *col});
        }
    }
    for (auto g: count_along(synapses)) {
        const auto& group = synapses[g];
        if (auto col = match(group.name(), param? group.params: group.state)) {
            refs.push_back({network_field_ref::synapse, g, *col});
        }
    }

    if (refs.empty()) {
        auto field = mech.empty()? name: name.substr(mech.size()+1);
        if (mech.empty()) mech = "network";
        if (param) throw no_such_parameter(mech, field);
        throw no_such_state(mech, field);
    }
    return refs;
}

// Throws if `value` may not be written to the column of r: geometry is
// positive and fixed after init_conds, mechanism parameters are in bounds.
static void check_field_value(const network& net, bool param, const network_field_ref& r,
                              const std::string& name, fvm_size_type index, double value)
{
    if (!param) return;

    if (r.owner==network_field_ref::compartment) {
        if (is_geometry(name) && net.initialized_conds()) {
            throw immutable_topology(name);
        }
        if (!is_positive_finite(value)) {
            throw bad_geometry(name, index, value);
        }
        return;
    }

    const bool is_channel = r.owner==network_field_ref::channel;
    const auto& info = is_channel? net.channels()[r.group].mech->info(): net.synapses()[r.group].mech->info();
    const auto& spec = info.parameters[r.column];
    if (!spec.valid(value)) {
        throw invalid_parameter_value(
            is_channel? net.channels()[r.group].name(): net.synapses()[r.group].name(),
            spec.name, value);
    }
}

// Lanes of a column that lie in the compartment range [first, last).
static std::vector<fvm_size_type> lanes_in_range(const std::vector<fvm_index_type>& comp_of_lane,
                                                 fvm_index_type first, fvm_index_type last,
                                                 bool sorted)
{
    std::vector<fvm_size_type> lanes;
    if (sorted) {
        auto b = std::lower_bound(comp_of_lane.begin(), comp_of_lane.end(), first);
        auto e = std::lower_bound(b, comp_of_lane.end(), last);
        for (auto it = b; it!=e; ++it) lanes.push_back(fvm_size_type(it-comp_of_lane.begin()));
    }
    else {
        for (auto i: count_along(comp_of_lane)) {
            if (comp_of_lane[i]>=first && comp_of_lane[i]<last) lanes.push_back(fvm_size_type(i));
        }
    }
    return lanes;
}

void network::set_field(field_kind kind, const std::string& name, index_type first, index_type last, double value) {
    const bool param = kind==field_kind::param;
    const bool whole = first==0 && last==index_type(num_compartments());

    // Check every target before writing to any of them.
    auto refs = resolve_field(param, name, param? comp_params_: comp_state_, channels_, synapses_);
    for (const auto& r: refs) {
        if (r.owner==network_field_ref::synapse && !whole) {
            require_syns("setting a synapse field on part of a network");
        }
        check_field_value(*this, param, r, name, size_type(first), value);
    }

    for (const auto& r: refs) {
        switch (r.owner) {
        case network_field_ref::compartment: {
            auto col = (param? comp_params_: comp_state_)[r.column];
            std::fill(col+first, col+last, value);
            break;
        }
        case network_field_ref::channel: {
            auto& group = channels_[r.group];
            auto col = (param? group.params: group.state)[r.column];
            for (auto lane: lanes_in_range(group.node_index, first, last, true)) col[lane] = value;
            break;
        }
        case network_field_ref::synapse: {
            auto& group = synapses_[r.group];
            auto& table = param? group.params: group.state;
            auto col = table[r.column];
            if (whole) {
                std::fill(col, col+table.width(), value);
            }
            else {
                for (auto lane: lanes_in_range(group.post_index, first, last, false)) col[lane] = value;
            }
            break;
        }
        }
    }
}

void network::set_field_values(field_kind kind, const std::string& name, const std::vector<double>& values) {
    const bool param = kind==field_kind::param;
    auto refs = resolve_field(param, name, param? comp_params_: comp_state_, channels_, synapses_);

    auto table_of = [&](const network_field_ref& r) -> field_table& {
        switch (r.owner) {
        case network_field_ref::channel:
            return param? channels_[r.group].params: channels_[r.group].state;
        case network_field_ref::synapse:
            return param? synapses_[r.group].params: synapses_[r.group].state;
        default:
            return param? comp_params_: comp_state_;
        }
    };

    std::size_t expected = 0;
    for (const auto& r: refs) expected += table_of(r).width();
    if (values.size()!=expected) {
        throw table_size_mismatch(name, values.size(), expected);
    }

    std::size_t k = 0;
    for (const auto& r: refs) {
        for (auto lane: make_span(table_of(r).width())) {
            check_field_value(*this, param, r, name, lane, values[k++]);
        }
    }

    auto src = values.data();
    for (const auto& r: refs) {
        auto& table = table_of(r);
        std::copy(src, src+table.width(), table[r.column]);
        src += table.width();
    }
}

std::vector<double> network::get_field(field_kind kind, const std::string& name, index_type first, index_type last) const {
    const bool param = kind==field_kind::param;
    const bool whole = first==0 && last==index_type(num_compartments());

    std::vector<double> values;
    for (const auto& r: resolve_field(param, name, param? comp_params_: comp_state_, channels_, synapses_)) {
        switch (r.owner) {
        case network_field_ref::compartment: {
            auto col = (param? comp_params_: comp_state_)[r.column];
            values.insert(values.end(), col+first, col+last);
            break;
        }
        case network_field_ref::channel: {
            const auto& group = channels_[r.group];
            auto col = (param? group.params: group.state)[r.column];
            for (auto lane: lanes_in_range(group.node_index, first, last, true)) values.push_back(col[lane]);
            break;
        }
        case network_field_ref::synapse: {
            const auto& group = synapses_[r.group];
            const auto& table = param? group.params: group.state;
            auto col = table[r.column];
            if (whole) {
                values.insert(values.end(), col, col+table.width());
            }
            else {
                require_syns("reading a synapse field on part of a network");
                for (auto lane: lanes_in_range(group.post_index, first, last, false)) values.push_back(col[lane]);
            }
            break;
        }
        }
    }
    return values;
}

void network::set_param(const std::string& name, double value) {
    set_field(field_kind::param, name, 0, index_type(num_compartments()), value);
}

void network::set_state(const std::string& name, double value) {
    set_field(field_kind::state, name, 0, index_type(num_compartments()), value);
}

void network::set_param(const std::string& name, const std::vector<double>& values) {
    set_field_values(field_kind::param, name, values);
}

void network::set_state(const std::string& name, const std::vector<double>& values) {
    set_field_values(field_kind::state, name, values);
}

std::vector<double> network::param(const std::string& name) const {
    return get_field(field_kind::param, name, 0, index_type(num_compartments()));
}

std::vector<double> network::state(const std::string& name) const {
    return get_field(field_kind::state, name, 0, index_type(num_compartments()));
}

static void append_names(std::vector<std::string>& names, const std::string& mech, const field_table& table) {
    for (const auto& field: table.names()) {
        auto qualified = mech+"_"+field;
        if (std::find(names.begin(), names.end(), qualified)==names.end()) {
            names.push_back(std::move(qualified));
        }
    }
}

std::vector<std::string> network::param_names() const {
    auto names = comp_params_.names();
    for (const auto& g: channels_) append_names(names, g.name(), g.params);
    for (const auto& g: synapses_) append_names(names, g.name(), g.params);
    return names;
}

std::vector<std::string> network::state_names() const {
    auto names = comp_state_.names();
    for (const auto& g: channels_) append_names(names, g.name(), g.state);
    for (const auto& g: synapses_) append_names(names, g.name(), g.state);
    return names;
}

cell_view network::cell(cell_gid_type gid) {
    require_morph("cell view");
    if (gid>=num_cells()) {
        throw std::out_of_range(pprintf("no cell {} in network of {} cells", gid, num_cells()));
    }
    const auto n = index_type(nseg_);
    return cell_view(this, gid, cumsum_nbranches_[gid]*n, cumsum_nbranches_[gid+1]*n);
}

compartment_view network::comp(index_type i) {
    require_morph("compartment view");
    if (i<0 || i>=index_type(num_compartments())) {
        throw std::out_of_range(pprintf("no compartment {} in network of {} compartments", i, num_compartments()));
    }
    return compartment_view(this, i, i+1);
}

void network::stimulate(index_type comp, i_clamp clamp) {
    if (comp<0 || comp>=index_type(num_compartments())) {
        throw std::out_of_range(pprintf("can not stimulate compartment {}: network has {} compartments", comp, num_compartments()));
    }
    stimuli_.push_back({comp, std::move(clamp)});
}

void network::record(index_type comp) {
    if (comp<0 || comp>=index_type(num_compartments())) {
        throw std::out_of_range(pprintf("can not record compartment {}: network has {} compartments", comp, num_compartments()));
    }
    if (std::find(recordings_.begin(), recordings_.end(), comp)==recordings_.end()) {
        recordings_.push_back(comp);
    }
}

void network::validate() const {
    auto check = [](const std::string& field, std::size_t size, std::size_t expected) {
        if (size!=expected) throw table_size_mismatch(field, size, expected);
    };

    const auto ncomp = num_compartments();
    check("compartment parameters", comp_params_.width(), ncomp);
    check("compartment state", comp_state_.width(), ncomp);
    check("compartment parameter fields", comp_params_.num_fields(), comp_param_names.size());
    check("compartment state fields", comp_state_.num_fields(), comp_state_names.size());

    for (const auto& g: channels_) {
        const auto& info = g.mech->info();
        const auto n = g.node_index.size();
        check(g.name()+" parameters", g.params.width(), n);
        check(g.name()+" state", g.state.width(), n);
        check(g.name()+" parameter fields", g.params.num_fields(), info.parameters.size());
        check(g.name()+" state fields", g.state.num_fields(), info.state.size());
    }

    for (const auto& g: synapses_) {
        const auto& info = g.mech->info();
        const auto n = g.conns.size();
        check(g.name()+" parameters", g.params.width(), n);
        check(g.name()+" state", g.state.width(), n);
        check(g.name()+" parameter fields", g.params.num_fields(), info.parameters.size());
        check(g.name()+" state fields", g.state.num_fields(), info.state.size());
        if (initialized_syns_) {
            check(g.name()+" presynaptic indices", g.pre_index.size(), n);
            check(g.name()+" postsynaptic indices", g.post_index.size(), n);
        }
    }
}

// compartment_range

std::vector<fvm_index_type> compartment_range::indices() const {
    std::vector<fvm_index_type> idx(size());
    std::iota(idx.begin(), idx.end(), first_);
    return idx;
}

void compartment_range::set_param(const std::string& name, double value) const {
    net_->set_field(network::field_kind::param, name, first_, last_, value);
}

void compartment_range::set_state(const std::string& name, double value) const {
    net_->set_field(network::field_kind::state, name, first_, last_, value);
}

std::vector<double> compartment_range::param(const std::string& name) const {
    return net_->get_field(network::field_kind::param, name, first_, last_);
}

std::vector<double> compartment_range::state(const std::string& name) const {
    return net_->get_field(network::field_kind::state, name, first_, last_);
}

void compartment_range::stimulate(const i_clamp& clamp) const {
    for (auto i: make_span(first_, last_)) net_->stimulate(i, clamp);
}

void compartment_range::record() const {
    for (auto i: make_span(first_, last_)) net_->record(i);
}

compartment_view branch_view::comp(fvm_index_type seg) const {
    if (seg<0 || seg>=fvm_index_type(size())) {
        throw std::out_of_range(pprintf("no segment {} in branch of {} segments", seg, size()));
    }
    return compartment_view(net_, first_+seg, first_+seg+1);
}

fvm_size_type cell_view::num_branches() const {
    return fvm_size_type(net_->nbranches_per_cell()[gid_]);
}

branch_view cell_view::branch(fvm_index_type b) const {
    if (b<0 || b>=fvm_index_type(num_branches())) {
        throw std::out_of_range(pprintf("no branch {} in cell {} of {} branches", b, gid_, num_branches()));
    }
    const auto gb = net_->cumsum_nbranches()[gid_] + b;
    const auto n = fvm_index_type(net_->nseg());
    return branch_view(net_, gb, gb*n, (gb+1)*n);
}

} // namespace dendra
