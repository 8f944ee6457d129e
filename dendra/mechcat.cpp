#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <dendra/dendraexcept.hpp>
#include <dendra/mechcat.hpp>

#include "mechanisms/builtin_mechanisms.hpp"

namespace dendra {

namespace {

class derived_channel: public channel {
public:
    derived_channel(std::string name, channel_ptr base, mechanism_info info):
        name_(std::move(name)), base_(std::move(base)), info_(std::move(info))
    {}

    std::string name() const override { return name_; }
    const mechanism_info& info() const override { return info_; }

    void update_states(const field_table& state, value_type dt, const_view voltage,
                       const field_table& params, field_table& new_state) const override
    {
        base_->update_states(state, dt, voltage, params, new_state);
    }

    void compute_current(const field_table& state, const_view voltage,
                         const field_table& params, array& current) const override
    {
        base_->compute_current(state, voltage, params, current);
    }

private:
    std::string name_;
    channel_ptr base_;
    mechanism_info info_;
};

} // anonymous namespace

channel_ptr derive_channel(std::string name, channel_ptr base,
                           const std::vector<std::pair<std::string, double>>& defaults)
{
    mechanism_info info = base->info();
    for (const auto& [param, value]: defaults) {
        auto i = info.parameter_index(param);
        if (!i) {
            throw no_such_parameter(base->name(), param);
        }
        auto& spec = info.parameters[*i];
        if (!spec.valid(value)) {
            throw invalid_parameter_value(name, param, value);
        }
        spec.default_value = value;
    }
    return std::make_shared<derived_channel>(std::move(name), std::move(base), std::move(info));
}

void mechanism_catalogue::derive(const std::string& name, const std::string& parent,
                                 const std::vector<std::pair<std::string, double>>& defaults)
{
    if (has(name)) throw duplicate_mechanism(name);
    add(derive_channel(name, channel(parent), defaults));
}

void mechanism_catalogue::add(channel_ptr mech) {
    auto name = mech->name();
    if (has(name)) throw duplicate_mechanism(name);
    channels_.emplace(std::move(name), std::move(mech));
}

void mechanism_catalogue::add(synapse_ptr mech) {
    auto name = mech->name();
    if (has(name)) throw duplicate_mechanism(name);
    synapses_.emplace(std::move(name), std::move(mech));
}

bool mechanism_catalogue::has(const std::string& name) const {
    return has_channel(name) || has_synapse(name);
}

bool mechanism_catalogue::has_channel(const std::string& name) const {
    return channels_.count(name);
}

bool mechanism_catalogue::has_synapse(const std::string& name) const {
    return synapses_.count(name);
}

channel_ptr mechanism_catalogue::channel(const std::string& name) const {
    auto it = channels_.find(name);
    if (it==channels_.end()) throw no_such_mechanism(name);
    return it->second;
}

synapse_ptr mechanism_catalogue::synapse(const std::string& name) const {
    auto it = synapses_.find(name);
    if (it==synapses_.end()) throw no_such_mechanism(name);
    return it->second;
}

const mechanism_info& mechanism_catalogue::operator[](const std::string& name) const {
    if (auto it = channels_.find(name); it!=channels_.end()) {
        return it->second->info();
    }
    if (auto it = synapses_.find(name); it!=synapses_.end()) {
        return it->second->info();
    }
    throw no_such_mechanism(name);
}

std::vector<std::string> mechanism_catalogue::mechanism_names() const {
    std::vector<std::string> names;
    for (const auto& [name, _]: channels_) names.push_back(name);
    for (const auto& [name, _]: synapses_) names.push_back(name);
    return names;
}

static mechanism_catalogue build_default_catalogue() {
    mechanism_catalogue cat;
    cat.add(make_hh_channel());
    cat.add(make_pas_channel());
    cat.add(make_glutamate_synapse());
    return cat;
}

const mechanism_catalogue& global_default_catalogue() {
    static mechanism_catalogue cat = build_default_catalogue();
    return cat;
}

} // namespace dendra
