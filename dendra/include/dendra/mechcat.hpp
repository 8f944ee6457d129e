#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <dendra/mechanism.hpp>

// Mechanism catalogue: channel and synapse implementations indexed by name.
//
// There is in addition a global default catalogue object that is populated
// with the mechanisms built into dendra: the channels "hh" and "pas" and the
// synapse "glutamate".

namespace dendra {

class mechanism_catalogue {
public:
    mechanism_catalogue() = default;

    // Throws duplicate_mechanism if the name is taken by a channel or synapse.
    void add(channel_ptr mech);
    void add(synapse_ptr mech);

    // Add a channel derived from the channel `parent` (see derive_channel).
    void derive(const std::string& name, const std::string& parent,
                const std::vector<std::pair<std::string, double>>& defaults = {});

    bool has(const std::string& name) const;
    bool has_channel(const std::string& name) const;
    bool has_synapse(const std::string& name) const;

    // Throw no_such_mechanism if there is no mechanism of that kind and name.
    channel_ptr channel(const std::string& name) const;
    synapse_ptr synapse(const std::string& name) const;

    // Read-only access to mechanism info.
    const mechanism_info& operator[](const std::string& name) const;

    std::vector<std::string> mechanism_names() const;

private:
    std::map<std::string, channel_ptr> channels_;
    std::map<std::string, synapse_ptr> synapses_;
};

const mechanism_catalogue& global_default_catalogue();

} // namespace dendra
