#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <dendra/dendraexcept.hpp>
#include <dendra/mechanism.hpp>
#include <dendra/mechcat.hpp>
#include <dendra/mechinfo.hpp>

#include "common.hpp"

using namespace dendra;

// A catalogue with one channel, "burble", and one synapse, "fleeb".

namespace {
    struct burble: public channel {
        std::string name() const override { return "burble"; }
        const mechanism_info& info() const override {
            static const mechanism_info mi = {{{"quux", "nA", 2.3, 0., 10.}}, {}};
            return mi;
        }
        void update_states(const field_table&, value_type, const_view, const field_table&, field_table&) const override {}
        // Ohmic current, quux·V.
        void compute_current(const field_table&, const_view voltage, const field_table& params, array& current) const override {
            for (std::size_t i = 0; i<voltage.size(); ++i) current[i] = params[0][i]*voltage[i];
        }
    };

    struct fleeb: public synapse {
        std::string name() const override { return "fleeb"; }
        const mechanism_info& info() const override {
            static const mechanism_info mi = {{{"plugh", "C", 0.1}}, {{"norf", "", 0.}}};
            return mi;
        }
        void step(const field_table&, value_type, const_view, const field_table&, const iarray&,
                  field_table&, array&, array&) const override {}
    };

    // A channel that takes the name of a synapse.
    struct fleeb_channel: public burble {
        std::string name() const override { return "fleeb"; }
    };

    struct bleeble: public burble {
        std::string name() const override { return "bleeble"; }
    };

    mechanism_catalogue build_fake_catalogue() {
        mechanism_catalogue cat;
        cat.add(channel_ptr(std::make_shared<burble>()));
        cat.add(synapse_ptr(std::make_shared<fleeb>()));
        return cat;
    }
}

TEST(mechcat, names) {
    auto cat = build_fake_catalogue();
    auto names = cat.mechanism_names();
    std::sort(names.begin(), names.end());
    EXPECT_EQ((std::vector<std::string>{"burble", "fleeb"}), names);
}

TEST(mechcat, lookup) {
    auto cat = build_fake_catalogue();

    EXPECT_TRUE(cat.has("burble"));
    EXPECT_TRUE(cat.has_channel("burble"));
    EXPECT_FALSE(cat.has_synapse("burble"));
    EXPECT_TRUE(cat.has_synapse("fleeb"));
    EXPECT_FALSE(cat.has("corge"));

    EXPECT_EQ("burble", cat.channel("burble")->name());
    EXPECT_EQ("fleeb", cat.synapse("fleeb")->name());

    EXPECT_EQ(2.3, cat["burble"].parameters[0].default_value);
    EXPECT_EQ("norf", cat["fleeb"].state[0].name);
}

TEST(mechcat, no_such_mechanism) {
    auto cat = build_fake_catalogue();

    EXPECT_THROW(cat.channel("corge"), dendra::no_such_mechanism);
    EXPECT_THROW(cat["corge"], dendra::no_such_mechanism);

    // Lookup is by kind as well as by name.
    EXPECT_THROW(cat.channel("fleeb"), dendra::no_such_mechanism);
    EXPECT_THROW(cat.synapse("burble"), dendra::no_such_mechanism);

    try {
        cat.synapse("corge");
        FAIL() << "expected no_such_mechanism";
    }
    catch (dendra::no_such_mechanism& e) {
        EXPECT_EQ("corge", e.mech_name);
    }
}

TEST(mechcat, duplicate_mechanism) {
    auto cat = build_fake_catalogue();

    EXPECT_THROW(cat.add(channel_ptr(std::make_shared<burble>())), dendra::duplicate_mechanism);
    EXPECT_THROW(cat.add(synapse_ptr(std::make_shared<fleeb>())), dendra::duplicate_mechanism);

    // Channel and synapse names share one namespace.
    EXPECT_THROW(cat.add(channel_ptr(std::make_shared<fleeb_channel>())), dendra::duplicate_mechanism);
}

TEST(mechcat, copy) {
    auto cat = build_fake_catalogue();
    mechanism_catalogue copy = cat;
    copy.add(channel_ptr(std::make_shared<bleeble>()));

    EXPECT_TRUE(copy.has_channel("bleeble"));
    EXPECT_FALSE(cat.has("bleeble"));
    EXPECT_TRUE(copy.has("fleeb"));
}

TEST(mechcat, default_catalogue) {
    const auto& cat = global_default_catalogue();

    EXPECT_TRUE(cat.has_channel("hh"));
    EXPECT_TRUE(cat.has_channel("pas"));
    EXPECT_TRUE(cat.has_synapse("glutamate"));

    const auto& hh = cat["hh"];
    ASSERT_EQ(6u, hh.parameters.size());
    EXPECT_EQ("gna", hh.parameters[0].name);
    EXPECT_EQ(120., hh.parameters[0].default_value);
    ASSERT_EQ(3u, hh.state.size());
    EXPECT_EQ("m", hh.state[0].name);

    const auto& glu = cat["glutamate"];
    EXPECT_TRUE(glu.parameter_index("k_minus"));
    EXPECT_TRUE(glu.state_index("s"));
    EXPECT_FALSE(glu.parameter_index("s"));

    // Bounds on conductances.
    EXPECT_FALSE(cat["pas"].parameters[0].valid(-1.));
    EXPECT_TRUE(cat["pas"].parameters[1].valid(-1.));
}

TEST(mechcat, derive) {
    auto cat = build_fake_catalogue();
    cat.derive("burble2", "burble");
    cat.derive("burble3", "burble", {{"quux", 4.5}});
    // Derivations chain.
    cat.derive("burble4", "burble3");

    EXPECT_TRUE(cat.has_channel("burble2"));
    EXPECT_EQ("burble3", cat.channel("burble3")->name());

    EXPECT_EQ(2.3, cat["burble2"].parameters[0].default_value);
    EXPECT_EQ(4.5, cat["burble3"].parameters[0].default_value);
    EXPECT_EQ(4.5, cat["burble4"].parameters[0].default_value);
    EXPECT_EQ(10., cat["burble4"].parameters[0].upper_bound);
    EXPECT_EQ(2.3, cat["burble"].parameters[0].default_value);

    // The derived channel computes as its parent.
    auto mech = cat.channel("burble4");
    const auto& info = mech->info();
    field_table params(info.parameters, 2), state(info.state, 2);
    channel::array current(2);
    mech->compute_current(state, {1., -2.}, params, current);
    EXPECT_EQ((channel::array{4.5, -9.}), current);

    EXPECT_THROW(cat.derive("burble2", "burble"), dendra::duplicate_mechanism);
    EXPECT_THROW(cat.derive("fleeb", "burble"), dendra::duplicate_mechanism);
    EXPECT_THROW(cat.derive("corge", "grault"), dendra::no_such_mechanism);
    EXPECT_THROW(cat.derive("corge", "fleeb"), dendra::no_such_mechanism);
    EXPECT_THROW(cat.derive("corge", "burble", {{"plugh", 1.}}), dendra::no_such_parameter);
    EXPECT_THROW(cat.derive("corge", "burble", {{"quux", 11.}}), dendra::invalid_parameter_value);
    EXPECT_FALSE(cat.has("corge"));
}

TEST(mechcat, derive_channel) {
    auto hh = global_default_catalogue().channel("hh");
    auto hh2 = derive_channel("hh2", hh, {{"gna", 60.}});

    EXPECT_EQ("hh2", hh2->name());
    EXPECT_EQ(60., hh2->info().parameters[0].default_value);
    EXPECT_EQ(36., hh2->info().parameters[1].default_value);
    EXPECT_EQ(120., hh->info().parameters[0].default_value);
    ASSERT_EQ(3u, hh2->info().state.size());
    EXPECT_EQ("h", hh2->info().state[1].name);
}
