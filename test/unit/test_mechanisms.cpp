#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <dendra/field_table.hpp>
#include <dendra/math.hpp>
#include <dendra/mechanism.hpp>
#include <dendra/mechcat.hpp>

#include "util/span.hpp"

#include "common.hpp"

using namespace dendra;

using util::make_span;
using vvec = std::vector<fvm_value_type>;

namespace {
    const mechanism_catalogue& cat = global_default_catalogue();

    // First order relaxation with voltage dependent target and time constant:
    //     dx/dt = (x_inf(v) - x)/tau(v)
    struct relax_channel: public channel {
        std::string name() const override { return "relax"; }

        const mechanism_info& info() const override {
            static const mechanism_info mi = {{{"g", "mS/cm2", 1.}}, {{"x", "", 0.}}};
            return mi;
        }

        static double x_inf(double v) { return 1./(1.+std::exp(-(v+40.)/5.)); }
        static double tau(double v) { return 0.5 + 4./(1.+std::exp((v+50.)/10.)); }

        void update_states(const field_table& state, value_type dt, const_view voltage,
                           const field_table&, field_table& new_state) const override
        {
            for (auto i: make_span(state.width())) {
                new_state[0][i] = math::exp_relax(state[0][i], x_inf(voltage[i]), tau(voltage[i]), dt);
            }
        }

        void compute_current(const field_table& state, const_view voltage,
                             const field_table& params, array& current) const override
        {
            for (auto i: make_span(state.width())) {
                current[i] = params[0][i]*state[0][i]*voltage[i];
            }
        }
    };

    // Classical RK4 on dx/dt = f(x) with n steps.
    template <typename F>
    double rk4(F f, double x, double t, unsigned n) {
        const double h = t/n;
        for (unsigned i = 0; i<n; ++i) {
            auto k1 = f(x);
            auto k2 = f(x + 0.5*h*k1);
            auto k3 = f(x + 0.5*h*k2);
            auto k4 = f(x + h*k3);
            x += h/6.*(k1 + 2*k2 + 2*k3 + k4);
        }
        return x;
    }

    // Access to a column by field name.
    vvec column(const field_table& t, const std::string& name) {
        auto col = t[t.find(name).value()];
        return vvec(col, col+t.width());
    }

    void fill(field_table& t, const std::string& name, double x) {
        auto col = t[t.find(name).value()];
        std::fill(col, col+t.width(), x);
    }

    void assign(field_table& t, const std::string& name, const vvec& values) {
        std::copy(values.begin(), values.end(), t[t.find(name).value()]);
    }

    struct lanes {
        field_table params, state, next;

        lanes(const mechanism_info& info, unsigned n):
            params(info.parameters, n), state(info.state, n), next(info.state, n)
        {}
    };
}

TEST(mechanisms, exact_exponential_update) {
    relax_channel ch;
    const vvec voltage = {-80., -50., -40., -20.};
    const auto n = unsigned(voltage.size());

    for (double dt: {1e-3, 1e-2, 0.1, 1., 10.}) {
        lanes l(ch.info(), n);
        fill(l.state, "x", 0.2);
        ch.update_states(l.state, dt, voltage, l.params, l.next);

        for (auto i: make_span(n)) {
            auto v = voltage[i];
            auto f = [v](double x) { return (relax_channel::x_inf(v)-x)/relax_channel::tau(v); };
            auto reference = rk4(f, 0.2, dt, 20000);
            EXPECT_NEAR(reference, l.next[0][i], 1e-6) << "dt " << dt << " v " << v;
        }
    }
}

TEST(mechanisms, exp_relax) {
    EXPECT_DOUBLE_EQ(0.3, math::exp_relax(0.3, 0.3, 2., 1.));
    EXPECT_DOUBLE_EQ(1. - std::exp(-0.5), math::exp_relax(0., 1., 2., 1.));

    // Instantaneous relaxation.
    EXPECT_EQ(0.7, math::exp_relax(0.1, 0.7, 0., 0.025));
}

TEST(mechanisms, hh_resting_state) {
    auto hh = cat.channel("hh");
    lanes l(hh->info(), 2);
    vvec v(2, -65.);

    // The default states are the steady state at -65 mV.
    hh->update_states(l.state, 0.025, v, l.params, l.next);
    for (auto f: {"m", "h", "n"}) {
        auto before = column(l.state, f);
        auto after = column(l.next, f);
        for (auto i: make_span(2u)) {
            EXPECT_NEAR(before[i], after[i], 1e-6) << f;
        }
    }

    // Update is pure: the input table is unchanged.
    EXPECT_DOUBLE_EQ(0.0529325, column(l.state, "m")[0]);
}

TEST(mechanisms, hh_current) {
    auto hh = cat.channel("hh");
    lanes l(hh->info(), 1);
    fill(l.state, "m", 0.);
    fill(l.state, "n", 0.);

    // Only the leak conducts.
    vvec current(1);
    hh->compute_current(l.state, {-44.3}, l.params, current);
    EXPECT_NEAR(0.3*(-44.3+54.3), current[0], 1e-12);

    // Fully open sodium channel drives the current towards ena.
    fill(l.state, "m", 1.);
    fill(l.state, "h", 1.);
    hh->compute_current(l.state, {0.}, l.params, current);
    EXPECT_NEAR(120.*(0.-50.) + 0.3*54.3, current[0], 1e-9);
}

TEST(mechanisms, hh_depolarized_gating) {
    auto hh = cat.channel("hh");
    lanes l(hh->info(), 1);

    hh->update_states(l.state, 1., {0.}, l.params, l.next);
    EXPECT_GT(column(l.next, "m")[0], column(l.state, "m")[0]);
    EXPECT_LT(column(l.next, "h")[0], column(l.state, "h")[0]);
    EXPECT_GT(column(l.next, "n")[0], column(l.state, "n")[0]);
}

TEST(mechanisms, pas) {
    auto pas = cat.channel("pas");
    lanes l(pas->info(), 3);
    assign(l.params, "g", {1., 2., 0.5});

    vvec current(3);
    pas->compute_current(l.state, {-70., -60., -80.}, l.params, current);
    EXPECT_DOUBLE_EQ(0., current[0]);
    EXPECT_DOUBLE_EQ(20., current[1]);
    EXPECT_DOUBLE_EQ(-5., current[2]);
}

TEST(mechanisms, glutamate) {
    auto glu = cat.synapse("glutamate");
    lanes l(glu->info(), 2);

    // Two edges from compartments 0 (depolarized) and 1 (at rest).
    vvec voltage = {-20., -65., -70.};
    std::vector<fvm_index_type> pre = {0, 1};
    vvec coef(2), constant(2);

    glu->step(l.state, 0.1, voltage, l.params, pre, l.next, coef, constant);

    // The current uses the gating value at the start of the step.
    EXPECT_EQ(0., coef[0]);
    EXPECT_EQ(0., constant[0]);

    auto s = column(l.next, "s");
    EXPECT_GT(s[0], s[1]);
    EXPECT_GT(s[1], 0.);

    // Steady state for a held presynaptic voltage.
    const double s_inf = 1./(1.+std::exp((-35.+20.)/10.));
    fill(l.state, "s", s_inf);
    glu->step(l.state, 0.1, voltage, l.params, pre, l.next, coef, constant);
    EXPECT_NEAR(s_inf, column(l.next, "s")[0], 1e-12);
    EXPECT_DOUBLE_EQ(0.5*s_inf, coef[0]);
    EXPECT_DOUBLE_EQ(0., constant[0]);

    // A reversal potential enters the constant term.
    fill(l.params, "e_syn", -80.);
    glu->step(l.state, 0.1, voltage, l.params, pre, l.next, coef, constant);
    EXPECT_DOUBLE_EQ(0.5*s_inf*80., constant[0]);
}
