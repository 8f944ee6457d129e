#include <cmath>
#include <memory>
#include <string>

#include <dendra/math.hpp>
#include <dendra/mechanism.hpp>

#include "mechanisms/builtin_mechanisms.hpp"
#include "util/span.hpp"

namespace dendra {

namespace {

using math::exprelr;
using math::exp_relax;

// Field positions, in declaration order.
enum hh_param { gna, gk, gl, ena, ek, el };
enum hh_state { m, h, n };

struct hh_rates {
    double minf, mtau;
    double hinf, htau;
    double ninf, ntau;

    explicit hh_rates(double v) {
        double alpha, beta, sum;

        alpha = exprelr(-(v+40.)/10.);
        beta  = 4.*std::exp(-(v+65.)/18.);
        sum   = alpha+beta;
        mtau  = 1./sum;
        minf  = alpha/sum;

        alpha = 0.07*std::exp(-(v+65.)/20.);
        beta  = 1./(std::exp(-(v+35.)/10.)+1.);
        sum   = alpha+beta;
        htau  = 1./sum;
        hinf  = alpha/sum;

        alpha = 0.1*exprelr(-(v+55.)/10.);
        beta  = 0.125*std::exp(-(v+65.)/80.);
        sum   = alpha+beta;
        ntau  = 1./sum;
        ninf  = alpha/sum;
    }
};

class hh_channel: public channel {
public:
    std::string name() const override { return "hh"; }

    const mechanism_info& info() const override {
        static const mechanism_info mi = {
            {
                {"gna", "mS/cm2", 120.0, 0.},
                {"gk",  "mS/cm2",  36.0, 0.},
                {"gl",  "mS/cm2",   0.3, 0.},
                {"ena", "mV",      50.0},
                {"ek",  "mV",     -77.0},
                {"el",  "mV",     -54.3},
            },
            {
                // Steady state at -65 mV.
                {"m", "", 0.0529325, 0., 1.},
                {"h", "", 0.5960208, 0., 1.},
                {"n", "", 0.3176769, 0., 1.},
            }
        };
        return mi;
    }

    void update_states(const field_table& state,
                       value_type dt,
                       const_view voltage,
                       const field_table& params,
                       field_table& new_state) const override
    {
        for (auto i: util::make_span(state.width())) {
            hh_rates r(voltage[i]);
            new_state[m][i] = exp_relax(state[m][i], r.minf, r.mtau, dt);
            new_state[h][i] = exp_relax(state[h][i], r.hinf, r.htau, dt);
            new_state[n][i] = exp_relax(state[n][i], r.ninf, r.ntau, dt);
        }
    }

    void compute_current(const field_table& state,
                         const_view voltage,
                         const field_table& params,
                         array& current) const override
    {
        for (auto i: util::make_span(state.width())) {
            auto v  = voltage[i];
            auto m_ = state[m][i];
            auto n2 = math::square(state[n][i]);

            auto ina = params[gna][i]*math::cube(m_)*state[h][i]*(v-params[ena][i]);
            auto ik  = params[gk][i]*n2*n2*(v-params[ek][i]);
            auto il  = params[gl][i]*(v-params[el][i]);
            current[i] = ina+ik+il;
        }
    }
};

} // anonymous namespace

channel_ptr make_hh_channel() {
    return std::make_shared<hh_channel>();
}

} // namespace dendra
