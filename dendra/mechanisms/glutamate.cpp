#include <cmath>
#include <limits>
#include <memory>
#include <string>

#include <dendra/math.hpp>
#include <dendra/mechanism.hpp>

#include "mechanisms/builtin_mechanisms.hpp"
#include "util/span.hpp"

namespace dendra {

namespace {

enum glu_param { gs, e_syn, v_th, delta, k_minus };
enum glu_state { s };

// The gating variable s relaxes towards the sigmoidal activation
//
//     s_inf = 1/(1 + exp((v_th - V_pre)/delta)),  tau = (1 - s_inf)/k_minus.
//
// The current uses the gating value at the start of the step.

class glutamate_synapse: public synapse {
public:
    std::string name() const override { return "glutamate"; }

    const mechanism_info& info() const override {
        // delta and k_minus divide: both must be strictly positive.
        constexpr double positive = std::numeric_limits<double>::min();
        static const mechanism_info mi = {
            {
                {"gs",      "mS/cm2",  0.5, 0.},
                {"e_syn",   "mV",      0.0},
                {"v_th",    "mV",    -35.0},
                {"delta",   "mV",     10.0, positive},
                {"k_minus", "1/ms", 1./40., positive},
            },
            {
                {"s", "", 0.0, 0., 1.},
            }
        };
        return mi;
    }

    void step(const field_table& state,
              value_type dt,
              const_view voltage,
              const field_table& params,
              const iarray& pre_index,
              field_table& new_state,
              array& voltage_term,
              array& constant_term) const override
    {
        for (auto i: util::make_span(state.width())) {
            auto v_pre = voltage[pre_index[i]];
            auto s_inf = 1./(1.+std::exp((params[v_th][i]-v_pre)/params[delta][i]));
            auto tau   = (1.-s_inf)/params[k_minus][i];

            auto s_old = state[s][i];
            new_state[s][i] = math::exp_relax(s_old, s_inf, tau, dt);

            voltage_term[i]  = params[gs][i]*s_old;
            constant_term[i] = -params[gs][i]*s_old*params[e_syn][i];
        }
    }
};

} // anonymous namespace

synapse_ptr make_glutamate_synapse() {
    return std::make_shared<glutamate_synapse>();
}

} // namespace dendra
