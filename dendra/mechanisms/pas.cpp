#include <memory>
#include <string>

#include <dendra/mechanism.hpp>

#include "mechanisms/builtin_mechanisms.hpp"
#include "util/span.hpp"

namespace dendra {

namespace {

enum pas_param { g, e };

class pas_channel: public channel {
public:
    std::string name() const override { return "pas"; }

    const mechanism_info& info() const override {
        static const mechanism_info mi = {
            {
                {"g", "mS/cm2", 1.0, 0.},
                {"e", "mV",   -70.0},
            },
            {}
        };
        return mi;
    }

    // No gating.
    void update_states(const field_table&, value_type, const_view, const field_table&, field_table&) const override {}

    void compute_current(const field_table&,
                         const_view voltage,
                         const field_table& params,
                         array& current) const override
    {
        for (auto i: util::make_span(params.width())) {
            current[i] = params[g][i]*(voltage[i]-params[e][i]);
        }
    }
};

} // anonymous namespace

channel_ptr make_pas_channel() {
    return std::make_shared<pas_channel>();
}

} // namespace dendra
