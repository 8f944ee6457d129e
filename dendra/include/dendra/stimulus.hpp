#pragma once

#include <utility>
#include <vector>

#include <dendra/common_types.hpp>

namespace dendra {

// Current clamp. The injected current [nA] interpolates linearly between
// envelope points, is zero before the first point and holds the last
// amplitude after the last point. Positive current depolarizes.
struct i_clamp {
    struct envelope_point {
        time_type t;      // [ms]
        double amplitude; // [nA]
    };

    std::vector<envelope_point> envelope;

    // A default constructed i_clamp, with empty envelope, describes
    // a trivial stimulus, providing no current at all.
    i_clamp() = default;

    // Constant amplitude stimulus starting from t=0.
    explicit i_clamp(double amplitude):
        envelope({{0., amplitude}})
    {}

    explicit i_clamp(std::vector<envelope_point> envelope):
        envelope(std::move(envelope))
    {}

    // A 'box' stimulus with fixed onset time, duration, and constant amplitude.
    static i_clamp box(time_type onset, time_type duration, double amplitude) {
        return i_clamp({{onset, amplitude}, {onset+duration, amplitude}, {onset+duration, 0.}});
    }

    // Current at time t [nA].
    double current(time_type t) const;
};

} // namespace dendra
