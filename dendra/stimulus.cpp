#include <dendra/stimulus.hpp>

namespace dendra {

double i_clamp::current(time_type t) const {
    if (envelope.empty() || t<envelope.front().t) return 0.;

    // Find the last envelope point at or before t; a repeated time
    // describes a step, and the later point takes effect.
    std::size_t i = 0;
    while (i+1<envelope.size() && envelope[i+1].t<=t) ++i;

    if (i+1==envelope.size()) return envelope[i].amplitude;

    const auto& a = envelope[i];
    const auto& b = envelope[i+1];
    auto u = (t-a.t)/(b.t-a.t);
    return a.amplitude + u*(b.amplitude-a.amplitude);
}

} // namespace dendra
