// ─────────────────────────────────────────────────────────────────────────────
// circular_stats.cpp  –  Mean / Std of Angles
// ─────────────────────────────────────────────────────────────────────────────

#include "circular_stats.h"
#include "geo.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regatta {

// Keeps ln(R) finite for perfectly opposed headings.
static constexpr double kMinResultant = 1e-12;

void CircularAccumulator::add(double deg) {
    const double r = geo::deg2rad(deg);
    sum_sin_ += std::sin(r);
    sum_cos_ += std::cos(r);
    ++n_;
}

CircularSummary CircularAccumulator::summary() const {
    if (n_ == 0) {
        throw std::invalid_argument("circular summary of an empty set");
    }
    const double s = sum_sin_ / n_;
    const double c = sum_cos_ / n_;

    CircularSummary out;
    out.mean_deg  = geo::wrap360(geo::rad2deg(std::atan2(s, c)));
    out.resultant = std::min(1.0, std::hypot(s, c));

    const double r = std::max(kMinResultant, out.resultant);
    out.std_deg = geo::rad2deg(std::sqrt(std::max(0.0, -2.0 * std::log(r))));
    return out;
}

CircularSummary circular_summary(const std::vector<double>& degrees) {
    CircularAccumulator acc;
    for (double d : degrees) acc.add(d);
    return acc.summary();
}

}  // namespace regatta
