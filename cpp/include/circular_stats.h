#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// circular_stats.h  –  Mean / Std of Angles
//
// Angles are averaged through their unit vectors.  With R the length of the
// mean resultant vector:
//     mean = atan2(mean sin, mean cos)
//     std  = sqrt(-2 ln R)            (radians, reported in degrees)
// ─────────────────────────────────────────────────────────────────────────────

#include <vector>

namespace regatta {

struct CircularSummary {
    double mean_deg   = 0.0;   // [0, 360)
    double std_deg    = 0.0;
    double resultant  = 0.0;   // R in [0, 1]
};

/// Incremental accumulator for headings in degrees.
class CircularAccumulator {
public:
    void add(double deg);
    int count() const { return n_; }

    /// Throws std::invalid_argument when empty.
    CircularSummary summary() const;

private:
    double sum_sin_ = 0.0;
    double sum_cos_ = 0.0;
    int n_ = 0;
};

CircularSummary circular_summary(const std::vector<double>& degrees);

}  // namespace regatta
