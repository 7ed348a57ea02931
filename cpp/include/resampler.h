#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// resampler.h  –  Irregular Fixes to a 1 Hz Series
//
// One ResampledPoint per whole second in [floor(first.t), ceil(last.t)].
// Between bracketing fixes f0 <= t <= f1:
//     alpha = (t - f0.t) / (f1.t - f0.t)
//     lat   = lerp(f0.lat, f1.lat, alpha)
//     lon   = lerp along the shortest arc (antimeridian safe)
// A second landing exactly on a fix takes the fix unchanged.
// Device speed is interpolated the same way when both fixes carry one.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"

#include <vector>

namespace regatta {

struct ResamplerConfig {
    double gap_threshold_s = 30.0;       // longer raw gaps tag points `interpolated`
    double max_span_s      = 7 * 86400.0; // longer tracks are rejected
};

class Resampler {
public:
    /// Throws std::invalid_argument for a max_span_s below 1 s.
    explicit Resampler(const ResamplerConfig& config = ResamplerConfig());

    /// Input must be time-ordered without duplicates (TrackParser output).
    /// Throws EmptyTrackError when fewer than 2 points would result,
    /// MalformedTrackError when the fixes span more than max_span_s.
    std::vector<ResampledPoint> resample(const std::vector<TrackFix>& fixes) const;

private:
    ResamplerConfig config_;
};

}  // namespace regatta
