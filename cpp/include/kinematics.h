#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// kinematics.h  –  Heading & Speed Over Ground from a 1 Hz Series
//
// Raw heading is the great-circle initial bearing between consecutive points,
// raw SOG the haversine distance over 1 s, unless the end point carries a
// logged device speed, which then wins.  Both are smoothed causally to
// suppress GPS jitter: heading through its sin / cos components, SOG
// directly.  Angles are never averaged as plain numbers.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"

#include <vector>

namespace regatta {

enum class SmoothingMode { MOVING_AVERAGE, EXPONENTIAL };

struct KinematicsConfig {
    int           smoothing_window_s     = 5;      // 1 disables smoothing
    SmoothingMode mode                   = SmoothingMode::MOVING_AVERAGE;
    double        stationary_threshold_m = 0.05;   // shorter segments hold heading
    bool          prefer_device_sog      = true;
};

class KinematicsEngine {
public:
    /// Throws std::invalid_argument for a window < 1.
    explicit KinematicsEngine(const KinematicsConfig& config = KinematicsConfig());

    /// One sample per point except the first.
    std::vector<KinematicSample> derive(const std::vector<ResampledPoint>& points) const;

private:
    KinematicsConfig config_;
};

}  // namespace regatta
