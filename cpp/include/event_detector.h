#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// event_detector.h  –  Tack / Gybe Detection
//
// With a true wind direction the smoothed heading is turned into a
// wind-relative angle rel in (-180, 180]; its sign is the side of the wind
// the boat sails on.  A side only counts once it has been held for `dwell_s`
// consecutive seconds, so single jittery samples never register.  A change
// of confirmed side is a maneuver:
//     through the bow   (|rel| < 90 around the crossing)  -> tack
//     through the stern (|rel| > 90 around the crossing)  -> gybe
//
// Without a wind direction, any heading change larger than
// `fallback_threshold_deg` within `fallback_span_s` is an undifferentiated
// MANEUVER.
//
// Events closer than `cooldown_s` to the previous kept event are collapsed.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"

#include <vector>

namespace regatta {

struct DetectorConfig {
    double dwell_s                = 3.0;
    double cooldown_s             = 5.0;
    double fallback_threshold_deg = 60.0;
    double fallback_span_s        = 10.0;
};

class EventDetector {
public:
    explicit EventDetector(const DetectorConfig& config = DetectorConfig());

    /// Events ordered by timestamp.
    std::vector<Event> detect(BoatId boat_id,
                              const std::vector<KinematicSample>& samples,
                              const WindReference& wind) const;

private:
    std::vector<Event> detect_wind_relative(BoatId boat_id,
                                            const std::vector<KinematicSample>& samples,
                                            double twd_deg) const;
    std::vector<Event> detect_heading_swings(BoatId boat_id,
                                             const std::vector<KinematicSample>& samples) const;
    std::vector<Event> apply_cooldown(const std::vector<Event>& events) const;

    DetectorConfig config_;
};

}  // namespace regatta
