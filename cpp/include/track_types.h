#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// track_types.h  –  Track, Kinematic & Statistics Data Model
//
// Timestamps:
//   raw / validated fixes   UTC epoch milliseconds (int64)
//   1 Hz series & events    UTC epoch seconds      (int64)
//
// Units: degrees (WGS84), metres, knots.
// ─────────────────────────────────────────────────────────────────────────────

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regatta {

using BoatId = int;

/// Unvalidated observation as read from a log file.
struct RawFix {
    int64_t t_ms = 0;
    double  lat  = 0.0;
    double  lon  = 0.0;
    std::optional<double> ele;
    std::optional<double> speed_mps;   // device SOG when logged
};

/// Validated, time-ordered observation.
struct TrackFix {
    int64_t t_ms = 0;
    double  lat  = 0.0;
    double  lon  = 0.0;
    std::optional<double> ele;
    std::optional<double> speed_mps;
};

/// One position per whole second.
struct ResampledPoint {
    int64_t t   = 0;
    double  lat = 0.0;
    double  lon = 0.0;
    bool interpolated = false;   // inside a raw gap longer than the threshold
    std::optional<double> speed_mps;   // device SOG, if both neighbours had one
};

/// Derived from the point pair (i-1, i); stamped with point i's time.
struct KinematicSample {
    int64_t t = 0;
    double heading_deg     = 0.0;   // smoothed, [0, 360)
    double sog_kt          = 0.0;   // smoothed, >= 0
    double raw_heading_deg = 0.0;
    double raw_sog_kt      = 0.0;
    double distance_m      = 0.0;   // segment length (i-1 -> i)
    double lat = 0.0, lon = 0.0;    // end position
    bool interpolated = false;
};

enum class EventType { TACK, GYBE, MANEUVER };

inline const char* event_type_str(EventType type) {
    switch (type) {
        case EventType::TACK:     return "tack";
        case EventType::GYBE:     return "gybe";
        case EventType::MANEUVER: return "maneuver";
    }
    return "unknown";
}

struct Event {
    BoatId    boat_id = 0;
    int64_t   t       = 0;
    EventType type    = EventType::TACK;
    double    heading_change_deg = 0.0;
};

/// Race-level wind. Either field may be missing.
struct WindReference {
    std::optional<double> twd_deg;
    std::optional<double> tws_kt;
};

/// Course mark used to scope the `course` reference to a leg.
struct CourseMark {
    int         id = 0;
    std::string name;
    double      lat = 0.0;
    double      lon = 0.0;
    int         order = 0;
};

enum class RefMode { TWD, COURSE };

inline const char* ref_mode_str(RefMode mode) {
    return mode == RefMode::TWD ? "twd" : "course";
}

struct WindowStat {
    BoatId  boat_id = 0;
    int64_t t0 = 0, t1 = 0;
    RefMode ref = RefMode::TWD;

    double avg_sog     = 0.0;   // kt
    std::optional<double> avg_vmg;     // kt, null without a reference
    double avg_heading = 0.0;   // deg
    double heading_std = 0.0;   // deg
    double distance_sailed = 0.0;      // m, path length
    double displacement    = 0.0;      // m, start -> end
    std::optional<double> height_gain; // m, null without TWD

    int tack_count     = 0;
    int gybe_count     = 0;
    int maneuver_count = 0;
    int sample_count   = 0;
    bool wind_fallback = false;        // counts are undifferentiated maneuvers
};

/// Everything computed for one boat at ingestion. Immutable once cached.
struct BoatSeries {
    BoatId        boat_id = 0;
    std::string   label;
    WindReference wind;
    std::vector<ResampledPoint>  points;
    std::vector<KinematicSample> samples;   // samples[i] ends at points[i + 1]
    std::vector<Event>           events;
};

}  // namespace regatta
