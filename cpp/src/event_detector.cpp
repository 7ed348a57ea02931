// ─────────────────────────────────────────────────────────────────────────────
// event_detector.cpp  –  Tack / Gybe State Machine
// ─────────────────────────────────────────────────────────────────────────────

#include "event_detector.h"
#include "geo.h"

#include <cmath>

namespace regatta {

// Seconds to a whole number of 1 Hz samples, at least one.
static size_t to_samples(double seconds) {
    const long n = std::lround(std::ceil(seconds - 1e-9));
    return n < 1 ? 1U : static_cast<size_t>(n);
}

EventDetector::EventDetector(const DetectorConfig& config) : config_(config) {}

std::vector<Event> EventDetector::detect(BoatId boat_id,
                                         const std::vector<KinematicSample>& samples,
                                         const WindReference& wind) const {
    if (samples.empty()) return {};
    if (wind.twd_deg) {
        return apply_cooldown(detect_wind_relative(boat_id, samples, *wind.twd_deg));
    }
    return apply_cooldown(detect_heading_swings(boat_id, samples));
}

std::vector<Event> EventDetector::detect_wind_relative(
    BoatId boat_id, const std::vector<KinematicSample>& samples, double twd_deg) const {
    const size_t dwell = to_samples(config_.dwell_s);

    std::vector<double> rel(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        rel[i] = geo::wrap180(samples[i].heading_deg - twd_deg);
    }

    std::vector<Event> events;
    int confirmed = 0;      // +1 starboard side of the wind, -1 port, 0 unknown
    int run_side  = 0;
    size_t run_start = 0;
    size_t run_len   = 0;

    for (size_t i = 0; i < samples.size(); ++i) {
        // Dead on the wind axis keeps the running side
        int side = run_side;
        if (rel[i] > 0.0 && rel[i] < 180.0) side = 1;
        else if (rel[i] < 0.0) side = -1;
        if (side == 0) continue;

        if (side == run_side) {
            run_len++;
        } else {
            run_side  = side;
            run_start = i;
            run_len   = 1;
        }

        if (run_len != dwell || run_side == confirmed) continue;

        if (confirmed != 0 && run_start > 0) {
            const double before = rel[run_start - 1];
            const double after  = rel[run_start];

            Event e;
            e.boat_id = boat_id;
            e.t = samples[run_start].t;
            e.type = (std::fabs(before) + std::fabs(after) < 180.0) ? EventType::TACK
                                                                   : EventType::GYBE;
            const size_t ref_idx = run_start >= dwell ? run_start - dwell : 0;
            e.heading_change_deg =
                geo::wrap180(samples[i].heading_deg - samples[ref_idx].heading_deg);
            events.push_back(e);
        }
        confirmed = run_side;
    }
    return events;
}

std::vector<Event> EventDetector::detect_heading_swings(
    BoatId boat_id, const std::vector<KinematicSample>& samples) const {
    const size_t span = to_samples(config_.fallback_span_s);

    std::vector<Event> events;
    bool armed = true;
    for (size_t i = span; i < samples.size(); ++i) {
        const double change =
            geo::wrap180(samples[i].heading_deg - samples[i - span].heading_deg);
        const bool over = std::fabs(change) > config_.fallback_threshold_deg;

        if (armed && over) {
            Event e;
            e.boat_id = boat_id;
            e.t = samples[i - span / 2].t;
            e.type = EventType::MANEUVER;
            e.heading_change_deg = change;
            events.push_back(e);
            armed = false;
        } else if (!armed && !over) {
            armed = true;
        }
    }
    return events;
}

std::vector<Event> EventDetector::apply_cooldown(const std::vector<Event>& events) const {
    std::vector<Event> kept;
    for (const auto& e : events) {
        if (!kept.empty() &&
            static_cast<double>(e.t - kept.back().t) < config_.cooldown_s) {
            continue;
        }
        kept.push_back(e);
    }
    return kept;
}

}  // namespace regatta
