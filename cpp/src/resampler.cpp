// ─────────────────────────────────────────────────────────────────────────────
// resampler.cpp  –  Irregular Fixes to a 1 Hz Series
// ─────────────────────────────────────────────────────────────────────────────

#include "resampler.h"
#include "errors.h"
#include "geo.h"
#include "iso_time.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace regatta {

// ceil of a millisecond timestamp to whole seconds (negative safe)
static int64_t ceil_s(int64_t t_ms) {
    int64_t s = t_ms / 1000;
    if (t_ms % 1000 != 0 && t_ms > 0) ++s;
    return s;
}

Resampler::Resampler(const ResamplerConfig& config) : config_(config) {
    if (!(config_.max_span_s >= 1.0)) {
        throw std::invalid_argument("maximum track span must be at least 1 s");
    }
}

std::vector<ResampledPoint> Resampler::resample(const std::vector<TrackFix>& fixes) const {
    if (fixes.size() < 2) {
        throw EmptyTrackError("cannot resample fewer than 2 fixes");
    }

    const int64_t start = floor_ms_to_s(fixes.front().t_ms);
    const int64_t end   = ceil_s(fixes.back().t_ms);
    if (end - start + 1 < 2) {
        throw EmptyTrackError("track spans less than one second");
    }
    if (static_cast<double>(end - start) > config_.max_span_s) {
        throw MalformedTrackError("track spans " + std::to_string(end - start) +
                                  " s, more than the " +
                                  std::to_string(static_cast<int64_t>(config_.max_span_s)) +
                                  " s limit");
    }

    const int64_t gap_ms = static_cast<int64_t>(std::llround(config_.gap_threshold_s * 1000.0));

    std::vector<ResampledPoint> out;
    out.reserve(static_cast<size_t>(end - start + 1));

    size_t k = 0;   // fixes[k] is the last fix at or before t
    for (int64_t t = start; t <= end; ++t) {
        const int64_t t_ms = t * 1000;
        while (k + 1 < fixes.size() && fixes[k + 1].t_ms <= t_ms) ++k;

        ResampledPoint p;
        p.t = t;

        const TrackFix& f0 = fixes[k];
        if (f0.t_ms == t_ms) {
            p.lat = f0.lat;
            p.lon = f0.lon;
            p.speed_mps = f0.speed_mps;
        } else if (t_ms < f0.t_ms || k + 1 == fixes.size()) {
            // Sub-second edge before the first / after the last fix
            p.lat = f0.lat;
            p.lon = f0.lon;
            p.speed_mps = f0.speed_mps;
        } else {
            const TrackFix& f1 = fixes[k + 1];
            const double alpha = static_cast<double>(t_ms - f0.t_ms) /
                                 static_cast<double>(f1.t_ms - f0.t_ms);
            p.lat = f0.lat + alpha * (f1.lat - f0.lat);
            p.lon = geo::interpolate_lon(f0.lon, f1.lon, alpha);
            p.interpolated = (f1.t_ms - f0.t_ms) > gap_ms;
            if (f0.speed_mps && f1.speed_mps) {
                p.speed_mps = *f0.speed_mps + alpha * (*f1.speed_mps - *f0.speed_mps);
            }
        }
        out.push_back(p);
    }
    return out;
}

}  // namespace regatta
