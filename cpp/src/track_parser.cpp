// ─────────────────────────────────────────────────────────────────────────────
// track_parser.cpp  –  Raw Fix Validation
// ─────────────────────────────────────────────────────────────────────────────

#include "track_parser.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <limits>

namespace regatta {

TrackParser::TrackParser(const ParserConfig& config) : config_(config) {}

ParsedTrack TrackParser::parse(const std::vector<RawFix>& raw) const {
    const int64_t tolerance_ms =
        static_cast<int64_t>(std::llround(config_.backward_tolerance_s * 1000.0));
    const int64_t offset_ms =
        static_cast<int64_t>(std::llround(config_.time_offset_s * 1000.0));

    ParsedTrack out;
    out.fixes.reserve(raw.size());

    int64_t latest = std::numeric_limits<int64_t>::min();
    for (size_t i = 0; i < raw.size(); ++i) {
        const RawFix& r = raw[i];
        if (!std::isfinite(r.lat) || !std::isfinite(r.lon) ||
            r.lat < -90.0 || r.lat > 90.0 || r.lon < -180.0 || r.lon > 180.0) {
            char msg[128];
            std::snprintf(msg, sizeof(msg),
                          "fix %zu has invalid coordinates (%.6f, %.6f)",
                          i, r.lat, r.lon);
            throw MalformedTrackError(msg);
        }

        const int64_t t = r.t_ms + offset_ms;
        if (latest != std::numeric_limits<int64_t>::min() && t < latest - tolerance_ms) {
            out.dropped_late++;
            continue;
        }
        latest = std::max(latest, t);

        TrackFix f;
        f.t_ms = t;
        f.lat = r.lat;
        f.lon = r.lon;
        if (r.ele && std::isfinite(*r.ele)) f.ele = r.ele;
        if (r.speed_mps && std::isfinite(*r.speed_mps) && *r.speed_mps >= 0.0) {
            f.speed_mps = r.speed_mps;
        }
        out.fixes.push_back(f);
    }

    // Jitter inside the tolerance is re-ordered; stable sort keeps the first
    // of identical timestamps in front.
    std::stable_sort(out.fixes.begin(), out.fixes.end(),
                     [](const TrackFix& a, const TrackFix& b) { return a.t_ms < b.t_ms; });

    auto last = std::unique(out.fixes.begin(), out.fixes.end(),
                            [](const TrackFix& a, const TrackFix& b) { return a.t_ms == b.t_ms; });
    out.dropped_duplicates = static_cast<int>(std::distance(last, out.fixes.end()));
    out.fixes.erase(last, out.fixes.end());

    if (out.fixes.size() < 2) {
        char msg[96];
        std::snprintf(msg, sizeof(msg),
                      "track has %zu usable fixes, at least 2 required",
                      out.fixes.size());
        throw MalformedTrackError(msg);
    }
    return out;
}

}  // namespace regatta
