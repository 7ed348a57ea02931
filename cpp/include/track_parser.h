#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// track_parser.h  –  Raw Fix Validation
//
// Turns raw fixes (arrival order) into a validated, time-ordered,
// de-duplicated TrackFix sequence for one device.  Boat identity is attached
// by the caller.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"

#include <vector>

namespace regatta {

struct ParserConfig {
    double backward_tolerance_s = 1.0;   // late fixes beyond this are dropped
    double time_offset_s        = 0.0;   // per-boat clock correction
};

struct ParsedTrack {
    std::vector<TrackFix> fixes;
    int dropped_late       = 0;   // beyond the backward tolerance
    int dropped_duplicates = 0;   // identical timestamp, first kept
};

class TrackParser {
public:
    explicit TrackParser(const ParserConfig& config = ParserConfig());

    /// Throws MalformedTrackError on out-of-range / non-finite coordinates
    /// or when fewer than 2 fixes survive.
    ParsedTrack parse(const std::vector<RawFix>& raw) const;

private:
    ParserConfig config_;
};

}  // namespace regatta
