#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// window_aggregator.h  –  Windowed Statistics over Cached Series
//
// Pure reads over the TrackCache; any number of queries may run at once.
// Windows are half-open [t0, t1) in UTC epoch seconds.
//
// Reference direction for VMG:
//   TWD     true wind direction of the boat's race (VMG null without it)
//   COURSE  bearing from the window start position to the leg mark, or the
//           net start -> end bearing when no leg is given
// Height gain is always measured along the wind axis (null without TWD).
// ─────────────────────────────────────────────────────────────────────────────

#include "track_cache.h"
#include "track_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace regatta {

struct QueryOptions {
    bool exclude_interpolated = false;   // drop samples inside long raw gaps
};

struct SkippedBoat {
    BoatId      boat_id = 0;
    std::string reason;
};

struct QueryResult {
    std::vector<WindowStat>  stats;     // caller order
    std::vector<SkippedBoat> skipped;   // no coverage / unknown boat
};

struct CompareRow {
    BoatId reference_boat = 0;
    BoatId target_boat    = 0;
    std::optional<double> delta_vmg;
    std::optional<double> delta_height;
    double delta_sog = 0.0;
};

struct CompareResult {
    std::vector<CompareRow>  rows;
    std::vector<SkippedBoat> skipped;
};

struct BoatTrack {
    BoatId boat_id = 0;
    std::vector<ResampledPoint> points;
};

class WindowAggregator {
public:
    explicit WindowAggregator(const TrackCache& cache,
                              std::vector<CourseMark> marks = {});

    /// Statistics for one boat.  Throws EmptyWindowError when no sample
    /// falls in the window, std::invalid_argument for an unknown leg id.
    WindowStat compute(const BoatSeries& series, int64_t t0, int64_t t1,
                       RefMode ref, std::optional<int> leg_id = std::nullopt,
                       const QueryOptions& options = QueryOptions()) const;

    /// Per-boat failures become skip notes.  Throws std::invalid_argument
    /// when t0 >= t1 or the leg id is unknown.
    QueryResult query(const std::vector<BoatId>& boat_ids, int64_t t0, int64_t t1,
                      RefMode ref, std::optional<int> leg_id = std::nullopt,
                      const QueryOptions& options = QueryOptions()) const;

    /// Deltas (target - reference).  Throws EmptyWindowError when the
    /// reference boat has no data in the window.
    CompareResult compare(BoatId reference, const std::vector<BoatId>& targets,
                          int64_t t0, int64_t t1, RefMode ref,
                          std::optional<int> leg_id = std::nullopt) const;

    /// Resampled positions, every `step`-th second (1 or 5).
    std::vector<BoatTrack> tracks(const std::vector<BoatId>& boat_ids,
                                  std::optional<int64_t> t0, std::optional<int64_t> t1,
                                  int step = 1) const;

    /// Events of the given boats, merged in time order.
    std::vector<Event> events(const std::vector<BoatId>& boat_ids,
                              std::optional<int64_t> t0, std::optional<int64_t> t1,
                              std::optional<EventType> type = std::nullopt) const;

    /// Full covered span of a boat, [first sample, last sample + 1).
    std::optional<std::pair<int64_t, int64_t>> coverage(BoatId boat_id) const;

private:
    const CourseMark* find_mark(int id) const;

    const TrackCache& cache_;
    std::vector<CourseMark> marks_;
};

}  // namespace regatta
