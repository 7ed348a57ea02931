#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// track_cache.h  –  Per-Boat Series Table
//
// Holds each boat's computed series as an immutable shared snapshot.
// Ingestion publishes (one writer per boat), queries look up and then read
// without locking; a re-ingest swaps in a new snapshot while readers keep
// the old one alive.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace regatta {

using SeriesPtr = std::shared_ptr<const BoatSeries>;

class TrackCache {
public:
    TrackCache() = default;

    TrackCache(const TrackCache&) = delete;
    TrackCache& operator=(const TrackCache&) = delete;

    /// Stores (or replaces) the boat's series.
    void publish(SeriesPtr series);

    /// nullptr when the boat has not been ingested.
    SeriesPtr find(BoatId boat_id) const;

    bool erase(BoatId boat_id);

    /// Ascending boat ids.
    std::vector<BoatId> ids() const;

    size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<BoatId, SeriesPtr> entries_;
};

}  // namespace regatta
