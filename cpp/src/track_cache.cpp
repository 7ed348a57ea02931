// ─────────────────────────────────────────────────────────────────────────────
// track_cache.cpp  –  Per-Boat Series Table
// ─────────────────────────────────────────────────────────────────────────────

#include "track_cache.h"

#include <stdexcept>
#include <utility>

namespace regatta {

void TrackCache::publish(SeriesPtr series) {
    if (!series) {
        throw std::invalid_argument("cannot publish an empty series");
    }
    const BoatId id = series->boat_id;
    std::lock_guard<std::mutex> lock(mu_);
    entries_[id] = std::move(series);
}

SeriesPtr TrackCache::find(BoatId boat_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(boat_id);
    return it == entries_.end() ? nullptr : it->second;
}

bool TrackCache::erase(BoatId boat_id) {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.erase(boat_id) > 0;
}

std::vector<BoatId> TrackCache::ids() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<BoatId> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

size_t TrackCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

}  // namespace regatta
