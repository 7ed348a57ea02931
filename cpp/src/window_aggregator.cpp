// ─────────────────────────────────────────────────────────────────────────────
// window_aggregator.cpp  –  Windowed Statistics over Cached Series
// ─────────────────────────────────────────────────────────────────────────────

#include "window_aggregator.h"
#include "circular_stats.h"
#include "errors.h"
#include "geo.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace regatta {

// Below this the net course bearing is undefined.
static constexpr double kMinCourseLegM = 1e-3;

static std::vector<BoatId> unique_in_order(const std::vector<BoatId>& ids) {
    std::vector<BoatId> out;
    std::set<BoatId> seen;
    for (BoatId id : ids) {
        if (seen.insert(id).second) out.push_back(id);
    }
    return out;
}

WindowAggregator::WindowAggregator(const TrackCache& cache, std::vector<CourseMark> marks)
    : cache_(cache), marks_(std::move(marks)) {
    std::sort(marks_.begin(), marks_.end(),
              [](const CourseMark& a, const CourseMark& b) { return a.order < b.order; });
}

const CourseMark* WindowAggregator::find_mark(int id) const {
    for (const auto& m : marks_) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

WindowStat WindowAggregator::compute(const BoatSeries& series, int64_t t0, int64_t t1,
                                     RefMode ref, std::optional<int> leg_id,
                                     const QueryOptions& options) const {
    const CourseMark* mark = nullptr;
    if (ref == RefMode::COURSE && leg_id) {
        mark = find_mark(*leg_id);
        if (!mark) {
            throw std::invalid_argument("unknown leg mark " + std::to_string(*leg_id));
        }
    }

    const auto& samples = series.samples;
    auto by_time = [](const KinematicSample& s, int64_t t) { return s.t < t; };
    const size_t lo = static_cast<size_t>(
        std::lower_bound(samples.begin(), samples.end(), t0, by_time) - samples.begin());
    const size_t hi = static_cast<size_t>(
        std::lower_bound(samples.begin(), samples.end(), t1, by_time) - samples.begin());

    std::vector<size_t> idx;
    idx.reserve(hi > lo ? hi - lo : 0);
    for (size_t i = lo; i < hi; ++i) {
        if (options.exclude_interpolated && samples[i].interpolated) continue;
        idx.push_back(i);
    }
    if (idx.empty()) {
        throw EmptyWindowError("boat " + std::to_string(series.boat_id) +
                               " has no samples in the window");
    }

    WindowStat st;
    st.boat_id = series.boat_id;
    st.t0 = t0;
    st.t1 = t1;
    st.ref = ref;
    st.sample_count = static_cast<int>(idx.size());

    // samples[i] runs from points[i] to points[i + 1]
    const ResampledPoint& start = series.points[idx.front()];

    CircularAccumulator headings;
    double sog_sum = 0.0;
    for (size_t i : idx) {
        const KinematicSample& s = samples[i];
        headings.add(s.heading_deg);
        sog_sum += s.sog_kt;
        st.distance_sailed += s.distance_m;
    }
    const CircularSummary hs = headings.summary();
    st.avg_heading = hs.mean_deg;
    st.heading_std = hs.std_deg;
    st.avg_sog     = sog_sum / static_cast<double>(idx.size());

    // Net movement is summed over runs of consecutive samples so that a
    // skipped gap never counts toward displacement or height gain.
    geo::EnuOffset net;
    size_t runs = 0;
    for (size_t j = 0; j < idx.size();) {
        size_t k = j;
        while (k + 1 < idx.size() && idx[k + 1] == idx[k] + 1) ++k;
        const ResampledPoint& a = series.points[idx[j]];
        const KinematicSample& b = samples[idx[k]];
        st.displacement += geo::haversine_m(a.lat, a.lon, b.lat, b.lon);
        const geo::EnuOffset d = geo::enu_offset(a.lat, a.lon, b.lat, b.lon);
        net.east_m  += d.east_m;
        net.north_m += d.north_m;
        ++runs;
        j = k + 1;
    }

    const std::optional<double> twd = series.wind.twd_deg;

    std::optional<double> ref_bearing;
    if (ref == RefMode::TWD) {
        ref_bearing = twd;
    } else if (mark) {
        ref_bearing = geo::initial_bearing_deg(start.lat, start.lon, mark->lat, mark->lon);
    } else if (runs == 1 && st.displacement > kMinCourseLegM) {
        const KinematicSample& end = samples[idx.back()];
        ref_bearing = geo::initial_bearing_deg(start.lat, start.lon, end.lat, end.lon);
    } else if (runs > 1 && std::hypot(net.east_m, net.north_m) > kMinCourseLegM) {
        ref_bearing = geo::wrap360(geo::rad2deg(std::atan2(net.east_m, net.north_m)));
    }

    if (ref_bearing) {
        double vmg_sum = 0.0;
        for (size_t i : idx) {
            const double rel = geo::deg2rad(geo::wrap180(samples[i].heading_deg - *ref_bearing));
            vmg_sum += samples[i].sog_kt * std::cos(rel);
        }
        st.avg_vmg = vmg_sum / static_cast<double>(idx.size());
    }

    if (twd) st.height_gain = geo::project_on_bearing(net, *twd);

    auto ev_by_time = [](const Event& e, int64_t t) { return e.t < t; };
    auto e_lo = std::lower_bound(series.events.begin(), series.events.end(), t0, ev_by_time);
    auto e_hi = std::lower_bound(series.events.begin(), series.events.end(), t1, ev_by_time);
    for (auto it = e_lo; it != e_hi; ++it) {
        switch (it->type) {
            case EventType::TACK:     st.tack_count++;     break;
            case EventType::GYBE:     st.gybe_count++;     break;
            case EventType::MANEUVER: st.maneuver_count++; break;
        }
    }

    if (!twd) {
        st.wind_fallback = true;
        st.tack_count = st.maneuver_count;
        st.gybe_count = st.maneuver_count;
    }
    return st;
}

QueryResult WindowAggregator::query(const std::vector<BoatId>& boat_ids,
                                    int64_t t0, int64_t t1, RefMode ref,
                                    std::optional<int> leg_id,
                                    const QueryOptions& options) const {
    if (t0 >= t1) {
        throw std::invalid_argument("window start must precede window end");
    }
    if (ref == RefMode::COURSE && leg_id && !find_mark(*leg_id)) {
        throw std::invalid_argument("unknown leg mark " + std::to_string(*leg_id));
    }

    QueryResult result;
    for (BoatId id : unique_in_order(boat_ids)) {
        SeriesPtr series = cache_.find(id);
        if (!series) {
            result.skipped.push_back({id, "boat has not been ingested"});
            continue;
        }
        try {
            result.stats.push_back(compute(*series, t0, t1, ref, leg_id, options));
        } catch (const EmptyWindowError& e) {
            std::cerr << "[WindowAggregator] Skipping boat " << id << ": " << e.what() << "\n";
            result.skipped.push_back({id, "no data in the requested window"});
        }
    }
    return result;
}

CompareResult WindowAggregator::compare(BoatId reference, const std::vector<BoatId>& targets,
                                        int64_t t0, int64_t t1, RefMode ref,
                                        std::optional<int> leg_id) const {
    std::vector<BoatId> ids{reference};
    ids.insert(ids.end(), targets.begin(), targets.end());
    QueryResult q = query(ids, t0, t1, ref, leg_id);

    auto lookup = [&q](BoatId id) -> const WindowStat* {
        for (const auto& s : q.stats) {
            if (s.boat_id == id) return &s;
        }
        return nullptr;
    };

    const WindowStat* base = lookup(reference);
    if (!base) {
        throw EmptyWindowError("reference boat " + std::to_string(reference) +
                               " has no data in the window");
    }

    CompareResult out;
    out.skipped = q.skipped;
    for (BoatId target : unique_in_order(targets)) {
        const WindowStat* s = lookup(target);
        if (!s) continue;

        CompareRow row;
        row.reference_boat = reference;
        row.target_boat    = target;
        row.delta_sog      = s->avg_sog - base->avg_sog;
        if (s->avg_vmg && base->avg_vmg) row.delta_vmg = *s->avg_vmg - *base->avg_vmg;
        if (s->height_gain && base->height_gain) {
            row.delta_height = *s->height_gain - *base->height_gain;
        }
        out.rows.push_back(row);
    }
    return out;
}

std::vector<BoatTrack> WindowAggregator::tracks(const std::vector<BoatId>& boat_ids,
                                                std::optional<int64_t> t0,
                                                std::optional<int64_t> t1,
                                                int step) const {
    if (step != 1 && step != 5) {
        throw std::invalid_argument("unsupported downsample interval");
    }

    std::vector<BoatTrack> out;
    for (BoatId id : unique_in_order(boat_ids)) {
        SeriesPtr series = cache_.find(id);
        if (!series) continue;

        BoatTrack track;
        track.boat_id = id;
        int n = 0;
        for (const auto& p : series->points) {
            if (t0 && p.t < *t0) continue;
            if (t1 && p.t >= *t1) break;
            if (n++ % step == 0) track.points.push_back(p);
        }
        out.push_back(std::move(track));
    }
    return out;
}

std::vector<Event> WindowAggregator::events(const std::vector<BoatId>& boat_ids,
                                            std::optional<int64_t> t0,
                                            std::optional<int64_t> t1,
                                            std::optional<EventType> type) const {
    std::vector<Event> out;
    for (BoatId id : unique_in_order(boat_ids)) {
        SeriesPtr series = cache_.find(id);
        if (!series) continue;
        for (const auto& e : series->events) {
            if (t0 && e.t < *t0) continue;
            if (t1 && e.t >= *t1) break;
            if (type && e.type != *type) continue;
            out.push_back(e);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const Event& a, const Event& b) { return a.t < b.t; });
    return out;
}

std::optional<std::pair<int64_t, int64_t>> WindowAggregator::coverage(BoatId boat_id) const {
    SeriesPtr series = cache_.find(boat_id);
    if (!series || series->samples.empty()) return std::nullopt;
    return std::make_pair(series->samples.front().t, series->samples.back().t + 1);
}

}  // namespace regatta
