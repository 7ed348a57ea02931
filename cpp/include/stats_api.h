#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// stats_api.h  –  REST API for Window Statistics
//
// Exposes ingestion and window queries over HTTP so the dashboard (and
// anything else) can drive the pipeline.  Times are ISO-8601 UTC instants,
// boat lists are comma separated ids.
//
// Endpoints:
//   POST /api/uploads      ?boat_id&label&twd&tws&offset   body: GPX text
//   GET  /api/stats        ?boats&t0&t1&ref=twd|course&legId
//   GET  /api/export/csv   ?boats&t0&t1&ref&legId          text/csv
//   GET  /api/compare      ?reference&targets&t0&t1&ref&legId
//   GET  /api/events       ?boats&t0&t1&type
//   GET  /api/tracks       ?boats&t0&t1&downsample=1s|5s
//   GET  /api/boats        cached boats and their coverage
// ─────────────────────────────────────────────────────────────────────────────

#include "ingestor.h"
#include "window_aggregator.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

namespace httplib {
class Server;
}

namespace regatta {

class StatsApi {
public:
    StatsApi(Ingestor& ingestor, const WindowAggregator& aggregator,
             const TrackCache& cache, uint16_t port = 8080);
    ~StatsApi();

    StatsApi(const StatsApi&) = delete;
    StatsApi& operator=(const StatsApi&) = delete;

    void start();
    void stop();

private:
    Ingestor& ingestor_;
    const WindowAggregator& aggregator_;
    const TrackCache& cache_;
    uint16_t port_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    void register_routes();
    void run();
};

}  // namespace regatta
