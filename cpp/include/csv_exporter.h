#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// csv_exporter.h  –  WindowStat Table as CSV
//
// Columns (same order as the statistics table):
//   boat_id, avg_sog, avg_vmg, avg_heading, heading_std,
//   distance_sailed, height_gain, tack_count, gybe_count
//
// Precision:  SOG / VMG        2 decimals (kt)
//             heading / std    1 decimal  (deg)
//             distance_sailed  0 decimals (m)
//             height_gain      1 decimal  (m)
// Undefined values (VMG / height gain without a reference) are empty fields.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"
#include "window_aggregator.h"

#include <optional>
#include <string>
#include <vector>

namespace regatta {

struct CsvExport {
    std::string content_type = "text/csv";
    std::string filename     = "window_stats.csv";
    std::string body;
};

class CsvExporter {
public:
    static const char* header();

    static std::string row(const WindowStat& stat);

    static std::string write(const std::vector<WindowStat>& stats);
};

/// Query + CSV.  Boats without coverage are left out of the table.
CsvExport export_csv(const WindowAggregator& aggregator,
                     const std::vector<BoatId>& boat_ids,
                     int64_t t0, int64_t t1, RefMode ref,
                     std::optional<int> leg_id = std::nullopt);

}  // namespace regatta
