// ─────────────────────────────────────────────────────────────────────────────
// csv_exporter.cpp  –  WindowStat Table as CSV
// ─────────────────────────────────────────────────────────────────────────────

#include "csv_exporter.h"

#include <cstdio>
#include <string>

namespace regatta {

static std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

static std::string fixed(const std::optional<double>& v, int decimals) {
    return v ? fixed(*v, decimals) : std::string();
}

const char* CsvExporter::header() {
    return "boat_id,avg_sog,avg_vmg,avg_heading,heading_std,"
           "distance_sailed,height_gain,tack_count,gybe_count";
}

std::string CsvExporter::row(const WindowStat& s) {
    std::string line;
    line += std::to_string(s.boat_id);
    line += ',' + fixed(s.avg_sog, 2);
    line += ',' + fixed(s.avg_vmg, 2);
    line += ',' + fixed(s.avg_heading, 1);
    line += ',' + fixed(s.heading_std, 1);
    line += ',' + fixed(s.distance_sailed, 0);
    line += ',' + fixed(s.height_gain, 1);
    line += ',' + std::to_string(s.tack_count);
    line += ',' + std::to_string(s.gybe_count);
    return line;
}

std::string CsvExporter::write(const std::vector<WindowStat>& stats) {
    std::string out = header();
    out += '\n';
    for (const auto& s : stats) {
        out += row(s);
        out += '\n';
    }
    return out;
}

CsvExport export_csv(const WindowAggregator& aggregator,
                     const std::vector<BoatId>& boat_ids,
                     int64_t t0, int64_t t1, RefMode ref,
                     std::optional<int> leg_id) {
    QueryResult q = aggregator.query(boat_ids, t0, t1, ref, leg_id);
    CsvExport out;
    out.body = CsvExporter::write(q.stats);
    return out;
}

}  // namespace regatta
