// ─────────────────────────────────────────────────────────────────────────────
// ingestor.cpp  –  Upload Ingestion
// ─────────────────────────────────────────────────────────────────────────────

#include "ingestor.h"
#include "errors.h"
#include "geo.h"
#include "gpx_reader.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace regatta {

Ingestor::Ingestor(TrackCache& cache, const PipelineConfig& config)
    : cache_(cache), config_(config),
      resampler_(config.resampler),
      kinematics_(config.kinematics),
      detector_(config.detector) {}

// Rejects non-finite values; TWD comes back in [0, 360).
static WindReference normalised(const WindReference& wind) {
    WindReference out = wind;
    if (wind.twd_deg) {
        if (!std::isfinite(*wind.twd_deg)) {
            throw std::invalid_argument("true wind direction must be finite");
        }
        out.twd_deg = geo::wrap360(*wind.twd_deg);
    }
    if (wind.tws_kt && !std::isfinite(*wind.tws_kt)) {
        throw std::invalid_argument("true wind speed must be finite");
    }
    return out;
}

IngestResult Ingestor::ingest(BoatId boat_id,
                              const std::vector<RawFix>& raw_fixes,
                              const WindReference& wind,
                              const std::string& label,
                              double time_offset_s) {
    const WindReference wind_ref = normalised(wind);
    if (!std::isfinite(time_offset_s)) {
        throw std::invalid_argument("time offset must be finite");
    }

    ParserConfig parser_cfg = config_.parser;
    parser_cfg.time_offset_s += time_offset_s;

    ParsedTrack parsed = TrackParser(parser_cfg).parse(raw_fixes);

    auto series = std::make_shared<BoatSeries>();
    series->boat_id = boat_id;
    series->label   = label;
    series->wind    = wind_ref;
    series->points  = resampler_.resample(parsed.fixes);
    series->samples = kinematics_.derive(series->points);
    series->events  = detector_.detect(boat_id, series->samples, wind_ref);

    IngestResult result;
    result.dropped_fixes = parsed.dropped_late + parsed.dropped_duplicates;
    result.series = series;
    cache_.publish(series);

    std::ostringstream log;
    log << "[Ingestor] boat " << boat_id << ": " << series->points.size()
        << " points, " << series->events.size() << " events";
    if (result.dropped_fixes > 0) log << ", " << result.dropped_fixes << " fixes dropped";
    if (!wind_ref.twd_deg) log << " (no TWD, maneuvers undifferentiated)";
    std::cout << log.str() << "\n";
    return result;
}

IngestReport Ingestor::ingest_one(const Upload& upload) {
    IngestReport report;
    report.boat_id = upload.boat_id;
    report.source  = upload.source;

    try {
        std::vector<RawFix> fixes;
        std::string label = upload.label;
        if (!upload.gpx.empty()) {
            GpxTrack gpx = read_gpx(upload.gpx);
            fixes = std::move(gpx.fixes);
            if (label.empty()) label = gpx.name;
        } else {
            fixes = upload.fixes;
        }
        if (label.empty()) label = upload.source;

        IngestResult result = ingest(upload.boat_id, fixes, upload.wind, label,
                                     upload.time_offset_s);
        report.ok            = true;
        report.point_count   = static_cast<int>(result.series->points.size());
        report.event_count   = static_cast<int>(result.series->events.size());
        report.dropped_fixes = result.dropped_fixes;
    } catch (const TrackError& e) {
        report.ok    = false;
        report.error = e.what();
        std::cerr << "[Ingestor] Rejected " << upload.source << " (boat "
                  << upload.boat_id << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
        report.ok    = false;
        report.error = e.what();
        std::cerr << "[Ingestor] Failed on " << upload.source << " (boat "
                  << upload.boat_id << "): " << e.what() << "\n";
    }
    return report;
}

std::vector<IngestReport> Ingestor::ingest_batch(const std::vector<Upload>& uploads) {
    std::vector<IngestReport> reports(uploads.size());
    std::vector<std::thread> workers;
    workers.reserve(uploads.size());

    for (size_t i = 0; i < uploads.size(); ++i) {
        workers.emplace_back([this, &uploads, &reports, i] {
            reports[i] = ingest_one(uploads[i]);
        });
    }
    for (auto& w : workers) {
        if (w.joinable()) w.join();
    }
    return reports;
}

}  // namespace regatta
