#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// ingestor.h  –  Upload Ingestion
//
// Runs Parser -> Resampler -> Kinematics -> Event Detector for one boat and
// publishes the result to the TrackCache.  Batches run one worker thread per
// upload; a failing file is reported and never aborts the others.
// ─────────────────────────────────────────────────────────────────────────────

#include "event_detector.h"
#include "kinematics.h"
#include "resampler.h"
#include "track_cache.h"
#include "track_parser.h"
#include "track_types.h"

#include <string>
#include <vector>

namespace regatta {

struct PipelineConfig {
    ParserConfig     parser;
    ResamplerConfig  resampler;
    KinematicsConfig kinematics;
    DetectorConfig   detector;
};

struct IngestResult {
    SeriesPtr series;     // points, samples, events as cached
    int dropped_fixes = 0;
};

/// One file of a multi-file upload.  GPX text wins over raw fixes.
struct Upload {
    BoatId        boat_id = 0;
    std::string   label;
    std::string   source;           // file name, for reporting
    std::string   gpx;
    std::vector<RawFix> fixes;
    WindReference wind;
    double        time_offset_s = 0.0;
};

struct IngestReport {
    BoatId      boat_id = 0;
    std::string source;
    bool        ok = false;
    std::string error;
    int point_count   = 0;
    int event_count   = 0;
    int dropped_fixes = 0;
};

class Ingestor {
public:
    /// Throws std::invalid_argument for an unusable configuration.
    Ingestor(TrackCache& cache, const PipelineConfig& config = PipelineConfig());

    /// Throws MalformedTrackError / EmptyTrackError, or std::invalid_argument
    /// for a non-finite wind; the cache is untouched on failure.  TWD is
    /// stored wrapped to [0, 360).
    IngestResult ingest(BoatId boat_id,
                        const std::vector<RawFix>& raw_fixes,
                        const WindReference& wind,
                        const std::string& label = std::string(),
                        double time_offset_s = 0.0);

    /// Parallel; reports keep the upload order.
    std::vector<IngestReport> ingest_batch(const std::vector<Upload>& uploads);

    const PipelineConfig& config() const { return config_; }

private:
    IngestReport ingest_one(const Upload& upload);

    TrackCache& cache_;
    PipelineConfig config_;
    Resampler        resampler_;
    KinematicsEngine kinematics_;
    EventDetector    detector_;
};

}  // namespace regatta
