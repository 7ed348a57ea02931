#include <gtest/gtest.h>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include "errors.h"
#include "ingestor.h"
#include "iso_time.h"
#include "track_fixtures.h"

using namespace fixtures;
using regatta::IngestReport;
using regatta::Ingestor;
using regatta::MalformedTrackError;
using regatta::PipelineConfig;
using regatta::RawFix;
using regatta::TrackCache;
using regatta::Upload;
using regatta::WindReference;

static WindReference northerly() {
    WindReference w;
    w.twd_deg = 0.0;
    return w;
}

// Serialises fixes as a minimal GPX document.
static std::string to_gpx(const std::vector<RawFix>& fixes) {
    std::string xml = "<gpx version=\"1.1\"><trk><name>from gpx</name><trkseg>";
    for (const auto& f : fixes) {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "<trkpt lat=\"%.9f\" lon=\"%.9f\"><time>%s</time></trkpt>",
                      f.lat, f.lon, regatta::format_iso8601(f.t_ms / 1000).c_str());
        xml += buf;
    }
    xml += "</trkseg></trk></gpx>";
    return xml;
}

TEST(IngestorTest, PublishesSeries) {
    TrackCache cache;
    Ingestor ingestor(cache);
    auto result = ingestor.ingest(1, sail(upwind_legs(2)), northerly(), "FRA 1");

    auto cached = cache.find(1);
    ASSERT_NE(cached, nullptr);
    EXPECT_EQ(cached, result.series);
    EXPECT_EQ(cached->label, "FRA 1");
    EXPECT_EQ(cached->points.size(), 91u);
    EXPECT_EQ(cached->samples.size(), cached->points.size() - 1);
    EXPECT_EQ(cached->events.size(), 2u);
}

TEST(IngestorTest, FailureLeavesCacheUntouched) {
    TrackCache cache;
    Ingestor ingestor(cache);
    ingestor.ingest(1, sail({{0.0, 20}}), northerly(), "before");

    std::vector<RawFix> bad = sail({{0.0, 20}});
    bad[5].lat = 123.0;
    EXPECT_THROW(ingestor.ingest(1, bad, northerly()), MalformedTrackError);
    EXPECT_EQ(cache.find(1)->label, "before");
}

TEST(IngestorTest, SingleDistinctFixRejected) {
    TrackCache cache;
    Ingestor ingestor(cache);
    std::vector<RawFix> fixes = {{T0 * 1000, 43.0, 5.0, std::nullopt},
                                 {T0 * 1000, 43.0001, 5.0, std::nullopt}};
    // Duplicate timestamps leave a single fix
    EXPECT_THROW(ingestor.ingest(2, fixes, northerly()), MalformedTrackError);
    EXPECT_EQ(cache.find(2), nullptr);
}

TEST(IngestorTest, TimeOffsetShiftsSeries) {
    TrackCache cache;
    Ingestor ingestor(cache);
    auto result = ingestor.ingest(1, sail({{0.0, 20}}), northerly(), "", -10.0);
    EXPECT_EQ(result.series->points.front().t, T0 - 10);
}

TEST(IngestorTest, InvalidConfigRejectedUpFront) {
    TrackCache cache;
    PipelineConfig cfg;
    cfg.kinematics.smoothing_window_s = 0;
    EXPECT_THROW((Ingestor{cache, cfg}), std::invalid_argument);
}

TEST(IngestorTest, BatchReportsPerFileInOrder) {
    TrackCache cache;
    Ingestor ingestor(cache);

    std::vector<Upload> uploads(3);
    uploads[0].boat_id = 10;
    uploads[0].source  = "a.gpx";
    uploads[0].gpx     = to_gpx(sail(upwind_legs(1)));
    uploads[0].wind    = northerly();

    uploads[1].boat_id = 11;
    uploads[1].source  = "broken.gpx";
    uploads[1].gpx     = "<gpx><trk>";

    uploads[2].boat_id = 12;
    uploads[2].source  = "c.csv";
    uploads[2].label   = "ESP 3";
    uploads[2].fixes   = sail({{90.0, 30}});

    std::vector<IngestReport> reports = ingestor.ingest_batch(uploads);
    ASSERT_EQ(reports.size(), 3u);

    EXPECT_TRUE(reports[0].ok);
    EXPECT_EQ(reports[0].boat_id, 10);
    EXPECT_EQ(reports[0].point_count, 61);
    EXPECT_EQ(reports[0].event_count, 1);

    EXPECT_FALSE(reports[1].ok);
    EXPECT_EQ(reports[1].source, "broken.gpx");
    EXPECT_FALSE(reports[1].error.empty());

    EXPECT_TRUE(reports[2].ok);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.find(10)->label, "from gpx");
    EXPECT_EQ(cache.find(11), nullptr);
    EXPECT_EQ(cache.find(12)->label, "ESP 3");
}

TEST(IngestorTest, BatchLabelFallsBackToSource) {
    TrackCache cache;
    Ingestor ingestor(cache);
    Upload u;
    u.boat_id = 1;
    u.source  = "boat1.csv";
    u.fixes   = sail({{0.0, 10}});
    ingestor.ingest_batch({u});
    EXPECT_EQ(cache.find(1)->label, "boat1.csv");
}

TEST(IngestorTest, BatchSurvivesTrackSpanningCenturies) {
    TrackCache cache;
    Ingestor ingestor(cache);

    std::vector<Upload> uploads(2);
    uploads[0].boat_id = 1;
    uploads[0].source  = "good.csv";
    uploads[0].fixes   = sail({{0.0, 20}});

    uploads[1].boat_id = 2;
    uploads[1].source  = "rollover.csv";
    uploads[1].fixes   = {{0, 43.0, 5.0, std::nullopt},
                          {10000000000000LL, 43.0001, 5.0, std::nullopt}};

    std::vector<IngestReport> reports = ingestor.ingest_batch(uploads);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_TRUE(reports[0].ok);
    EXPECT_FALSE(reports[1].ok);
    EXPECT_FALSE(reports[1].error.empty());
    EXPECT_NE(cache.find(1), nullptr);
    EXPECT_EQ(cache.find(2), nullptr);
}

TEST(IngestorTest, NonFiniteWindRejected) {
    TrackCache cache;
    Ingestor ingestor(cache);

    WindReference nan_twd;
    nan_twd.twd_deg = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ingestor.ingest(1, sail({{0.0, 20}}), nan_twd), std::invalid_argument);

    WindReference inf_tws = northerly();
    inf_tws.tws_kt = std::numeric_limits<double>::infinity();
    EXPECT_THROW(ingestor.ingest(1, sail({{0.0, 20}}), inf_tws), std::invalid_argument);
    EXPECT_EQ(cache.find(1), nullptr);

    Upload u;
    u.boat_id = 3;
    u.source  = "nan.csv";
    u.fixes   = sail({{0.0, 20}});
    u.wind    = nan_twd;
    auto reports = ingestor.ingest_batch({u});
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].ok);
    EXPECT_EQ(cache.find(3), nullptr);
}

TEST(IngestorTest, WindDirectionIsWrapped) {
    TrackCache cache;
    Ingestor ingestor(cache);
    WindReference w;
    w.twd_deg = 370.0;
    ingestor.ingest(1, sail({{0.0, 20}}), w);
    ASSERT_TRUE(cache.find(1)->wind.twd_deg.has_value());
    EXPECT_NEAR(*cache.find(1)->wind.twd_deg, 10.0, 1e-9);

    w.twd_deg = -90.0;
    ingestor.ingest(2, sail({{0.0, 20}}), w);
    EXPECT_NEAR(*cache.find(2)->wind.twd_deg, 270.0, 1e-9);
}
