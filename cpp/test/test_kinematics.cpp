#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>
#include "geo.h"
#include "kinematics.h"

using regatta::KinematicsConfig;
using regatta::KinematicsEngine;
using regatta::ResampledPoint;
using regatta::SmoothingMode;
namespace geo = regatta::geo;

static double angle_diff(double a, double b) {
    return std::fabs(geo::wrap180(a - b));
}

// 1 Hz points following the given per-second (heading, metres) steps.
static std::vector<ResampledPoint> walk(const std::vector<std::pair<double, double>>& steps,
                                        double lat = 43.0, double lon = 5.0) {
    std::vector<ResampledPoint> pts;
    int64_t t = 1000;
    pts.push_back({t, lat, lon, false});
    for (const auto& s : steps) {
        const double h = geo::deg2rad(s.first);
        lat += geo::rad2deg(s.second * std::cos(h) / geo::kEarthRadiusM);
        lon += geo::rad2deg(s.second * std::sin(h) /
                            (geo::kEarthRadiusM * std::cos(geo::deg2rad(lat))));
        pts.push_back({++t, lat, lon, false});
    }
    return pts;
}

static KinematicsConfig unsmoothed() {
    KinematicsConfig cfg;
    cfg.smoothing_window_s = 1;
    return cfg;
}

TEST(Kinematics, OneSamplePerSegment) {
    auto pts = walk({{0.0, 3.0}, {0.0, 3.0}, {0.0, 3.0}});
    auto samples = KinematicsEngine().derive(pts);
    ASSERT_EQ(samples.size(), 3u);
    for (size_t i = 0; i < samples.size(); ++i) {
        EXPECT_EQ(samples[i].t, pts[i + 1].t);
        EXPECT_DOUBLE_EQ(samples[i].lat, pts[i + 1].lat);
    }
}

TEST(Kinematics, TooFewPointsGiveNothing) {
    EXPECT_TRUE(KinematicsEngine().derive({}).empty());
    EXPECT_TRUE(KinematicsEngine().derive({{0, 43.0, 5.0, false}}).empty());
}

TEST(Kinematics, NorthwardHeadingAndSpeed) {
    auto pts = walk({{0.0, 3.0}, {0.0, 3.0}});
    auto samples = KinematicsEngine(unsmoothed()).derive(pts);
    for (const auto& s : samples) {
        EXPECT_LT(angle_diff(s.heading_deg, 0.0), 1e-3);
        EXPECT_NEAR(s.distance_m, 3.0, 1e-3);
        EXPECT_NEAR(s.sog_kt, 3.0 * geo::kMpsToKnots, 1e-3);
        EXPECT_GE(s.heading_deg, 0.0);
        EXPECT_LT(s.heading_deg, 360.0);
    }
}

TEST(Kinematics, WindowOfOneIsRaw) {
    auto pts = walk({{10.0, 2.0}, {80.0, 4.0}, {200.0, 1.0}, {300.0, 5.0}});
    auto samples = KinematicsEngine(unsmoothed()).derive(pts);
    for (const auto& s : samples) {
        EXPECT_NEAR(s.sog_kt, s.raw_sog_kt, 1e-9);
        EXPECT_LT(angle_diff(s.heading_deg, s.raw_heading_deg), 1e-9);
    }
}

TEST(Kinematics, MovingAverageOfSpeed) {
    auto pts = walk({{0.0, 2.0}, {0.0, 4.0}, {0.0, 6.0}});
    KinematicsConfig cfg;
    cfg.smoothing_window_s = 2;
    auto samples = KinematicsEngine(cfg).derive(pts);
    ASSERT_EQ(samples.size(), 3u);
    const double k = geo::kMpsToKnots;
    EXPECT_NEAR(samples[0].sog_kt, 2.0 * k, 1e-3);
    EXPECT_NEAR(samples[1].sog_kt, 3.0 * k, 1e-3);
    EXPECT_NEAR(samples[2].sog_kt, 5.0 * k, 1e-3);
}

TEST(Kinematics, HeadingSmoothingIsCircular) {
    // 350 then 10 must average to north, never to 180
    auto pts = walk({{350.0, 3.0}, {10.0, 3.0}});
    KinematicsConfig cfg;
    cfg.smoothing_window_s = 2;
    auto samples = KinematicsEngine(cfg).derive(pts);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_LT(angle_diff(samples[1].heading_deg, 0.0), 0.1);
}

TEST(Kinematics, ExponentialSnapsThenBlends) {
    auto pts = walk({{0.0, 2.0}, {0.0, 6.0}});
    KinematicsConfig cfg;
    cfg.smoothing_window_s = 3;
    cfg.mode = SmoothingMode::EXPONENTIAL;
    auto samples = KinematicsEngine(cfg).derive(pts);
    ASSERT_EQ(samples.size(), 2u);

    const double alpha = 2.0 / (3.0 + 1.0);
    EXPECT_NEAR(samples[0].sog_kt, samples[0].raw_sog_kt, 1e-9);
    EXPECT_NEAR(samples[1].sog_kt,
                alpha * samples[1].raw_sog_kt + (1.0 - alpha) * samples[0].raw_sog_kt, 1e-9);
}

TEST(Kinematics, StationaryHoldsPreviousHeading) {
    auto pts = walk({{90.0, 3.0}, {90.0, 3.0}, {0.0, 0.0}, {0.0, 0.0}});
    auto samples = KinematicsEngine(unsmoothed()).derive(pts);
    ASSERT_EQ(samples.size(), 4u);
    EXPECT_LT(angle_diff(samples[2].raw_heading_deg, 90.0), 1e-3);
    EXPECT_LT(angle_diff(samples[3].raw_heading_deg, 90.0), 1e-3);
    EXPECT_NEAR(samples[3].sog_kt, 0.0, 1e-9);
}

TEST(Kinematics, InterpolatedFlagCarriesToSegment) {
    auto pts = walk({{0.0, 3.0}, {0.0, 3.0}, {0.0, 3.0}});
    pts[2].interpolated = true;
    auto samples = KinematicsEngine().derive(pts);
    EXPECT_FALSE(samples[0].interpolated);
    EXPECT_TRUE(samples[1].interpolated);
    EXPECT_TRUE(samples[2].interpolated);
}

TEST(Kinematics, LoggedSpeedWinsOverDerived) {
    auto pts = walk({{0.0, 3.0}, {0.0, 3.0}, {0.0, 3.0}});
    pts[2].speed_mps = 5.0;
    auto samples = KinematicsEngine(unsmoothed()).derive(pts);
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_NEAR(samples[0].raw_sog_kt, 3.0 * geo::kMpsToKnots, 1e-3);
    EXPECT_DOUBLE_EQ(samples[1].raw_sog_kt, 5.0 * geo::kMpsToKnots);
    EXPECT_NEAR(samples[2].raw_sog_kt, 3.0 * geo::kMpsToKnots, 1e-3);
    // Distance still comes from positions
    EXPECT_NEAR(samples[1].distance_m, 3.0, 1e-3);
}

TEST(Kinematics, DerivedSpeedWhenLoggedIsDisabled) {
    auto pts = walk({{0.0, 3.0}, {0.0, 3.0}});
    pts[1].speed_mps = 5.0;
    KinematicsConfig cfg = unsmoothed();
    cfg.prefer_device_sog = false;
    auto samples = KinematicsEngine(cfg).derive(pts);
    EXPECT_NEAR(samples[0].raw_sog_kt, 3.0 * geo::kMpsToKnots, 1e-3);
}

TEST(Kinematics, InvalidWindowThrows) {
    KinematicsConfig cfg;
    cfg.smoothing_window_s = 0;
    EXPECT_THROW(KinematicsEngine{cfg}, std::invalid_argument);
}
