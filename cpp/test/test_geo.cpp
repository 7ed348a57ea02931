#include <gtest/gtest.h>
#include <cmath>
#include "geo.h"

using namespace regatta::geo;

constexpr double TOL = 1e-9;

// ============================================================================
// Test Suite: AngleWrapping
// ============================================================================

TEST(AngleWrapping, Wrap360Range) {
    EXPECT_NEAR(wrap360(0.0), 0.0, TOL);
    EXPECT_NEAR(wrap360(360.0), 0.0, TOL);
    EXPECT_NEAR(wrap360(-10.0), 350.0, TOL);
    EXPECT_NEAR(wrap360(725.0), 5.0, TOL);
    EXPECT_LT(wrap360(-1e-15), 360.0);
}

TEST(AngleWrapping, Wrap180HalfOpen) {
    EXPECT_NEAR(wrap180(180.0), 180.0, TOL);
    EXPECT_NEAR(wrap180(-180.0), 180.0, TOL);
    EXPECT_NEAR(wrap180(190.0), -170.0, TOL);
    EXPECT_NEAR(wrap180(-190.0), 170.0, TOL);
    EXPECT_NEAR(wrap180(350.0 - 10.0), -20.0, TOL);
}

// ============================================================================
// Test Suite: Haversine
// ============================================================================

TEST(Haversine, ZeroDistance) {
    EXPECT_NEAR(haversine_m(43.0, 5.0, 43.0, 5.0), 0.0, TOL);
}

TEST(Haversine, OneDegreeOfLatitude) {
    // R * pi / 180
    EXPECT_NEAR(haversine_m(0.0, 0.0, 1.0, 0.0), 111195.08, 0.05);
}

TEST(Haversine, OneNauticalMileNorthAtEquator) {
    const double one_minute = 1.0 / 60.0;
    EXPECT_NEAR(haversine_m(0.0, 0.0, one_minute, 0.0), 1853.25, 0.05);
}

TEST(Haversine, AcrossAntimeridianIsShort) {
    const double d = haversine_m(0.0, 179.999, 0.0, -179.999);
    EXPECT_NEAR(d, 222.39, 0.05);
}

// ============================================================================
// Test Suite: InitialBearing
// ============================================================================

TEST(InitialBearing, CardinalDirections) {
    EXPECT_NEAR(initial_bearing_deg(0.0, 0.0, 0.001, 0.0), 0.0, 1e-6);
    EXPECT_NEAR(initial_bearing_deg(0.0, 0.0, 0.0, 0.001), 90.0, 1e-6);
    EXPECT_NEAR(initial_bearing_deg(0.0, 0.0, -0.001, 0.0), 180.0, 1e-6);
    EXPECT_NEAR(initial_bearing_deg(0.0, 0.0, 0.0, -0.001), 270.0, 1e-6);
}

TEST(InitialBearing, EastwardAcrossAntimeridian) {
    EXPECT_NEAR(initial_bearing_deg(0.0, 179.9995, 0.0, -179.9995), 90.0, 1e-6);
}

TEST(InitialBearing, NorthEastAtMidLatitude) {
    // Equal metric north / east offsets
    const double lat0 = 45.0;
    const double dlat = 0.001;
    const double dlon = dlat / std::cos(deg2rad(lat0));
    EXPECT_NEAR(initial_bearing_deg(lat0, 0.0, lat0 + dlat, dlon), 45.0, 0.05);
}

// ============================================================================
// Test Suite: LocalTangentPlane
// ============================================================================

TEST(LocalTangentPlane, NorthOffset) {
    EnuOffset d = enu_offset(0.0, 0.0, 0.001, 0.0);
    EXPECT_NEAR(d.north_m, 111.195, 0.01);
    EXPECT_NEAR(d.east_m, 0.0, 1e-6);
}

TEST(LocalTangentPlane, EastOffset) {
    EnuOffset d = enu_offset(0.0, 0.0, 0.0, 0.001);
    EXPECT_NEAR(d.east_m, 111.195, 0.01);
    EXPECT_NEAR(d.north_m, 0.0, 1e-3);
}

TEST(LocalTangentPlane, ProjectionOnBearing) {
    EnuOffset d{100.0, 0.0};  // 100 m east
    EXPECT_NEAR(project_on_bearing(d, 90.0), 100.0, 1e-9);
    EXPECT_NEAR(project_on_bearing(d, 270.0), -100.0, 1e-9);
    EXPECT_NEAR(project_on_bearing(d, 0.0), 0.0, 1e-9);
    EXPECT_NEAR(project_on_bearing(d, 45.0), 100.0 * std::sqrt(0.5), 1e-9);
}

// ============================================================================
// Test Suite: LongitudeInterpolation
// ============================================================================

TEST(LongitudeInterpolation, PlainMidpoint) {
    EXPECT_NEAR(interpolate_lon(10.0, 20.0, 0.5), 15.0, TOL);
}

TEST(LongitudeInterpolation, ShortestPathAcrossAntimeridian) {
    // Naive lerp would give 0
    EXPECT_NEAR(std::fabs(interpolate_lon(179.0, -179.0, 0.5)), 180.0, TOL);
    EXPECT_NEAR(interpolate_lon(179.0, -179.0, 0.25), 179.5, TOL);
    EXPECT_NEAR(interpolate_lon(179.0, -179.0, 0.75), -179.5, TOL);
}

TEST(LongitudeInterpolation, ResultInRange) {
    const double lon = interpolate_lon(179.0, -179.0, 0.5);
    EXPECT_GE(lon, -180.0);
    EXPECT_LT(lon, 180.0);
}
