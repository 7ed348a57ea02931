#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// geo.h  –  Spherical Earth Helpers
//
// Haversine on a sphere of mean radius 6 371 008.8 m.  Over race-course
// distances the error against the WGS84 ellipsoid stays well under 0.5 %.
// ─────────────────────────────────────────────────────────────────────────────

namespace regatta {
namespace geo {

constexpr double kPi            = 3.14159265358979323846;
constexpr double kEarthRadiusM  = 6371008.8;
constexpr double kMetersPerNm   = 1852.0;
constexpr double kMpsToKnots    = 3600.0 / kMetersPerNm;

inline double deg2rad(double deg) { return deg * kPi / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / kPi; }

/// Wrap into [0, 360).
double wrap360(double deg);

/// Wrap into (-180, 180].
double wrap180(double deg);

/// Great-circle distance in metres.
double haversine_m(double lat1, double lon1, double lat2, double lon2);

/// Initial great-circle bearing 1 -> 2, degrees in [0, 360).
double initial_bearing_deg(double lat1, double lon1, double lat2, double lon2);

/// Point-to-point offset in the local tangent plane at (lat0, lon0).
struct EnuOffset {
    double east_m  = 0.0;
    double north_m = 0.0;
};

EnuOffset enu_offset(double lat0, double lon0, double lat, double lon);

/// Signed component of an ENU offset along a bearing.
double project_on_bearing(const EnuOffset& d, double bearing_deg);

/// Linear interpolation of longitude along the shortest arc, result in
/// [-180, 180).
double interpolate_lon(double lon0, double lon1, double alpha);

}  // namespace geo
}  // namespace regatta
