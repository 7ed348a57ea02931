// ─────────────────────────────────────────────────────────────────────────────
// geo.cpp  –  Spherical Earth Helpers
// ─────────────────────────────────────────────────────────────────────────────

#include "geo.h"

#include <algorithm>
#include <cmath>

namespace regatta {
namespace geo {

double wrap360(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) r += 360.0;
    // -1e-15 + 360 rounds to 360
    if (r >= 360.0) r -= 360.0;
    return r;
}

double wrap180(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r <= -180.0) r += 360.0;
    if (r > 180.0) r -= 360.0;
    return r;
}

double haversine_m(double lat1, double lon1, double lat2, double lon2) {
    const double p1 = deg2rad(lat1);
    const double p2 = deg2rad(lat2);
    const double dp = p2 - p1;
    const double dl = deg2rad(wrap180(lon2 - lon1));

    const double s1 = std::sin(dp * 0.5);
    const double s2 = std::sin(dl * 0.5);
    double a = s1 * s1 + std::cos(p1) * std::cos(p2) * s2 * s2;
    a = std::min(1.0, std::max(0.0, a));
    return 2.0 * kEarthRadiusM * std::asin(std::sqrt(a));
}

double initial_bearing_deg(double lat1, double lon1, double lat2, double lon2) {
    const double p1 = deg2rad(lat1);
    const double p2 = deg2rad(lat2);
    const double dl = deg2rad(wrap180(lon2 - lon1));

    const double y = std::sin(dl) * std::cos(p2);
    const double x = std::cos(p1) * std::sin(p2) -
                     std::sin(p1) * std::cos(p2) * std::cos(dl);
    return wrap360(rad2deg(std::atan2(y, x)));
}

EnuOffset enu_offset(double lat0, double lon0, double lat, double lon) {
    const double p0 = deg2rad(lat0), l0 = deg2rad(lon0);
    const double p  = deg2rad(lat),  l  = deg2rad(lon);

    // Unit-sphere ECEF chord from origin to point
    const double dx = std::cos(p) * std::cos(l) - std::cos(p0) * std::cos(l0);
    const double dy = std::cos(p) * std::sin(l) - std::cos(p0) * std::sin(l0);
    const double dz = std::sin(p) - std::sin(p0);

    EnuOffset out;
    out.east_m  = kEarthRadiusM * (-std::sin(l0) * dx + std::cos(l0) * dy);
    out.north_m = kEarthRadiusM * (-std::sin(p0) * std::cos(l0) * dx -
                                   std::sin(p0) * std::sin(l0) * dy +
                                   std::cos(p0) * dz);
    return out;
}

double project_on_bearing(const EnuOffset& d, double bearing_deg) {
    const double b = deg2rad(bearing_deg);
    return d.north_m * std::cos(b) + d.east_m * std::sin(b);
}

double interpolate_lon(double lon0, double lon1, double alpha) {
    double lon = wrap180(lon0 + alpha * wrap180(lon1 - lon0));
    if (lon >= 180.0) lon -= 360.0;
    return lon;
}

}  // namespace geo
}  // namespace regatta
