// ─────────────────────────────────────────────────────────────────────────────
// kinematics.cpp  –  Heading & SOG with Circular-Safe Smoothing
// ─────────────────────────────────────────────────────────────────────────────

#include "kinematics.h"
#include "geo.h"

#include <cmath>
#include <deque>
#include <stdexcept>

namespace regatta {

namespace {

struct Components {
    double sin_h = 0.0;
    double cos_h = 0.0;
    double sog   = 0.0;
};

// Causal filter over heading unit vectors and SOG.
class Smoother {
public:
    Smoother(SmoothingMode mode, int window)
        : mode_(mode), window_(static_cast<size_t>(window)),
          alpha_(2.0 / (static_cast<double>(window) + 1.0)) {}

    Components push(const Components& c) {
        if (mode_ == SmoothingMode::EXPONENTIAL) {
            if (!primed_) {
                // First sample – snap
                state_ = c;
                primed_ = true;
            } else {
                state_.sin_h = alpha_ * c.sin_h + (1.0 - alpha_) * state_.sin_h;
                state_.cos_h = alpha_ * c.cos_h + (1.0 - alpha_) * state_.cos_h;
                state_.sog   = alpha_ * c.sog   + (1.0 - alpha_) * state_.sog;
            }
            return state_;
        }

        history_.push_back(c);
        sum_.sin_h += c.sin_h;
        sum_.cos_h += c.cos_h;
        sum_.sog   += c.sog;
        if (history_.size() > window_) {
            const Components& old = history_.front();
            sum_.sin_h -= old.sin_h;
            sum_.cos_h -= old.cos_h;
            sum_.sog   -= old.sog;
            history_.pop_front();
        }

        const double n = static_cast<double>(history_.size());
        return Components{sum_.sin_h / n, sum_.cos_h / n, sum_.sog / n};
    }

private:
    SmoothingMode mode_;
    size_t window_;
    double alpha_;

    std::deque<Components> history_;
    Components sum_;

    Components state_;
    bool primed_ = false;
};

}  // namespace

KinematicsEngine::KinematicsEngine(const KinematicsConfig& config) : config_(config) {
    if (config_.smoothing_window_s < 1) {
        throw std::invalid_argument("smoothing window must be at least 1 s");
    }
}

std::vector<KinematicSample> KinematicsEngine::derive(
    const std::vector<ResampledPoint>& points) const {
    std::vector<KinematicSample> out;
    if (points.size() < 2) return out;
    out.reserve(points.size() - 1);

    Smoother smoother(config_.mode, config_.smoothing_window_s);
    double held_heading = 0.0;
    bool has_heading = false;

    for (size_t i = 1; i < points.size(); ++i) {
        const ResampledPoint& a = points[i - 1];
        const ResampledPoint& b = points[i];

        KinematicSample s;
        s.t = b.t;
        s.lat = b.lat;
        s.lon = b.lon;
        s.interpolated = a.interpolated || b.interpolated;

        const double dt = static_cast<double>(b.t - a.t);
        s.distance_m = geo::haversine_m(a.lat, a.lon, b.lat, b.lon);
        if (config_.prefer_device_sog && b.speed_mps) {
            s.raw_sog_kt = *b.speed_mps * geo::kMpsToKnots;
        } else {
            s.raw_sog_kt = s.distance_m / dt * geo::kMpsToKnots;
        }

        if (s.distance_m >= config_.stationary_threshold_m || !has_heading) {
            held_heading = geo::initial_bearing_deg(a.lat, a.lon, b.lat, b.lon);
            has_heading = s.distance_m >= config_.stationary_threshold_m;
        }
        s.raw_heading_deg = held_heading;

        const double r = geo::deg2rad(s.raw_heading_deg);
        Components c = smoother.push(Components{std::sin(r), std::cos(r), s.raw_sog_kt});

        s.heading_deg = geo::wrap360(geo::rad2deg(std::atan2(c.sin_h, c.cos_h)));
        s.sog_kt = c.sog < 0.0 ? 0.0 : c.sog;
        out.push_back(s);
    }
    return out;
}

}  // namespace regatta
