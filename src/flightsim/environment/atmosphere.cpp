#include "flightsim/environment/atmosphere.hpp"
#include <algorithm>
#include <cmath>

namespace flightsim {
namespace environment {

ExponentialAtmosphere::ExponentialAtmosphere(double rho0, double h_scale, double ceiling)
    : rho0_(rho0), h_scale_(h_scale), ceiling_(ceiling) {
}

double ExponentialAtmosphere::computeDensity(double altitude) const {
    if (altitude >= ceiling_) {
        return 0.0;
    }
    // Below sea level (surface clamping lag) use sea level density
    return rho0_ * std::exp(-std::max(0.0, altitude) / h_scale_);
}

std::shared_ptr<ExponentialAtmosphere> createExponentialAtmosphere(const Environment &env) {
    return std::make_shared<ExponentialAtmosphere>(env.rho0, env.scale_height, env.atmosphere_height);
}

double effective_drag_area(const std::vector<Part> &parts, double parachute_multiplier) {
    double area = 0.0;
    for (const auto &p : parts) {
        double a = p.width * p.width;
        if (p.type == PartType::PARACHUTE && p.is_deployed) {
            a *= parachute_multiplier;
        }
        area += a;
    }
    return area;
}

Vec2 compute_drag(const Vec2 &velocity, double density, double area, double drag_factor,
                  double min_speed) {
    double speed = velocity.norm();
    if (density <= 0.0 || speed <= min_speed) {
        return Vec2::Zero();
    }
    double magnitude = 0.5 * density * speed * speed * area * drag_factor;
    return -magnitude * (velocity / speed);
}

} // namespace environment
} // namespace flightsim
