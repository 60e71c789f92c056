#include "flightsim/environment/gravity.hpp"
#include <cmath>

namespace flightsim {
namespace environment {

namespace {
double moon_phase(const Environment &env, double t) {
    return 2.0 * M_PI * t / env.moonOrbitalPeriod();
}
} // namespace

Vec2 moon_position(const Environment &env, double t) {
    double angle = moon_phase(env, t);
    return Vec2(std::cos(angle), std::sin(angle)) * env.moon_orbit_radius;
}

Vec2 moon_velocity(const Environment &env, double t) {
    double angle = moon_phase(env, t);
    double speed = 2.0 * M_PI * env.moon_orbit_radius / env.moonOrbitalPeriod();
    return Vec2(-std::sin(angle), std::cos(angle)) * speed;
}

bool is_in_moon_soi(const Vec2 &position, double t, const Environment &env) {
    return (position - moon_position(env, t)).norm() < env.moonSoiRadius();
}

Vec2 point_mass_acceleration(const Vec2 &position, const Vec2 &center, double mu) {
    Vec2 r = position - center;
    double r2 = r.squaredNorm();
    if (r2 <= 0.0) {
        return Vec2::Zero();
    }
    double r_mag = std::sqrt(r2);
    return -mu / r2 * (r / r_mag);
}

GravityField compute_gravity(const Vec2 &position, double t, const Environment &env) {
    GravityField field;
    if (is_in_moon_soi(position, t, env)) {
        field.body = ReferenceBody::MOON;
        field.body_position = moon_position(env, t);
        field.body_velocity = moon_velocity(env, t);
        field.mu = env.moon.mu;
        field.radius = env.moon.radius;
    } else {
        field.body = ReferenceBody::PLANET;
        field.body_position = Vec2::Zero();
        field.body_velocity = Vec2::Zero();
        field.mu = env.planet.mu;
        field.radius = env.planet.radius;
    }
    field.acceleration = point_mass_acceleration(position, field.body_position, field.mu);
    return field;
}

} // namespace environment
} // namespace flightsim
