#pragma once

#include "flightsim/config.hpp"
#include "flightsim/types.hpp"

namespace flightsim {
namespace environment {

// Gravity from the single body whose sphere of influence holds the craft
struct GravityField {
    Vec2 acceleration;      // [m/s²]
    ReferenceBody body;
    Vec2 body_position;     // Center of the acting body [m]
    Vec2 body_velocity;     // [m/s]
    double mu;              // [m³/s²]
    double radius;          // Surface radius [m]
};

// Moon center on its circular orbit; phase is zero at t = 0 on the +x axis
Vec2 moon_position(const Environment &env, double t);
Vec2 moon_velocity(const Environment &env, double t);

// Inside strictly: a craft exactly on the SOI boundary is under planetary gravity
bool is_in_moon_soi(const Vec2 &position, double t, const Environment &env);

// GM / |r|² toward center, zero at the center itself
Vec2 point_mass_acceleration(const Vec2 &position, const Vec2 &center, double mu);

// Patched conic: lunar gravity only inside the moon SOI, planetary gravity elsewhere
GravityField compute_gravity(const Vec2 &position, double t, const Environment &env);

} // namespace environment
} // namespace flightsim
