#pragma once

#include "types.hpp"

namespace flightsim {

/**
 * @brief Planar two-body orbit of the craft about its reference body
 *
 * Apoapsis and periapsis are altitudes above the body's surface [m]. Apoapsis is
 * +infinity for escape trajectories (eccentricity >= 1).
 */
struct OrbitalElements {
    double semi_major_axis;     // [m], +infinity for a parabolic trajectory
    double eccentricity;
    double apoapsis;            // [m]
    double periapsis;           // [m]
    double specific_energy;     // v²/2 - mu/r [J/kg]
    double angular_momentum;    // x*vy - y*vx [m²/s]

    OrbitalElements() : semi_major_axis(0.0), eccentricity(0.0), apoapsis(0.0), periapsis(0.0),
                        specific_energy(0.0), angular_momentum(0.0) {}

    bool isBound() const { return eccentricity < 1.0; }
};

/**
 * @brief Compute orbital elements from relative state
 * @param position Position relative to the body center [m]
 * @param velocity Velocity relative to the body [m/s]
 * @param mu Gravitational parameter [m³/s²]
 * @param body_radius Surface radius for altitude conversion [m]
 * @return Elements, all zero at the body center
 */
OrbitalElements computeOrbitalElements(const Vec2& position, const Vec2& velocity,
                                       double mu, double body_radius);

} // namespace flightsim
