#pragma once

#include "flightsim/types.hpp"

namespace flightsim {
namespace guidance {

struct AttitudeParams {
    double manual_torque = 10000.0;   // N·m
    double stability_gain = 2.0;      // Damping torque = -omega * I * gain
    double kp = 20000.0;              // N·m/rad
    double kd = 20000.0;              // N·m·s/rad
    double min_speed = 1.0;           // m/s, below this prograde is undefined
};

// Headings for rotation-convention thrust (sin θ, -cos θ) aligned with / against velocity
double prograde_heading(const Vec2 &velocity);
double retrograde_heading(const Vec2 &velocity);

// Turn-left is negative torque, turn-right positive. Both held cancel out.
double compute_manual_torque(bool turn_left, bool turn_right, const AttitudeParams &p);

/**
 * @brief Automatic attitude torque for a SAS mode
 *
 * MANUAL gives zero. STABILITY damps angular velocity. PROGRADE/RETROGRADE run a PD
 * loop on the wrapped heading error and fall back to STABILITY damping when the
 * speed is at or below min_speed.
 *
 * @param mode SAS mode
 * @param rotation Current rotation [rad]
 * @param angular_velocity [rad/s]
 * @param inertia Moment of inertia [kg·m²]
 * @param velocity Velocity relative to the reference body [m/s]
 * @param p Controller gains
 * @return Torque [N·m]
 */
double compute_sas_torque(SASMode mode, double rotation, double angular_velocity, double inertia,
                          const Vec2 &velocity, const AttitudeParams &p);

} // namespace guidance
} // namespace flightsim
