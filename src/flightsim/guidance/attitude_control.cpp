#include "flightsim/guidance/attitude_control.hpp"
#include "flightsim/utils.hpp"
#include <cmath>

namespace flightsim {
namespace guidance {

double prograde_heading(const Vec2 &velocity) {
    return std::atan2(velocity.y(), velocity.x()) + M_PI / 2.0;
}

double retrograde_heading(const Vec2 &velocity) {
    return std::atan2(velocity.y(), velocity.x()) - M_PI / 2.0;
}

double compute_manual_torque(bool turn_left, bool turn_right, const AttitudeParams &p) {
    double torque = 0.0;
    if (turn_left) torque -= p.manual_torque;
    if (turn_right) torque += p.manual_torque;
    return torque;
}

double compute_sas_torque(SASMode mode, double rotation, double angular_velocity, double inertia,
                          const Vec2 &velocity, const AttitudeParams &p) {
    const double damping = -angular_velocity * inertia * p.stability_gain;

    switch (mode) {
        case SASMode::MANUAL:
            return 0.0;
        case SASMode::STABILITY:
            return damping;
        case SASMode::PROGRADE:
        case SASMode::RETROGRADE: {
            if (velocity.norm() <= p.min_speed) {
                return damping;
            }
            double target = mode == SASMode::PROGRADE ? prograde_heading(velocity)
                                                      : retrograde_heading(velocity);
            double error = math::wrapAngle(target - rotation);
            return p.kp * error - p.kd * angular_velocity;
        }
    }
    return 0.0;
}

} // namespace guidance
} // namespace flightsim
