#include "dynamics.hpp"
#include "utils.hpp"
#include "flightsim/environment/gravity.hpp"
#include <algorithm>
#include <cmath>

namespace flightsim {

Dynamics::Dynamics(const SimConfig& config)
    : config_(config), atmosphere_(environment::createExponentialAtmosphere(config.env)) {
    attitude_.manual_torque = config.manual_torque;
    attitude_.stability_gain = config.stability_gain;
    attitude_.kp = config.sas_kp;
    attitude_.kd = config.sas_kd;
    attitude_.min_speed = config.sas_min_speed;
}

StateVector Dynamics::computeDerivative(const StateVector& x, const ControlInput& control,
                                        const MassProperties& props, double t) const {
    BodyState state;
    state.fromVector(x);

    ForceBreakdown forces = computeForces(state, control, props, t);
    double torque = computeTorque(state, control, props, t);

    StateVector x_dot;
    x_dot.segment<2>(0) = state.velocity;
    x_dot.segment<2>(2) = forces.total() / props.mass;
    x_dot(4) = state.angular_velocity;
    x_dot(5) = torque / props.inertia;
    return x_dot;
}

ForceBreakdown Dynamics::computeForces(const BodyState& state, const ControlInput& control,
                                       const MassProperties& props, double t) const {
    ForceBreakdown forces;

    environment::GravityField field = environment::compute_gravity(state.position, t, config_.env);
    forces.gravity = field.acceleration * props.mass;

    // The atmosphere belongs to the planet, which is fixed at the origin
    double altitude = state.position.norm() - config_.env.planet.radius;
    double density = atmosphere_->computeDensity(altitude);
    forces.drag = environment::compute_drag(state.velocity, density, props.drag_area,
                                            config_.env.drag_factor, config_.drag_min_speed);

    forces.thrust = control.thrust * math::headingVector(state.rotation);
    return forces;
}

double Dynamics::computeTorque(const BodyState& state, const ControlInput& control,
                               const MassProperties& props, double t) const {
    environment::GravityField field = environment::compute_gravity(state.position, t, config_.env);
    Vec2 relative_velocity = state.velocity - field.body_velocity;

    double torque = guidance::compute_manual_torque(control.turn_left, control.turn_right, attitude_);
    torque += guidance::compute_sas_torque(control.sas_mode, state.rotation, state.angular_velocity,
                                           props.inertia, relative_velocity, attitude_);
    return torque;
}

MassProperties Dynamics::computeMassProperties(const std::vector<Part>& parts) const {
    MassProperties props;
    double mass = utils::totalMass(parts);
    props.mass = std::max(mass, config_.min_mass);
    props.inertia = std::max(mass * config_.inertia_factor, config_.min_inertia);
    props.drag_area = environment::effective_drag_area(parts, config_.env.parachute_area_multiplier);
    return props;
}

std::shared_ptr<Dynamics> createDynamics(const SimConfig& config) {
    return std::make_shared<Dynamics>(config);
}

} // namespace flightsim
