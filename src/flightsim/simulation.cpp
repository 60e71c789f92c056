#include "simulation.hpp"
#include "orbital_elements.hpp"
#include "flightsim/core/collision.hpp"
#include "flightsim/core/debris.hpp"
#include "flightsim/environment/gravity.hpp"
#include "flightsim/propulsion/propulsion_resolver.hpp"
#include "flightsim/propulsion/staging.hpp"
#include "flightsim/vehicle/vehicle_tree.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace flightsim {

FlightSimulator::FlightSimulator(const SimConfig& config, std::shared_ptr<logging::Logger> logger)
    : config_(config), logger_(std::move(logger)) {
    std::vector<std::string> errors = validation::getConfigErrors(config_);
    if (!errors.empty()) {
        std::string message = "Invalid simulation config:";
        for (const auto& e : errors) {
            message += " " + e + ";";
        }
        throw std::invalid_argument(message);
    }
    dynamics_ = createDynamics(config_);
    integrator_ = createRK4Integrator(dynamics_);
    debris_integrator_ = createEulerIntegrator(dynamics_);
}

SimulationState FlightSimulator::launch(const std::vector<Part>& parts) const {
    vehicle::VehicleTree tree(parts);
    tree.validate(parts);

    SimulationState state;
    state.parts = parts;
    for (auto& p : state.parts) {
        p.is_thrusting = false;
    }
    state.body.position = Vec2(0.0, -(config_.env.planet.radius + config_.launch_altitude));

    MassProperties props = dynamics_->computeMassProperties(state.parts);
    state.forces = dynamics_->computeForces(state.body, ControlInput(), props, state.time);
    updateTelemetry(state);
    state.max_altitude = std::max(0.0, state.altitude);

    if (logger_) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << "Launch: " << state.parts.size() << " parts, mass " << props.mass << " kg, fuel "
            << utils::totalFuel(state.parts) << " kg";
        logger_->info(oss.str());
    }
    return state;
}

double FlightSimulator::tickDuration(double requested_warp) const {
    double warp = math::clamp(requested_warp, 1.0, config_.max_time_warp);
    if (warp == requested_warp) {
        warned_warp_ = 0.0;
    } else if (requested_warp != warned_warp_) {
        // Warn once per out-of-range request, not on every tick
        warned_warp_ = requested_warp;
        if (logger_) {
            logger_->warning("Time warp " + std::to_string(requested_warp) + " clamped to " +
                             std::to_string(warp));
        }
    }
    return config_.base_time_step * warp;
}

SimulationState FlightSimulator::step(const SimulationState& state, const Controls& controls) const {
    return step(state, controls, tickDuration(controls.time_warp));
}

SimulationState FlightSimulator::step(const SimulationState& state, const Controls& controls,
                                      double dt) const {
    if (!state.active || state.finished || controls.paused || dt <= 0.0) {
        return state;
    }
    dt = std::min(dt, config_.base_time_step * config_.max_time_warp);

    SimulationState next = state;
    const size_t first_event = next.events.size();
    next.throttle = math::clamp(controls.throttle, 0.0, 1.0);
    next.sas_mode = controls.sas_mode;

    core::propagate_debris(next.debris, *debris_integrator_, next.time, dt);

    propulsion::PropulsionParams prop_params;
    prop_params.throttle_epsilon = config_.throttle_epsilon;
    prop_params.min_supply_ratio = config_.min_supply_ratio;

    core::ContactParams contact;
    contact.impact_speed = config_.impact_speed;
    contact.rest_speed = config_.rest_speed;
    contact.min_flight_altitude = config_.min_flight_altitude;

    const Environment& env = config_.env;
    const double h = dt / config_.substeps;
    vehicle::VehicleTree tree(next.parts);
    ControlInput input(0.0, next.sas_mode, controls.turn_left, controls.turn_right);
    MassProperties props;

    for (int s = 0; s < config_.substeps; ++s) {
        propulsion::PropulsionResult prop =
            propulsion::PropulsionResolver::resolve(next.parts, tree, next.throttle, h, prop_params);
        props = dynamics_->computeMassProperties(next.parts);
        input.thrust = prop.thrust;

        next.body = integrator_->integrate(next.body, input, props, next.time, h);
        next.time += h;

        core::SurfaceBody surfaces[2] = {
            {env.planet.name, Vec2::Zero(), Vec2::Zero(), env.planet.radius},
            {env.moon.name, environment::moon_position(env, next.time),
             environment::moon_velocity(env, next.time), env.moon.radius}};
        for (const auto& surface : surfaces) {
            core::ContactOutcome outcome =
                core::resolve_surface_contact(next.body, surface, next.max_altitude, contact);
            if (core::is_terminal(outcome)) {
                next.events.push_back(core::contact_event(outcome, surface.name));
                next.active = false;
                next.finished = true;
                break;
            }
        }

        environment::GravityField field = environment::compute_gravity(next.body.position, next.time, env);
        double altitude = (next.body.position - field.body_position).norm() - field.radius;
        next.max_altitude = std::max(next.max_altitude, altitude);

        if (next.finished) {
            break;
        }
    }

    next.forces = dynamics_->computeForces(next.body, input, props, next.time);

    if (!next.finished) {
        if (controls.stage) {
            propulsion::StagingLogic::perform_stage(next, config_.separation_speed);
        }
        if (controls.deploy_parachutes && propulsion::StagingLogic::deploy_parachutes(next.parts) > 0) {
            next.events.push_back("Parachutes deployed");
        }
    }

    updateTelemetry(next);
    logEvents(next, first_event);

    if (logger_ && logger_->isEnabled(logging::LogLevel::DEBUG)) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "t=" << next.time << " alt=" << next.altitude << " v=" << next.velocity_mag
            << " fuel=" << utils::totalFuel(next.parts) << " thrust=" << next.forces.thrust.norm();
        logger_->debug(oss.str());
    }
    return next;
}

void FlightSimulator::updateTelemetry(SimulationState& state) const {
    const Environment& env = config_.env;
    environment::GravityField field = environment::compute_gravity(state.body.position, state.time, env);

    Vec2 r = state.body.position - field.body_position;
    Vec2 v = state.body.velocity - field.body_velocity;
    double distance = r.norm();
    Vec2 up = math::safeNormalized(r);
    Vec2 east(-up.y(), up.x());

    state.reference_body = field.body;
    state.moon_position = environment::moon_position(env, state.time);
    state.altitude = distance - field.radius;
    state.velocity_mag = v.norm();
    state.vertical_velocity = v.dot(up);
    state.horizontal_velocity = v.dot(east);

    double mass = std::max(utils::totalMass(state.parts), config_.min_mass);
    state.acceleration = state.forces.total().norm() / mass;

    OrbitalElements elements = computeOrbitalElements(r, v, field.mu, field.radius);
    state.semi_major_axis = elements.semi_major_axis;
    state.eccentricity = elements.eccentricity;
    state.apoapsis = elements.apoapsis;
    state.periapsis = elements.periapsis;
}

void FlightSimulator::logEvents(const SimulationState& state, size_t first) const {
    if (!logger_) return;
    for (size_t i = first; i < state.events.size(); ++i) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "[T+" << state.time << "s] " << state.events[i];
        logger_->info(oss.str());
    }
}

SimulationState step(const SimulationState& state, const Controls& controls, double dt,
                     const SimConfig& config) {
    return FlightSimulator(config).step(state, controls, dt);
}

} // namespace flightsim
