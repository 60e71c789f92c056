#include "config.hpp"
#include <cmath>

namespace flightsim {

Environment::Environment()
    : planet(CelestialBody::fromSurfaceGravity("Planet", 9.81, 600000.0)),
      moon(CelestialBody::fromSurfaceGravity("Moon", 1.63, 200000.0)),
      moon_orbit_radius(12000000.0),
      moon_orbital_period(0.0),
      atmosphere_height(70000.0),
      rho0(1.225),
      scale_height(7000.0),
      drag_factor(0.2),
      parachute_area_multiplier(2000.0) {
}

double Environment::moonOrbitalPeriod() const {
    if (moon_orbital_period > 0.0) return moon_orbital_period;
    return circularPeriod(moon_orbit_radius, planet.mu);
}

double Environment::moonSoiRadius() const {
    return moon_orbit_radius * std::pow(moon.mu / planet.mu, 2.0 / 5.0);
}

double Environment::circularPeriod(double orbit_radius, double mu) {
    return 2.0 * M_PI * std::sqrt(orbit_radius * orbit_radius * orbit_radius / mu);
}

SimConfig::SimConfig()
    : base_time_step(0.05), substeps(10), max_time_warp(100.0),
      inertia_factor(10.0), min_inertia(100.0), min_mass(1.0),
      manual_torque(10000.0), stability_gain(2.0), sas_kp(20000.0), sas_kd(20000.0), sas_min_speed(1.0),
      throttle_epsilon(1e-6), min_supply_ratio(0.01),
      drag_min_speed(0.1),
      impact_speed(10.0), rest_speed(1.0), min_flight_altitude(50.0),
      separation_speed(1.0), debris_mass(1000.0),
      launch_altitude(0.0) {
}

namespace validation {

std::vector<std::string> getConfigErrors(const SimConfig& config) {
    std::vector<std::string> errors;
    const Environment& env = config.env;

    if (env.planet.mu <= 0.0) errors.push_back("Planet gravitational parameter must be positive");
    if (env.planet.radius <= 0.0) errors.push_back("Planet radius must be positive");
    if (env.moon.mu <= 0.0) errors.push_back("Moon gravitational parameter must be positive");
    if (env.moon.radius <= 0.0) errors.push_back("Moon radius must be positive");
    if (env.moon_orbit_radius <= env.planet.radius + env.moon.radius) {
        errors.push_back("Moon orbit radius must clear both bodies");
    }
    if (env.moon_orbital_period < 0.0) errors.push_back("Moon orbital period must not be negative");
    if (env.atmosphere_height < 0.0) errors.push_back("Atmosphere height must not be negative");
    if (env.scale_height <= 0.0) errors.push_back("Scale height must be positive");
    if (env.rho0 < 0.0) errors.push_back("Sea level density must not be negative");

    if (config.base_time_step <= 0.0) errors.push_back("Base time step must be positive");
    if (config.substeps < 1) errors.push_back("Substep count must be at least 1");
    if (config.max_time_warp < 1.0) errors.push_back("Max time warp must be at least 1");
    if (config.min_inertia <= 0.0) errors.push_back("Minimum inertia must be positive");
    if (config.min_mass <= 0.0) errors.push_back("Minimum mass must be positive");
    if (config.impact_speed <= 0.0) errors.push_back("Impact speed must be positive");
    if (config.rest_speed <= 0.0) errors.push_back("Rest speed must be positive");
    if (config.debris_mass <= 0.0) errors.push_back("Debris mass must be positive");
    if (config.launch_altitude < 0.0) errors.push_back("Launch altitude must not be negative");

    return errors;
}

bool validateConfig(const SimConfig& config) {
    return getConfigErrors(config).empty();
}

} // namespace validation

} // namespace flightsim
