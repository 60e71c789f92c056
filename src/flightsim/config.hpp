#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace flightsim {

/**
 * @brief Gravitating body parameters
 */
struct CelestialBody {
    std::string name;
    double mu;          // Gravitational parameter GM [m³/s²]
    double radius;      // Surface radius [m]

    CelestialBody() : mu(0.0), radius(0.0) {}
    CelestialBody(const std::string& n, double gm, double r) : name(n), mu(gm), radius(r) {}

    // GM from surface gravity and radius
    static CelestialBody fromSurfaceGravity(const std::string& n, double g, double r) {
        return CelestialBody(n, g * r * r, r);
    }
};

/**
 * @brief Celestial setup and atmosphere
 *
 * The planet sits fixed at the origin. The moon moves on a circular orbit whose
 * phase is a pure function of mission time.
 */
struct Environment {
    CelestialBody planet;
    CelestialBody moon;
    double moon_orbit_radius;           // [m]
    double moon_orbital_period;         // [s], 0 derives it from the orbit radius

    // Atmosphere (planet only)
    double atmosphere_height;           // Ceiling [m]
    double rho0;                        // Sea level density [kg/m³]
    double scale_height;                // [m]
    double drag_factor;                 // Global drag coefficient
    double parachute_area_multiplier;   // Cross-section multiplier for deployed chutes

    Environment();

    /**
     * @brief Sphere of influence radius of the moon
     * @return orbitRadius * (GM_moon / GM_planet)^(2/5) [m]
     */
    double moonSoiRadius() const;

    /**
     * @brief Moon orbital period in effect [s]
     * @return moon_orbital_period when set, otherwise the circular period around the planet
     */
    double moonOrbitalPeriod() const;

    /**
     * @brief Circular orbital period from Kepler's third law [s]
     */
    static double circularPeriod(double orbit_radius, double mu);
};

/**
 * @brief Simulation tuning parameters
 */
struct SimConfig {
    Environment env;

    // Time stepping
    double base_time_step;      // Tick length at 1x warp [s]
    int substeps;               // Integration substeps per tick
    double max_time_warp;

    // Mass properties
    double inertia_factor;      // I = sum(m) * factor
    double min_inertia;         // [kg·m²]
    double min_mass;            // [kg]

    // Attitude control
    double manual_torque;       // [N·m] while a turn key is held
    double stability_gain;      // Damping torque = -omega * I * gain
    double sas_kp;
    double sas_kd;
    double sas_min_speed;       // Below this prograde is undefined [m/s]

    // Propulsion
    double throttle_epsilon;
    double min_supply_ratio;    // Below this an engine shows no thrust

    // Drag
    double drag_min_speed;      // [m/s]

    // Collisions
    double impact_speed;        // Inward radial speed above which contact is a crash [m/s]
    double rest_speed;          // [m/s]
    double min_flight_altitude; // Max altitude needed before a rest counts as landing [m]

    // Staging and debris
    double separation_speed;    // Debris push-off along -heading [m/s]
    double debris_mass;         // Nominal debris mass for drag [kg]

    double launch_altitude;     // Pad height above the surface below the origin [m]

    SimConfig();
};

namespace validation {

    /**
     * @brief Get configuration problems
     * @param config Configuration to validate
     * @return Vector of error messages, empty when valid
     */
    std::vector<std::string> getConfigErrors(const SimConfig& config);

    /**
     * @brief Validate configuration
     * @return True if configuration is usable
     */
    bool validateConfig(const SimConfig& config);

} // namespace validation

} // namespace flightsim
