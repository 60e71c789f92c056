#pragma once

#include "flightsim/config.hpp"
#include "flightsim/types.hpp"
#include <memory>
#include <vector>

namespace flightsim {
namespace environment {

/**
 * @brief Atmospheric density model interface
 */
class Atmosphere {
public:
    virtual ~Atmosphere() = default;

    /**
     * @brief Compute density at given altitude
     * @param altitude Altitude above the planet surface [m]
     * @return Density [kg/m³]
     */
    virtual double computeDensity(double altitude) const = 0;

    /**
     * @brief Altitude above which density is zero [m]
     */
    virtual double ceiling() const = 0;
};

/**
 * @brief Exponential atmosphere with a hard ceiling
 */
class ExponentialAtmosphere : public Atmosphere {
public:
    /**
     * @brief Constructor
     * @param rho0 Sea level density [kg/m³]
     * @param h_scale Scale height [m]
     * @param ceiling Atmosphere height [m]
     */
    ExponentialAtmosphere(double rho0 = 1.225, double h_scale = 7000.0, double ceiling = 70000.0);

    /**
     * @brief rho0 * exp(-altitude / h_scale) below the ceiling, zero at or above it
     */
    double computeDensity(double altitude) const override;

    double ceiling() const override { return ceiling_; }

private:
    double rho0_;
    double h_scale_;
    double ceiling_;
};

/**
 * @brief Create the planet's atmosphere from the environment
 * @param env Celestial setup
 * @return Shared pointer to exponential atmosphere
 */
std::shared_ptr<ExponentialAtmosphere> createExponentialAtmosphere(const Environment &env);

// Sum of width² over the parts; deployed parachutes count multiplier times their area
double effective_drag_area(const std::vector<Part> &parts, double parachute_multiplier);

// 0.5 * rho * v² * area * drag_factor against the velocity. Zero below min_speed.
Vec2 compute_drag(const Vec2 &velocity, double density, double area, double drag_factor,
                  double min_speed = 0.1);

} // namespace environment
} // namespace flightsim
