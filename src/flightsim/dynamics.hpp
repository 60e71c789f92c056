#pragma once

#include "types.hpp"
#include "config.hpp"
#include "flightsim/environment/atmosphere.hpp"
#include "flightsim/guidance/attitude_control.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace flightsim {

/**
 * @brief Packed planar state [x, y, vx, vy, theta, omega]
 */
using StateVector = Eigen::Matrix<double, 6, 1>;

/**
 * @brief Mass properties held constant across one substep
 */
struct MassProperties {
    double mass;        // [kg]
    double inertia;     // [kg·m²]
    double drag_area;   // Effective cross-section [m²]

    MassProperties() : mass(0.0), inertia(0.0), drag_area(0.0) {}
    MassProperties(double m, double i, double a) : mass(m), inertia(i), drag_area(a) {}
};

/**
 * @brief Control input held constant across one substep
 */
struct ControlInput {
    double thrust;      // Resolved thrust magnitude along the heading [N]
    SASMode sas_mode;
    bool turn_left;
    bool turn_right;

    ControlInput() : thrust(0.0), sas_mode(SASMode::STABILITY), turn_left(false), turn_right(false) {}
    ControlInput(double t, SASMode mode, bool left, bool right)
        : thrust(t), sas_mode(mode), turn_left(left), turn_right(right) {}
};

/**
 * @brief Planar rigid-body dynamics of the active vehicle
 *
 * Forces:
 * - Patched-conic gravity from the planet or the moon
 * - Exponential-atmosphere drag against the velocity
 * - Thrust along the heading (sin θ, -cos θ)
 *
 * Torques: manual turn input plus the SAS controller.
 */
class Dynamics {
public:
    /**
     * @brief Constructor
     * @param config Simulation parameters, copied
     */
    explicit Dynamics(const SimConfig& config);

    /**
     * @brief Compute state derivative
     * @param x Packed state
     * @param control Held control input
     * @param props Held mass properties
     * @param t Mission time [s]
     * @return d/dt of the packed state
     */
    StateVector computeDerivative(const StateVector& x, const ControlInput& control,
                                  const MassProperties& props, double t) const;

    /**
     * @brief Compute the force breakdown
     * @return Thrust, gravity and drag vectors [N]
     */
    ForceBreakdown computeForces(const BodyState& state, const ControlInput& control,
                                 const MassProperties& props, double t) const;

    /**
     * @brief Net control torque (manual plus SAS) [N·m]
     */
    double computeTorque(const BodyState& state, const ControlInput& control,
                         const MassProperties& props, double t) const;

    /**
     * @brief Mass, inertia and drag area of a part list
     *
     * Mass is floored at min_mass and inertia = sum(m) * inertia_factor floored at
     * min_inertia.
     */
    MassProperties computeMassProperties(const std::vector<Part>& parts) const;

    const SimConfig& getConfig() const { return config_; }
    const environment::Atmosphere& getAtmosphere() const { return *atmosphere_; }

private:
    SimConfig config_;
    std::shared_ptr<environment::Atmosphere> atmosphere_;
    guidance::AttitudeParams attitude_;
};

/**
 * @brief Factory function to create dynamics object
 * @param config Simulation parameters
 * @return Shared pointer to dynamics object
 */
std::shared_ptr<Dynamics> createDynamics(const SimConfig& config);

} // namespace flightsim
