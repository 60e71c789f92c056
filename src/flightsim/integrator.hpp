#pragma once

#include "types.hpp"
#include "dynamics.hpp"
#include <Eigen/Dense>
#include <memory>

namespace flightsim {

/**
 * @brief Base class for numerical integrators
 */
class Integrator {
public:
    /**
     * @brief Constructor
     * @param dynamics Dynamics object
     */
    explicit Integrator(std::shared_ptr<const Dynamics> dynamics);

    virtual ~Integrator() = default;

    /**
     * @brief Integrate one step
     * @param x Current packed state
     * @param control Control input held over the step
     * @param props Mass properties held over the step
     * @param t Current time
     * @param dt Time step
     * @return New packed state after integration
     */
    virtual StateVector integrate(const StateVector& x, const ControlInput& control,
                                  const MassProperties& props, double t, double dt) const = 0;

    /**
     * @brief Convenience overload on BodyState
     */
    BodyState integrate(const BodyState& state, const ControlInput& control,
                        const MassProperties& props, double t, double dt) const;

    std::shared_ptr<const Dynamics> getDynamics() const { return dynamics_; }

protected:
    std::shared_ptr<const Dynamics> dynamics_;
};

/**
 * @brief Runge-Kutta 4th order integrator
 */
class RK4Integrator : public Integrator {
public:
    explicit RK4Integrator(std::shared_ptr<const Dynamics> dynamics);

    using Integrator::integrate;

    /**
     * @brief Integrate one step using RK4
     *
     * Forces and torques are re-evaluated at each stage with thrust, mass and
     * inertia held constant.
     */
    StateVector integrate(const StateVector& x, const ControlInput& control,
                          const MassProperties& props, double t, double dt) const override;

private:
    static constexpr double k1_coeff = 1.0/6.0;
    static constexpr double k2_coeff = 1.0/3.0;
    static constexpr double k3_coeff = 1.0/3.0;
    static constexpr double k4_coeff = 1.0/6.0;
};

/**
 * @brief Semi-implicit Euler integrator
 *
 * Velocity is updated first and the new velocity moves the position.
 */
class EulerIntegrator : public Integrator {
public:
    explicit EulerIntegrator(std::shared_ptr<const Dynamics> dynamics);

    using Integrator::integrate;

    StateVector integrate(const StateVector& x, const ControlInput& control,
                          const MassProperties& props, double t, double dt) const override;
};

/**
 * @brief Factory function to create RK4 integrator
 * @param dynamics Dynamics object
 * @return Shared pointer to RK4 integrator
 */
std::shared_ptr<RK4Integrator> createRK4Integrator(std::shared_ptr<const Dynamics> dynamics);

/**
 * @brief Factory function to create Euler integrator
 * @param dynamics Dynamics object
 * @return Shared pointer to Euler integrator
 */
std::shared_ptr<EulerIntegrator> createEulerIntegrator(std::shared_ptr<const Dynamics> dynamics);

} // namespace flightsim
