#include "integrator.hpp"
#include <stdexcept>
#include <utility>

namespace flightsim {

Integrator::Integrator(std::shared_ptr<const Dynamics> dynamics) : dynamics_(std::move(dynamics)) {
    if (!dynamics_) {
        throw std::invalid_argument("Integrator requires a dynamics object");
    }
}

BodyState Integrator::integrate(const BodyState& state, const ControlInput& control,
                                const MassProperties& props, double t, double dt) const {
    BodyState next;
    next.fromVector(integrate(state.toVector(), control, props, t, dt));
    return next;
}

RK4Integrator::RK4Integrator(std::shared_ptr<const Dynamics> dynamics) : Integrator(std::move(dynamics)) {
}

StateVector RK4Integrator::integrate(const StateVector& x, const ControlInput& control,
                                     const MassProperties& props, double t, double dt) const {
    StateVector k1 = dynamics_->computeDerivative(x, control, props, t);
    StateVector k2 = dynamics_->computeDerivative(x + 0.5 * dt * k1, control, props, t + 0.5 * dt);
    StateVector k3 = dynamics_->computeDerivative(x + 0.5 * dt * k2, control, props, t + 0.5 * dt);
    StateVector k4 = dynamics_->computeDerivative(x + dt * k3, control, props, t + dt);

    return x + dt * (k1_coeff * k1 + k2_coeff * k2 + k3_coeff * k3 + k4_coeff * k4);
}

EulerIntegrator::EulerIntegrator(std::shared_ptr<const Dynamics> dynamics) : Integrator(std::move(dynamics)) {
}

StateVector EulerIntegrator::integrate(const StateVector& x, const ControlInput& control,
                                       const MassProperties& props, double t, double dt) const {
    StateVector x_dot = dynamics_->computeDerivative(x, control, props, t);

    StateVector next = x;
    next.segment<2>(2) += dt * x_dot.segment<2>(2);
    next.segment<2>(0) += dt * next.segment<2>(2);
    next(5) += dt * x_dot(5);
    next(4) += dt * next(5);
    return next;
}

std::shared_ptr<RK4Integrator> createRK4Integrator(std::shared_ptr<const Dynamics> dynamics) {
    return std::make_shared<RK4Integrator>(std::move(dynamics));
}

std::shared_ptr<EulerIntegrator> createEulerIntegrator(std::shared_ptr<const Dynamics> dynamics) {
    return std::make_shared<EulerIntegrator>(std::move(dynamics));
}

} // namespace flightsim
