#pragma once

#include "flightsim/config.hpp"
#include "flightsim/integrator.hpp"
#include "flightsim/types.hpp"
#include <vector>

namespace flightsim {
namespace core {

// True when the point lies strictly inside the planet or the moon at time t
bool is_below_surface(const Vec2 &position, double t, const Environment &env);

/**
 * @brief Advance all debris by one step and drop pieces that went underground
 *
 * Each piece takes a single step of the given integrator with no thrust, no
 * attitude control and a nominal mass; drag uses the piece's own parts.
 *
 * @param debris Debris list, modified in place
 * @param integrator Low-fidelity integrator (Euler)
 * @param t Time at the start of the step [s]
 * @param dt Step length [s]
 * @return Number of pieces removed
 */
size_t propagate_debris(std::vector<Debris> &debris, const Integrator &integrator, double t, double dt);

} // namespace core
} // namespace flightsim
