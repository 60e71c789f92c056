#include "orbital_elements.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace flightsim {

OrbitalElements computeOrbitalElements(const Vec2& position, const Vec2& velocity,
                                       double mu, double body_radius) {
    OrbitalElements elements;
    double r = position.norm();
    if (r <= 0.0 || mu <= 0.0) {
        return elements;
    }

    const double inf = std::numeric_limits<double>::infinity();
    double v2 = velocity.squaredNorm();
    double h = math::cross(position, velocity);
    double energy = 0.5 * v2 - mu / r;

    elements.specific_energy = energy;
    elements.angular_momentum = h;
    elements.semi_major_axis = energy != 0.0 ? -mu / (2.0 * energy) : inf;

    // Round-off can push 1 + 2Eh²/mu² slightly negative for circular orbits
    double e = std::sqrt(std::max(0.0, 1.0 + 2.0 * energy * h * h / (mu * mu)));
    elements.eccentricity = e;

    double p = h * h / mu;  // Semi-latus rectum
    elements.periapsis = p / (1.0 + e) - body_radius;
    elements.apoapsis = e < 1.0 ? p / (1.0 - e) - body_radius : inf;
    return elements;
}

} // namespace flightsim
