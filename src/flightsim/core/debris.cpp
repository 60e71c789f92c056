#include "flightsim/core/debris.hpp"
#include "flightsim/environment/atmosphere.hpp"
#include "flightsim/environment/gravity.hpp"
#include <algorithm>

namespace flightsim {
namespace core {

bool is_below_surface(const Vec2 &position, double t, const Environment &env) {
    if (position.norm() < env.planet.radius) {
        return true;
    }
    return (position - environment::moon_position(env, t)).norm() < env.moon.radius;
}

size_t propagate_debris(std::vector<Debris> &debris, const Integrator &integrator, double t, double dt) {
    const SimConfig &config = integrator.getDynamics()->getConfig();
    const ControlInput coast(0.0, SASMode::MANUAL, false, false);

    for (auto &piece : debris) {
        MassProperties props;
        props.mass = config.debris_mass;
        props.inertia = std::max(config.debris_mass * config.inertia_factor, config.min_inertia);
        props.drag_area = environment::effective_drag_area(piece.parts, config.env.parachute_area_multiplier);
        piece.body = integrator.integrate(piece.body, coast, props, t, dt);
    }

    size_t before = debris.size();
    debris.erase(std::remove_if(debris.begin(), debris.end(),
                                [&](const Debris &piece) {
                                    return is_below_surface(piece.body.position, t + dt, config.env);
                                }),
                 debris.end());
    return before - debris.size();
}

} // namespace core
} // namespace flightsim
