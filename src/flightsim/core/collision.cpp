#include "flightsim/core/collision.hpp"
#include <cmath>

namespace flightsim {
namespace core {

ContactOutcome resolve_surface_contact(BodyState &body, const SurfaceBody &surface,
                                       double max_altitude, const ContactParams &p) {
    Vec2 offset = body.position - surface.center;
    double distance = offset.norm();
    if (distance > surface.radius) {
        return ContactOutcome::NONE;
    }

    // Degenerate case at the exact center: push out along -y like the launch pad
    Vec2 normal = distance > 0.0 ? Vec2(offset / distance) : Vec2(0.0, -1.0);
    Vec2 relative_velocity = body.velocity - surface.velocity;
    double radial_velocity = relative_velocity.dot(normal);

    if (radial_velocity < -p.impact_speed) {
        return ContactOutcome::CRASHED;
    }

    body.position = surface.center + normal * surface.radius;

    if (relative_velocity.norm() < p.rest_speed) {
        body.velocity = surface.velocity;
        return max_altitude > p.min_flight_altitude ? ContactOutcome::LANDED : ContactOutcome::RESTING;
    }

    if (radial_velocity < 0.0) {
        relative_velocity -= radial_velocity * normal;
        body.velocity = surface.velocity + relative_velocity;
    }
    return ContactOutcome::SLIDING;
}

bool is_terminal(ContactOutcome outcome) {
    return outcome == ContactOutcome::LANDED || outcome == ContactOutcome::CRASHED;
}

std::string contact_event(ContactOutcome outcome, const std::string &body_name) {
    switch (outcome) {
        case ContactOutcome::CRASHED:
            return "Crashed into " + body_name;
        case ContactOutcome::LANDED:
            return "Landed on " + body_name;
        default:
            return std::string();
    }
}

} // namespace core
} // namespace flightsim
