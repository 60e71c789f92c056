#pragma once

#include "flightsim/types.hpp"
#include <string>

namespace flightsim {
namespace core {

enum class ContactOutcome {
    NONE,       // Above the surface
    RESTING,    // On the pad, never flew: clamped and stopped
    SLIDING,    // Clamped, inward radial velocity removed
    LANDED,     // Terminal
    CRASHED     // Terminal
};

struct ContactParams {
    double impact_speed = 10.0;         // Inward radial speed that crashes, strict [m/s]
    double rest_speed = 1.0;            // [m/s]
    double min_flight_altitude = 50.0;  // [m]
};

// Surface a craft can touch; center and velocity at the current time
struct SurfaceBody {
    std::string name;
    Vec2 center;
    Vec2 velocity;
    double radius;
};

/**
 * @brief Resolve contact between a craft and one body's surface
 *
 * Velocities are compared relative to the body. A crash leaves the state untouched;
 * landing, resting and sliding project the craft back onto the surface.
 *
 * @param body Craft state, modified in place
 * @param surface Body to test against
 * @param max_altitude Highest altitude reached so far [m]
 * @param p Thresholds
 * @return Contact outcome
 */
ContactOutcome resolve_surface_contact(BodyState &body, const SurfaceBody &surface,
                                       double max_altitude, const ContactParams &p);

// True for LANDED and CRASHED
bool is_terminal(ContactOutcome outcome);

// "Crashed into <body>", "Landed on <body>", empty for non-terminal outcomes
std::string contact_event(ContactOutcome outcome, const std::string &body_name);

} // namespace core
} // namespace flightsim
