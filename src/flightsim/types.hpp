#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace flightsim {

using Vec2 = Eigen::Vector2d;

/**
 * @brief Functional category of a part
 */
enum class PartType {
    COMMAND,
    TANK,
    ENGINE,
    DECOUPLER,
    NOSE,
    FIN,
    PAYLOAD,
    STRUCTURAL,
    LEG,
    PARACHUTE
};

/**
 * @brief Attitude control (SAS) modes
 */
enum class SASMode {
    MANUAL,        // No automatic torque
    STABILITY,     // Damp angular velocity to zero
    PROGRADE,      // Hold heading along velocity
    RETROGRADE     // Hold heading against velocity
};

/**
 * @brief Body whose sphere of influence contains the craft
 */
enum class ReferenceBody {
    PLANET,
    MOON
};

enum class NodeKind {
    STACK,         // Vertical in-line attachment
    RADIAL         // Side-mounted attachment
};

/**
 * @brief Attachment point on a part
 */
struct AttachNode {
    std::string id;                      // e.g. "top", "bottom", "left", "right"
    Vec2 offset;                         // Relative to part center [m], +y is down the stack
    NodeKind kind;

    AttachNode() : offset(Vec2::Zero()), kind(NodeKind::STACK) {}
    AttachNode(const std::string& node_id, double x, double y, NodeKind k)
        : id(node_id), offset(x, y), kind(k) {}
};

/**
 * @brief Part instance in a vehicle tree
 *
 * Catalog attributes are copied in at creation and never change during flight.
 * Instance state (fuel, thrusting, deployed) is mutated by the simulation.
 */
struct Part {
    // Catalog attributes
    std::string def_id;
    std::string name;
    PartType type;
    double mass;            // Dry mass [kg]
    double fuel_capacity;   // [kg], 0 for parts that carry no fuel
    double thrust;          // Maximum thrust [N]
    double burn_rate;       // Fuel flow at full throttle [kg/s]
    double drag_coeff;
    double height;          // [m]
    double width;           // [m]
    std::vector<AttachNode> nodes;

    // Tree structure
    std::string instance_id;
    std::string parent_id;       // Empty for the root
    std::string parent_node_id;  // Node on the parent this part is attached to
    int radial_offset;           // -1 mirrored, 1 standard

    // Simulation state
    double current_fuel;    // Meaningful only when fuel_capacity > 0
    bool is_thrusting;
    bool is_deployed;

    Part() : type(PartType::STRUCTURAL), mass(0.0), fuel_capacity(0.0), thrust(0.0),
             burn_rate(0.0), drag_coeff(0.0), height(0.0), width(0.0), radial_offset(1),
             current_fuel(0.0), is_thrusting(false), is_deployed(false) {}

    bool isRoot() const { return parent_id.empty(); }
    bool hasFuel() const { return fuel_capacity > 0.0; }

    // Dry mass plus remaining fuel [kg]
    double totalMass() const { return mass + (hasFuel() ? current_fuel : 0.0); }
};

/**
 * @brief Planar rigid-body kinematic state
 *
 * Position and velocity are in world coordinates with the planet center at the origin.
 * Rotation is measured so that a craft at rotation 0 thrusts along (0, -1).
 */
struct BodyState {
    Vec2 position;            // [m]
    Vec2 velocity;            // [m/s]
    double rotation;          // [rad]
    double angular_velocity;  // [rad/s]

    BodyState() : position(Vec2::Zero()), velocity(Vec2::Zero()), rotation(0.0), angular_velocity(0.0) {}

    BodyState(const Vec2& r, const Vec2& v, double theta, double omega)
        : position(r), velocity(v), rotation(theta), angular_velocity(omega) {}

    // Packed as [x, y, vx, vy, theta, omega] for the integrators
    Eigen::Matrix<double, 6, 1> toVector() const {
        Eigen::Matrix<double, 6, 1> vec;
        vec.segment<2>(0) = position;
        vec.segment<2>(2) = velocity;
        vec(4) = rotation;
        vec(5) = angular_velocity;
        return vec;
    }

    void fromVector(const Eigen::Matrix<double, 6, 1>& vec) {
        position = vec.segment<2>(0);
        velocity = vec.segment<2>(2);
        rotation = vec(4);
        angular_velocity = vec(5);
    }
};

/**
 * @brief Detached subtree flying on its own
 */
struct Debris {
    std::string id;
    std::vector<Part> parts;   // Owned copy, never shared with the active vehicle
    BodyState body;
};

/**
 * @brief Force breakdown for visualization [N]
 */
struct ForceBreakdown {
    Vec2 thrust;
    Vec2 gravity;
    Vec2 drag;

    ForceBreakdown() : thrust(Vec2::Zero()), gravity(Vec2::Zero()), drag(Vec2::Zero()) {}

    Vec2 total() const { return thrust + gravity + drag; }
};

/**
 * @brief Per-tick control signals, sampled once and held for all substeps
 */
struct Controls {
    double throttle;          // [0, 1]
    SASMode sas_mode;
    bool turn_left;
    bool turn_right;
    double time_warp;         // Requested multiplier, clamped by the simulator
    bool stage;               // Pulse: fire next decoupler
    bool deploy_parachutes;   // Pulse
    bool paused;

    Controls() : throttle(0.0), sas_mode(SASMode::STABILITY), turn_left(false), turn_right(false),
                 time_warp(1.0), stage(false), deploy_parachutes(false), paused(false) {}
};

/**
 * @brief Aggregate world snapshot exposed to rendering and telemetry
 */
struct SimulationState {
    // Physics state
    BodyState body;
    double throttle;
    SASMode sas_mode;
    double time;              // Mission elapsed time [s]

    // Derived telemetry, relative to the reference body
    ReferenceBody reference_body;
    double altitude;
    double velocity_mag;
    double vertical_velocity;
    double horizontal_velocity;
    double acceleration;      // |F| / m [m/s^2]
    double max_altitude;

    // Orbital elements
    double semi_major_axis;
    double eccentricity;
    double apoapsis;
    double periapsis;

    Vec2 moon_position;
    ForceBreakdown forces;

    std::vector<Part> parts;
    std::vector<Debris> debris;
    bool active;
    bool finished;
    std::vector<std::string> events;  // Append-only mission log

    SimulationState() : throttle(0.0), sas_mode(SASMode::STABILITY), time(0.0),
                        reference_body(ReferenceBody::PLANET), altitude(0.0), velocity_mag(0.0),
                        vertical_velocity(0.0), horizontal_velocity(0.0), acceleration(0.0),
                        max_altitude(0.0), semi_major_axis(0.0), eccentricity(0.0),
                        apoapsis(0.0), periapsis(0.0), moon_position(Vec2::Zero()),
                        active(true), finished(false) {}
};

namespace utils {

    inline const char* partTypeToString(PartType type) {
        switch (type) {
            case PartType::COMMAND: return "COMMAND";
            case PartType::TANK: return "TANK";
            case PartType::ENGINE: return "ENGINE";
            case PartType::DECOUPLER: return "DECOUPLER";
            case PartType::NOSE: return "NOSE";
            case PartType::FIN: return "FIN";
            case PartType::PAYLOAD: return "PAYLOAD";
            case PartType::STRUCTURAL: return "STRUCTURAL";
            case PartType::LEG: return "LEG";
            case PartType::PARACHUTE: return "PARACHUTE";
        }
        return "UNKNOWN";
    }

    inline const char* sasModeToString(SASMode mode) {
        switch (mode) {
            case SASMode::MANUAL: return "MANUAL";
            case SASMode::STABILITY: return "STABILITY";
            case SASMode::PROGRADE: return "PROGRADE";
            case SASMode::RETROGRADE: return "RETROGRADE";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Sum of dry mass and fuel over a part list [kg]
     */
    inline double totalMass(const std::vector<Part>& parts) {
        double mass = 0.0;
        for (const auto& p : parts) {
            mass += p.totalMass();
        }
        return mass;
    }

    /**
     * @brief Sum of remaining fuel over a part list [kg]
     */
    inline double totalFuel(const std::vector<Part>& parts) {
        double fuel = 0.0;
        for (const auto& p : parts) {
            if (p.hasFuel()) fuel += p.current_fuel;
        }
        return fuel;
    }

    /**
     * @brief Check if a kinematic state is finite
     */
    inline bool isValidState(const BodyState& state) {
        return std::isfinite(state.position.norm()) &&
               std::isfinite(state.velocity.norm()) &&
               std::isfinite(state.rotation) &&
               std::isfinite(state.angular_velocity);
    }
}

} // namespace flightsim
