#pragma once

#include "flightsim/types.hpp"
#include "flightsim/vehicle/vehicle_tree.hpp"
#include <vector>

namespace flightsim {
namespace propulsion {

struct PropulsionParams {
    double throttle_epsilon = 1e-6;  // Throttle below this burns nothing
    double min_supply_ratio = 0.01;  // Supply ratio below this gives no thrust
};

struct PropulsionResult {
    double thrust = 0.0;       // Net thrust magnitude along the heading [N]
    double mass = 0.0;         // Vehicle mass after the draw [kg]
    double fuel_drawn = 0.0;   // [kg]
    int firing_engines = 0;
};

// Resolves competing engine demands against shared tanks in two phases: every engine
// plans its claims from the same fuel snapshot, then each tank honors its claims in
// full or scales them all by available / claimed, and the deductions are applied.
class PropulsionResolver {
public:
    static PropulsionResult resolve(std::vector<Part>& parts, const vehicle::VehicleTree& tree,
                                    double throttle, double dt,
                                    const PropulsionParams& params = PropulsionParams());
};

} // namespace propulsion
} // namespace flightsim
