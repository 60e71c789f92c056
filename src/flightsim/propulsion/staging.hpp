#pragma once

#include "flightsim/types.hpp"
#include "flightsim/vehicle/vehicle_tree.hpp"
#include <vector>

namespace flightsim {
namespace propulsion {

class StagingLogic {
public:
    // Lowest decoupler along the stack (largest layout y). Ties keep part-list order.
    // The root is never a candidate. Returns -1 when no decoupler remains.
    static int select_next_decoupler(const std::vector<Part> &parts, const vehicle::VehicleTree &tree);

    // Removes the decoupler's subtree from parts and returns it, list order preserved
    static std::vector<Part> detach_subtree(std::vector<Part> &parts, size_t decoupler,
                                            const vehicle::VehicleTree &tree);

    // Returns the number of parachutes newly deployed
    static int deploy_parachutes(std::vector<Part> &parts);

    // Fires the next decoupler, turning its subtree into debris that inherits the
    // vehicle kinematics plus a push along -heading. With no decoupler left, deploys
    // parachutes instead. Returns false when there was nothing to do.
    static bool perform_stage(SimulationState &state, double separation_speed);
};

} // namespace propulsion
} // namespace flightsim
