#pragma once

#include "flightsim/types.hpp"
#include "flightsim/vehicle/vehicle_tree.hpp"
#include <vector>

namespace flightsim {
namespace propulsion {

struct FuelSource {
    size_t part_index;
    int distance;       // Hops from the engine, 0 for the engine's own tank
};

struct FuelClaim {
    size_t tank_index;
    double amount;      // [kg]
};

// Read-only draw plan for one engine over one step
struct EngineDraw {
    size_t engine_index;
    double demand;                  // [kg]
    std::vector<FuelClaim> claims;  // Sums to at most demand
};

// Breadth-first search through parent and child edges. Any edge with a decoupler on
// either end is impassable, so fuel never crosses a decoupler.
std::vector<FuelSource> find_fuel_sources(size_t engine, const std::vector<Part>& parts,
                                          const vehicle::VehicleTree& tree);

// True when a stack decoupler sits anywhere below the engine, i.e. the engine belongs
// to an upper stage that has not been uncovered yet.
bool is_engine_blocked_by_stage(size_t engine, const std::vector<Part>& parts,
                                const vehicle::VehicleTree& tree);

/**
 * @brief Split an engine's demand over its reachable tanks
 *
 * Sources are grouped by distance and drained farthest tier first. Within a tier the
 * claim is proportional to each tank's current fuel. Fuel levels are read, not changed.
 *
 * @param engine Engine index
 * @param demand Fuel wanted this step [kg]
 * @param parts Part list
 * @param tree Adjacency built from parts
 * @param min_fuel Tanks at or below this level are ignored [kg]
 * @return Draw plan
 */
EngineDraw plan_engine_draw(size_t engine, double demand, const std::vector<Part>& parts,
                            const vehicle::VehicleTree& tree, double min_fuel = 1e-6);

} // namespace propulsion
} // namespace flightsim
