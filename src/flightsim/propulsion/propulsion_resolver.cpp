#include "flightsim/propulsion/propulsion_resolver.hpp"
#include "flightsim/propulsion/fuel_routing.hpp"
#include <algorithm>

namespace flightsim {
namespace propulsion {

PropulsionResult PropulsionResolver::resolve(std::vector<Part>& parts, const vehicle::VehicleTree& tree,
                                             double throttle, double dt, const PropulsionParams& params) {
    PropulsionResult result;

    for (auto& p : parts) {
        p.is_thrusting = false;
    }

    if (throttle < params.throttle_epsilon || dt <= 0.0) {
        result.mass = utils::totalMass(parts);
        return result;
    }

    // Plan: read-only pass over the current fuel levels
    std::vector<EngineDraw> draws;
    std::vector<double> claimed(parts.size(), 0.0);
    for (size_t i = 0; i < parts.size(); ++i) {
        const Part& p = parts[i];
        if (p.type != PartType::ENGINE || p.thrust <= 0.0) continue;
        if (is_engine_blocked_by_stage(i, parts, tree)) continue;

        double demand = p.burn_rate * throttle * dt;
        if (demand <= 0.0) continue;

        EngineDraw draw = plan_engine_draw(i, demand, parts, tree);
        for (const auto& c : draw.claims) {
            claimed[c.tank_index] += c.amount;
        }
        draws.push_back(std::move(draw));
    }

    // Fair shortfall per tank
    std::vector<double> scale(parts.size(), 1.0);
    for (size_t t = 0; t < parts.size(); ++t) {
        if (claimed[t] > parts[t].current_fuel && claimed[t] > 0.0) {
            scale[t] = parts[t].current_fuel / claimed[t];
        }
    }

    // Commit
    for (size_t t = 0; t < parts.size(); ++t) {
        if (claimed[t] <= 0.0) continue;
        double honored = claimed[t] * scale[t];
        Part& tank = parts[t];
        double before = tank.current_fuel;
        tank.current_fuel = std::max(0.0, tank.current_fuel - honored);
        if (tank.current_fuel < 1e-6) tank.current_fuel = 0.0;
        result.fuel_drawn += before - tank.current_fuel;
    }

    for (const auto& draw : draws) {
        double obtained = 0.0;
        for (const auto& c : draw.claims) {
            obtained += c.amount * scale[c.tank_index];
        }
        double ratio = obtained / draw.demand;
        Part& engine = parts[draw.engine_index];
        if (ratio < params.min_supply_ratio) {
            continue;
        }
        result.thrust += engine.thrust * throttle * std::min(1.0, ratio);
        engine.is_thrusting = true;
        ++result.firing_engines;
    }

    result.mass = utils::totalMass(parts);
    return result;
}

} // namespace propulsion
} // namespace flightsim
