#include "flightsim/propulsion/fuel_routing.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <map>

namespace flightsim {
namespace propulsion {

std::vector<FuelSource> find_fuel_sources(size_t engine, const std::vector<Part>& parts,
                                          const vehicle::VehicleTree& tree) {
    std::vector<FuelSource> sources;
    std::vector<bool> visited(parts.size(), false);
    std::deque<FuelSource> queue{FuelSource{engine, 0}};
    visited[engine] = true;

    if (parts[engine].hasFuel()) {
        sources.push_back({engine, 0});
    }

    auto visit = [&](size_t from, size_t to, int dist) {
        if (visited[to]) return;
        if (vehicle::isDecoupler(parts[from]) || vehicle::isDecoupler(parts[to])) return;
        visited[to] = true;
        queue.push_back({to, dist + 1});
        if (parts[to].hasFuel()) {
            sources.push_back({to, dist + 1});
        }
    };

    while (!queue.empty()) {
        FuelSource cur = queue.front();
        queue.pop_front();

        int parent = tree.parentOf(cur.part_index);
        if (parent != vehicle::VehicleTree::kNoParent) {
            visit(cur.part_index, static_cast<size_t>(parent), cur.distance);
        }
        for (size_t child : tree.childrenOf(cur.part_index)) {
            visit(cur.part_index, child, cur.distance);
        }
    }
    return sources;
}

bool is_engine_blocked_by_stage(size_t engine, const std::vector<Part>& parts,
                                const vehicle::VehicleTree& tree) {
    for (size_t idx : tree.collectSubtree(engine)) {
        if (vehicle::isStackDecoupler(parts[idx])) {
            return true;
        }
    }
    return false;
}

EngineDraw plan_engine_draw(size_t engine, double demand, const std::vector<Part>& parts,
                            const vehicle::VehicleTree& tree, double min_fuel) {
    EngineDraw draw{engine, demand, {}};
    if (demand <= 0.0) {
        return draw;
    }

    // Tiers keyed by distance, farthest first
    std::map<int, std::vector<size_t>, std::greater<int>> tiers;
    for (const auto& src : find_fuel_sources(engine, parts, tree)) {
        if (parts[src.part_index].current_fuel > min_fuel) {
            tiers[src.distance].push_back(src.part_index);
        }
    }

    double remaining = demand;
    for (const auto& [dist, tanks] : tiers) {
        if (remaining <= 0.0) break;

        double tier_total = 0.0;
        for (size_t t : tanks) tier_total += parts[t].current_fuel;
        if (tier_total <= 0.0) continue;

        double take = std::min(tier_total, remaining);
        for (size_t t : tanks) {
            double share = take * (parts[t].current_fuel / tier_total);
            if (share > 0.0) {
                draw.claims.push_back({t, share});
            }
        }
        remaining -= take;
    }
    return draw;
}

} // namespace propulsion
} // namespace flightsim
