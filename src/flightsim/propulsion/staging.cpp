#include "flightsim/propulsion/staging.hpp"
#include "flightsim/utils.hpp"

namespace flightsim {
namespace propulsion {

int StagingLogic::select_next_decoupler(const std::vector<Part> &parts, const vehicle::VehicleTree &tree) {
    std::vector<Vec2> layout = vehicle::computeLayout(parts, tree);
    int best = -1;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!vehicle::isDecoupler(parts[i]) || parts[i].isRoot()) continue;
        if (best < 0 || layout[i].y() > layout[static_cast<size_t>(best)].y()) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

std::vector<Part> StagingLogic::detach_subtree(std::vector<Part> &parts, size_t decoupler,
                                               const vehicle::VehicleTree &tree) {
    std::vector<bool> remove(parts.size(), false);
    for (size_t idx : tree.collectSubtree(decoupler)) {
        remove[idx] = true;
    }

    std::vector<Part> kept;
    std::vector<Part> detached;
    kept.reserve(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) {
        if (remove[i]) {
            detached.push_back(std::move(parts[i]));
        } else {
            kept.push_back(std::move(parts[i]));
        }
    }
    parts = std::move(kept);
    return detached;
}

int StagingLogic::deploy_parachutes(std::vector<Part> &parts) {
    int deployed = 0;
    for (auto &p : parts) {
        if (p.type == PartType::PARACHUTE && !p.is_deployed) {
            p.is_deployed = true;
            ++deployed;
        }
    }
    return deployed;
}

bool StagingLogic::perform_stage(SimulationState &state, double separation_speed) {
    vehicle::VehicleTree tree(state.parts);
    int target = select_next_decoupler(state.parts, tree);

    if (target < 0) {
        if (deploy_parachutes(state.parts) > 0) {
            state.events.push_back("Parachutes deployed");
            return true;
        }
        return false;
    }

    const std::string name = state.parts[static_cast<size_t>(target)].name;
    const std::string id = state.parts[static_cast<size_t>(target)].instance_id;

    Debris debris;
    debris.id = "debris-" + id;
    debris.parts = detach_subtree(state.parts, static_cast<size_t>(target), tree);
    debris.body = state.body;
    debris.body.velocity -= separation_speed * math::headingVector(state.body.rotation);
    for (auto &p : debris.parts) {
        p.is_thrusting = false;
        // The detached decoupler becomes the debris root
        if (p.instance_id == id) {
            p.parent_id.clear();
            p.parent_node_id.clear();
        }
    }

    state.debris.push_back(std::move(debris));
    state.events.push_back("Staged: " + name);
    return true;
}

} // namespace propulsion
} // namespace flightsim
