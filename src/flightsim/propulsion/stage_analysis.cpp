#include "flightsim/propulsion/stage_analysis.hpp"
#include "flightsim/vehicle/vehicle_tree.hpp"
#include <algorithm>
#include <cmath>
#include <deque>

namespace flightsim {
namespace propulsion {

std::vector<StageStats> calculate_stage_stats(const std::vector<Part> &parts, double g0) {
    std::vector<StageStats> stats;
    vehicle::VehicleTree tree(parts);
    if (parts.empty() || tree.root() == vehicle::VehicleTree::kNoParent) return stats;

    std::vector<int> stage_of(parts.size(), 0);
    int max_stage = 0;
    std::deque<size_t> queue{static_cast<size_t>(tree.root())};
    while (!queue.empty()) {
        size_t cur = queue.front();
        queue.pop_front();
        max_stage = std::max(max_stage, stage_of[cur]);
        int next = stage_of[cur] + (vehicle::isDecoupler(parts[cur]) ? 1 : 0);
        for (size_t c : tree.childrenOf(cur)) {
            stage_of[c] = next;
            queue.push_back(c);
        }
    }

    for (int s = max_stage; s >= 0; --s) {
        StageStats st{};
        st.stage_index = s;

        double payload_mass = 0.0;
        double stage_fuel = 0.0;
        double burn_rate = 0.0;
        for (size_t i = 0; i < parts.size(); ++i) {
            const Part &p = parts[i];
            if (stage_of[i] < s) {
                payload_mass += p.totalMass();
            } else if (stage_of[i] == s) {
                st.dry_mass += p.mass;
                if (p.hasFuel()) stage_fuel += p.current_fuel;
                if (p.type == PartType::ENGINE) {
                    st.thrust += p.thrust;
                    burn_rate += p.burn_rate;
                }
                ++st.part_count;
            }
        }
        st.wet_mass = st.dry_mass + stage_fuel;
        st.start_mass = payload_mass + st.wet_mass;
        st.end_mass = payload_mass + st.dry_mass;

        if (st.thrust > 0.0 && burn_rate > 0.0) {
            st.isp = st.thrust / (burn_rate * g0);
            if (st.start_mass > 0.0 && st.end_mass > 0.0) {
                st.delta_v = st.isp * g0 * std::log(st.start_mass / st.end_mass);
            }
            st.burn_time = stage_fuel / burn_rate;
            st.twr = st.thrust / (st.start_mass * g0);
        }
        stats.push_back(st);
    }
    return stats;
}

} // namespace propulsion
} // namespace flightsim
