#pragma once

#include "flightsim/types.hpp"
#include <vector>

namespace flightsim {
namespace propulsion {

struct StageStats {
    int stage_index;     // 0 is the root/payload stage, higher is lower in the stack
    double delta_v;      // m/s
    double twr;          // Thrust-to-weight at ignition
    double burn_time;    // s
    double start_mass;   // kg, this stage plus everything above it
    double end_mass;     // kg
    double thrust;       // N
    double isp;          // s
    double wet_mass;     // kg, this stage only
    double dry_mass;     // kg, this stage only
    int part_count;
};

// Structural staging: the root is stage 0 and every decoupler starts a new stage for
// its children. Assumes sequential burns, stage N lifting stages N-1..0.
// Returned ordered from the launch stage to the payload. Empty for a rootless list.
std::vector<StageStats> calculate_stage_stats(const std::vector<Part> &parts, double g0 = 9.81);

} // namespace propulsion
} // namespace flightsim
