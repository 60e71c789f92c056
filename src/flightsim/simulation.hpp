#pragma once

#include "types.hpp"
#include "config.hpp"
#include "dynamics.hpp"
#include "integrator.hpp"
#include "utils.hpp"
#include <memory>
#include <vector>

namespace flightsim {

/**
 * @brief Headless flight simulation
 *
 * Owns no flight state: launch() builds a SimulationState and step() maps one state
 * to the next. Per tick:
 * - Debris from earlier ticks takes one Euler step
 * - For each substep: fuel is resolved, RK4 advances the craft, both surfaces are
 *   checked for contact
 * - Stage and parachute pulses are applied
 * - Telemetry and orbital elements are refreshed
 */
class FlightSimulator {
public:
    /**
     * @brief Constructor
     * @param config Simulation parameters
     * @param logger Optional logger for launch, events and telemetry
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit FlightSimulator(const SimConfig& config = SimConfig(),
                             std::shared_ptr<logging::Logger> logger = nullptr);

    /**
     * @brief Build the initial state on the launch pad
     * @param parts Vehicle part list, fuel as given
     * @return Active, unfinished state at time 0
     * @throws std::invalid_argument if the part list is not a single rooted tree
     */
    SimulationState launch(const std::vector<Part>& parts) const;

    /**
     * @brief Advance one tick of base_time_step times the clamped time warp
     */
    SimulationState step(const SimulationState& state, const Controls& controls) const;

    /**
     * @brief Advance by dt, split evenly over the configured substeps
     * @param state Current state, not modified
     * @param controls Controls held for the whole tick
     * @param dt Tick duration [s], capped at base_time_step * max_time_warp
     * @return Next state. Finished or paused input is returned unchanged.
     */
    SimulationState step(const SimulationState& state, const Controls& controls, double dt) const;

    /**
     * @brief Tick duration for a requested warp, clamped to [1, max_time_warp]
     *
     * A clamped request logs one warning until a different warp is requested.
     */
    double tickDuration(double requested_warp) const;

    /**
     * @brief Refresh derived telemetry relative to the current reference body
     */
    void updateTelemetry(SimulationState& state) const;

    const SimConfig& getConfig() const { return config_; }
    std::shared_ptr<const Dynamics> getDynamics() const { return dynamics_; }

private:
    SimConfig config_;
    std::shared_ptr<Dynamics> dynamics_;
    std::shared_ptr<Integrator> integrator_;
    std::shared_ptr<Integrator> debris_integrator_;
    std::shared_ptr<logging::Logger> logger_;
    mutable double warned_warp_ = 0.0;

    void logEvents(const SimulationState& state, size_t first) const;
};

/**
 * @brief One tick with a default-configured simulator
 */
SimulationState step(const SimulationState& state, const Controls& controls, double dt,
                     const SimConfig& config = SimConfig());

} // namespace flightsim
