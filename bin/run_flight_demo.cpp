#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>
#include "../src/flightsim/types.hpp"
#include "../src/flightsim/config.hpp"
#include "../src/flightsim/simulation.hpp"
#include "../src/flightsim/utils.hpp"
#include "../src/flightsim/propulsion/stage_analysis.hpp"
#include "../src/flightsim/vehicle/part_catalog.hpp"

using namespace flightsim;

namespace {

std::vector<Part> buildTwoStageVehicle(const vehicle::PartCatalog& catalog) {
    std::vector<Part> parts;
    parts.push_back(catalog.makePart("cmd-mk1", "pod"));
    parts.push_back(catalog.makePart("chute-mk1", "chute", "pod", "top"));
    parts.push_back(catalog.makePart("tank-m", "upper-tank", "pod", "bottom"));
    parts.push_back(catalog.makePart("eng-swivel", "upper-engine", "upper-tank", "bottom"));
    parts.push_back(catalog.makePart("decoupler-s", "decoupler", "upper-engine", "bottom"));
    parts.push_back(catalog.makePart("tank-l", "lower-tank", "decoupler", "bottom"));
    parts.push_back(catalog.makePart("eng-mainsail", "lower-engine", "lower-tank", "bottom"));
    return parts;
}

bool hasDecoupler(const std::vector<Part>& parts) {
    for (const auto& p : parts) {
        if (p.type == PartType::DECOUPLER) return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== Flight Simulation Demo ===" << std::endl;
    std::cout << std::fixed << std::setprecision(2);

    vehicle::PartCatalog catalog;
    std::vector<Part> parts = buildTwoStageVehicle(catalog);

    SimConfig config;
    std::cout << "\n--- Environment ---" << std::endl;
    std::cout << "Planet radius [km]: " << config.env.planet.radius / 1000.0 << std::endl;
    std::cout << "Moon orbital period [h]: " << config.env.moonOrbitalPeriod() / 3600.0 << std::endl;
    std::cout << "Moon SOI radius [km]: " << config.env.moonSoiRadius() / 1000.0 << std::endl;

    std::cout << "\n--- Stage Analysis ---" << std::endl;
    for (const auto& s : propulsion::calculate_stage_stats(parts, config.env.planet.mu /
                                                           (config.env.planet.radius * config.env.planet.radius))) {
        std::cout << "Stage " << s.stage_index << ": dv=" << s.delta_v << " m/s, TWR=" << s.twr
                  << ", burn=" << s.burn_time << " s, Isp=" << s.isp << " s, m0=" << s.start_mass
                  << " kg, parts=" << s.part_count << std::endl;
    }

    std::shared_ptr<logging::Logger> logger;
    try {
        logger = std::make_shared<logging::Logger>("flight.log", logging::LogLevel::INFO);
    } catch (const std::exception& e) {
        std::cerr << "Logging to stderr: " << e.what() << std::endl;
        logger = std::make_shared<logging::Logger>("", logging::LogLevel::INFO);
    }

    FlightSimulator sim(config, logger);
    SimulationState state = sim.launch(parts);

    std::ofstream csv("flight_trajectory.csv");
    csv << "time,x,y,vx,vy,rotation,altitude,speed,fuel,thrust,apoapsis,periapsis\n";

    Controls controls;
    controls.throttle = 1.0;
    controls.sas_mode = SASMode::STABILITY;

    const double max_time = 1200.0;
    bool chutes_armed = false;
    while (state.active && !state.finished && state.time < max_time) {
        controls.stage = false;
        controls.deploy_parachutes = false;
        controls.turn_right = false;

        // Pitch-over to 10 degrees between 2 km and 3 km, then follow the velocity vector
        if (state.altitude > 2000.0 && state.altitude < 3000.0) {
            controls.sas_mode = SASMode::STABILITY;
            controls.turn_right = state.body.rotation < units::degToRad(10.0);
        } else if (state.altitude >= 3000.0) {
            controls.sas_mode = SASMode::PROGRADE;
        }

        double thrust = state.forces.thrust.norm();
        if (controls.throttle > 0.0 && thrust == 0.0 && state.time > 1.0) {
            if (hasDecoupler(state.parts)) {
                controls.stage = true;
            } else {
                controls.throttle = 0.0;
                chutes_armed = true;
            }
        }
        if (chutes_armed && state.vertical_velocity < 0.0 && state.altitude < 20000.0) {
            controls.sas_mode = SASMode::RETROGRADE;
            controls.deploy_parachutes = true;
            chutes_armed = false;
        }

        state = sim.step(state, controls);

        csv << state.time << ',' << state.body.position.x() << ',' << state.body.position.y() << ','
            << state.body.velocity.x() << ',' << state.body.velocity.y() << ',' << state.body.rotation << ','
            << state.altitude << ',' << state.velocity_mag << ',' << utils::totalFuel(state.parts) << ','
            << state.forces.thrust.norm() << ',' << state.apoapsis << ',' << state.periapsis << '\n';
    }

    std::cout << "\n--- Mission Log ---" << std::endl;
    for (const auto& e : state.events) {
        std::cout << "  " << e << std::endl;
    }

    std::cout << "\n--- Final State ---" << std::endl;
    std::cout << "Time [s]: " << state.time << std::endl;
    std::cout << "Max altitude [m]: " << state.max_altitude << std::endl;
    std::cout << "Altitude [m]: " << state.altitude << std::endl;
    std::cout << "Speed [m/s]: " << state.velocity_mag << std::endl;
    std::cout << "Heading [deg]: " << units::radToDeg(math::wrapAngle(state.body.rotation)) << std::endl;
    std::cout << "Eccentricity: " << state.eccentricity << std::endl;
    std::cout << "Debris tracked: " << state.debris.size() << std::endl;
    std::cout << "Finished: " << (state.finished ? "Yes" : "No") << std::endl;
    std::cout << "\nTrajectory written to flight_trajectory.csv" << std::endl;
    return 0;
}
