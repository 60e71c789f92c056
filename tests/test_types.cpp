#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "../src/flightsim/types.hpp"
#include "../src/flightsim/config.hpp"
#include "../src/flightsim/utils.hpp"

using namespace flightsim;

class TypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_position = Vec2(1000.0, -600000.0);
        test_velocity = Vec2(12.0, -340.0);
        test_rotation = 0.3;
        test_angular_velocity = -0.02;

        tank.def_id = "tank-s";
        tank.type = PartType::TANK;
        tank.mass = 60.0;
        tank.fuel_capacity = 500.0;
        tank.current_fuel = 320.0;
        tank.instance_id = "t1";
        tank.parent_id = "pod";

        engine.type = PartType::ENGINE;
        engine.mass = 1500.0;
        engine.current_fuel = 99.0;  // Ignored: no capacity
        engine.instance_id = "e1";
    }

    Vec2 test_position;
    Vec2 test_velocity;
    double test_rotation;
    double test_angular_velocity;

    Part tank;
    Part engine;
};

TEST_F(TypesTest, BodyStateDefaultConstructor) {
    BodyState state;

    EXPECT_EQ(state.position, Vec2::Zero());
    EXPECT_EQ(state.velocity, Vec2::Zero());
    EXPECT_EQ(state.rotation, 0.0);
    EXPECT_EQ(state.angular_velocity, 0.0);
}

TEST_F(TypesTest, BodyStateToVectorConversion) {
    BodyState state(test_position, test_velocity, test_rotation, test_angular_velocity);
    Eigen::Matrix<double, 6, 1> vec = state.toVector();

    EXPECT_EQ(vec.segment<2>(0), test_position);
    EXPECT_EQ(vec.segment<2>(2), test_velocity);
    EXPECT_EQ(vec(4), test_rotation);
    EXPECT_EQ(vec(5), test_angular_velocity);
}

TEST_F(TypesTest, BodyStateFromVectorConversion) {
    Eigen::Matrix<double, 6, 1> vec;
    vec << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;

    BodyState state;
    state.fromVector(vec);

    EXPECT_EQ(state.position, Vec2(1.0, 2.0));
    EXPECT_EQ(state.velocity, Vec2(3.0, 4.0));
    EXPECT_EQ(state.rotation, 5.0);
    EXPECT_EQ(state.angular_velocity, 6.0);
}

TEST_F(TypesTest, PartMassIncludesFuelOnlyWithCapacity) {
    EXPECT_TRUE(tank.hasFuel());
    EXPECT_DOUBLE_EQ(tank.totalMass(), 380.0);

    EXPECT_FALSE(engine.hasFuel());
    EXPECT_DOUBLE_EQ(engine.totalMass(), 1500.0);
}

TEST_F(TypesTest, PartRoot) {
    EXPECT_FALSE(tank.isRoot());
    EXPECT_TRUE(engine.isRoot());
}

TEST_F(TypesTest, PartListTotals) {
    std::vector<Part> parts = {tank, engine};
    EXPECT_DOUBLE_EQ(utils::totalMass(parts), 1880.0);
    EXPECT_DOUBLE_EQ(utils::totalFuel(parts), 320.0);
}

TEST_F(TypesTest, ControlsDefaults) {
    Controls controls;

    EXPECT_EQ(controls.throttle, 0.0);
    EXPECT_EQ(controls.sas_mode, SASMode::STABILITY);
    EXPECT_FALSE(controls.turn_left);
    EXPECT_FALSE(controls.turn_right);
    EXPECT_EQ(controls.time_warp, 1.0);
    EXPECT_FALSE(controls.stage);
    EXPECT_FALSE(controls.deploy_parachutes);
    EXPECT_FALSE(controls.paused);
}

TEST_F(TypesTest, SimulationStateStartsActive) {
    SimulationState state;

    EXPECT_TRUE(state.active);
    EXPECT_FALSE(state.finished);
    EXPECT_TRUE(state.events.empty());
    EXPECT_TRUE(state.debris.empty());
    EXPECT_EQ(state.reference_body, ReferenceBody::PLANET);
}

TEST_F(TypesTest, ForceBreakdownTotal) {
    ForceBreakdown forces;
    forces.thrust = Vec2(0.0, -100.0);
    forces.gravity = Vec2(0.0, 30.0);
    forces.drag = Vec2(5.0, 10.0);

    EXPECT_EQ(forces.total(), Vec2(5.0, -60.0));
}

TEST_F(TypesTest, EnumNames) {
    EXPECT_STREQ(utils::partTypeToString(PartType::DECOUPLER), "DECOUPLER");
    EXPECT_STREQ(utils::partTypeToString(PartType::PARACHUTE), "PARACHUTE");
    EXPECT_STREQ(utils::sasModeToString(SASMode::RETROGRADE), "RETROGRADE");
}

TEST_F(TypesTest, StateValidation) {
    BodyState state(test_position, test_velocity, test_rotation, test_angular_velocity);
    EXPECT_TRUE(utils::isValidState(state));

    state.velocity.x() = std::nan("");
    EXPECT_FALSE(utils::isValidState(state));
}

TEST(ConfigTest, DefaultEnvironment) {
    Environment env;

    EXPECT_DOUBLE_EQ(env.planet.radius, 600000.0);
    EXPECT_DOUBLE_EQ(env.planet.mu, 9.81 * 600000.0 * 600000.0);
    EXPECT_DOUBLE_EQ(env.moon.mu, 1.63 * 200000.0 * 200000.0);
    EXPECT_DOUBLE_EQ(env.atmosphere_height, 70000.0);

    double expected_period = 2.0 * M_PI * std::sqrt(std::pow(12000000.0, 3) / env.planet.mu);
    EXPECT_EQ(env.moon_orbital_period, 0.0);
    EXPECT_NEAR(env.moonOrbitalPeriod(), expected_period, 1e-6);

    double expected_soi = 12000000.0 * std::pow(env.moon.mu / env.planet.mu, 0.4);
    EXPECT_NEAR(env.moonSoiRadius(), expected_soi, 1e-6);
}

TEST(ConfigTest, DefaultSimConfig) {
    SimConfig config;

    EXPECT_DOUBLE_EQ(config.base_time_step, 0.05);
    EXPECT_EQ(config.substeps, 10);
    EXPECT_DOUBLE_EQ(config.max_time_warp, 100.0);
    EXPECT_EQ(config.launch_altitude, 0.0);
    EXPECT_TRUE(validation::validateConfig(config));
    EXPECT_TRUE(validation::getConfigErrors(config).empty());
}

TEST(ConfigTest, MoonPeriodFollowsEditedEnvironment) {
    Environment env;
    env.planet = CelestialBody::fromSurfaceGravity("Planet", 9.81, 300000.0);
    env.moon_orbit_radius = 6000000.0;

    double expected_period = 2.0 * M_PI * std::sqrt(std::pow(6000000.0, 3) / env.planet.mu);
    EXPECT_NEAR(env.moonOrbitalPeriod(), expected_period, 1e-6);

    env.moon_orbital_period = 3600.0;
    EXPECT_DOUBLE_EQ(env.moonOrbitalPeriod(), 3600.0);
}

TEST(ConfigTest, NegativePeriodAndLaunchAltitudeRejected) {
    SimConfig config;
    config.env.moon_orbital_period = -1.0;
    config.launch_altitude = -5.0;

    std::vector<std::string> errors = validation::getConfigErrors(config);
    EXPECT_EQ(errors.size(), 2u);
}

TEST(ConfigTest, InvalidConfigReportsEveryProblem) {
    SimConfig config;
    config.substeps = 0;
    config.base_time_step = -1.0;
    config.env.planet.radius = 0.0;

    std::vector<std::string> errors = validation::getConfigErrors(config);
    EXPECT_EQ(errors.size(), 3u);
    EXPECT_FALSE(validation::validateConfig(config));
}

TEST(MathTest, WrapAngle) {
    EXPECT_NEAR(math::wrapAngle(0.0), 0.0, 1e-12);
    EXPECT_NEAR(math::wrapAngle(3.0 * M_PI / 2.0), -M_PI / 2.0, 1e-12);
    EXPECT_NEAR(math::wrapAngle(-3.0 * M_PI / 2.0), M_PI / 2.0, 1e-12);
    EXPECT_NEAR(math::wrapAngle(4.0 * M_PI + 0.25), 0.25, 1e-12);
}

TEST(MathTest, HeadingVector) {
    Vec2 up = math::headingVector(0.0);
    EXPECT_NEAR(up.x(), 0.0, 1e-12);
    EXPECT_NEAR(up.y(), -1.0, 1e-12);

    Vec2 right = math::headingVector(M_PI / 2.0);
    EXPECT_NEAR(right.x(), 1.0, 1e-12);
    EXPECT_NEAR(right.y(), 0.0, 1e-12);
}

TEST(MathTest, CrossAndNormalize) {
    EXPECT_DOUBLE_EQ(math::cross(Vec2(1.0, 0.0), Vec2(0.0, 1.0)), 1.0);
    EXPECT_EQ(math::safeNormalized(Vec2::Zero()), Vec2::Zero());
    EXPECT_NEAR(math::safeNormalized(Vec2(3.0, 4.0)).norm(), 1.0, 1e-12);
}

TEST(MathTest, UnitConversions) {
    EXPECT_NEAR(units::degToRad(180.0), M_PI, 1e-12);
    EXPECT_NEAR(units::radToDeg(M_PI / 2.0), 90.0, 1e-12);
}

TEST(LoggingTest, WritesLevelsAtOrAboveThreshold) {
    std::string path = ::testing::TempDir() + "flightsim_logging_test.log";
    std::remove(path.c_str());
    {
        logging::Logger logger(path, logging::LogLevel::INFO);
        logger.debug("hidden");
        logger.info("launch");
        logger.warning("warp clamped");
        EXPECT_FALSE(logger.isEnabled(logging::LogLevel::DEBUG));
        EXPECT_TRUE(logger.isEnabled(logging::LogLevel::ERROR));

        logger.setLevel(logging::LogLevel::ERROR);
        EXPECT_EQ(logger.getLevel(), logging::LogLevel::ERROR);
        logger.warning("suppressed");
        logger.error("engine failure");
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();

    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[INFO] launch"), std::string::npos);
    EXPECT_NE(text.find("[WARNING] warp clamped"), std::string::npos);
    EXPECT_EQ(text.find("suppressed"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] engine failure"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LoggingTest, UnopenableFileThrows) {
    EXPECT_THROW(logging::Logger("/nonexistent-dir/flightsim.log"), std::runtime_error);
}
