#include <gtest/gtest.h>
#include <cmath>
#include "../src/flightsim/types.hpp"
#include "../src/flightsim/propulsion/stage_analysis.hpp"
#include "../src/flightsim/propulsion/staging.hpp"
#include "../src/flightsim/vehicle/part_catalog.hpp"
#include "../src/flightsim/vehicle/vehicle_tree.hpp"

using namespace flightsim;
using namespace flightsim::propulsion;

class StagingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // chute / pod / upper decoupler / tank / engine / lower decoupler / tank / engine
        state_.parts.push_back(catalog_.makePart("cmd-mk1", "pod"));
        state_.parts.push_back(catalog_.makePart("chute-mk1", "chute", "pod", "top"));
        state_.parts.push_back(catalog_.makePart("decoupler-s", "dec-upper", "pod", "bottom"));
        state_.parts.push_back(catalog_.makePart("tank-s", "tank-upper", "dec-upper", "bottom"));
        state_.parts.push_back(catalog_.makePart("eng-swivel", "eng-upper", "tank-upper", "bottom"));
        state_.parts.push_back(catalog_.makePart("decoupler-s", "dec-lower", "eng-upper", "bottom"));
        state_.parts.push_back(catalog_.makePart("tank-m", "tank-lower", "dec-lower", "bottom"));
        state_.parts.push_back(catalog_.makePart("eng-swivel", "eng-lower", "tank-lower", "bottom"));

        state_.body.position = Vec2(0.0, -700000.0);
        state_.body.velocity = Vec2(120.0, -30.0);
        state_.body.rotation = 0.0;
        state_.body.angular_velocity = 0.01;
    }

    size_t indexOf(const std::vector<Part>& parts, const std::string& id) {
        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].instance_id == id) return i;
        }
        return parts.size();
    }

    vehicle::PartCatalog catalog_;
    SimulationState state_;
};

TEST_F(StagingTest, SelectsLowestDecoupler) {
    vehicle::VehicleTree tree(state_.parts);
    int target = StagingLogic::select_next_decoupler(state_.parts, tree);
    ASSERT_GE(target, 0);
    EXPECT_EQ(state_.parts[static_cast<size_t>(target)].instance_id, "dec-lower");
}

TEST_F(StagingTest, DecouplerOnUnknownNodeIsNotLowest) {
    // ghost hangs off a node tank-m does not have, so it is left at the origin
    std::vector<Part> parts;
    parts.push_back(catalog_.makePart("cmd-mk1", "pod"));
    parts.push_back(catalog_.makePart("decoupler-s", "dec-a", "pod", "bottom"));
    parts.push_back(catalog_.makePart("tank-m", "tank", "dec-a", "bottom"));
    parts.push_back(catalog_.makePart("decoupler-s", "ghost", "tank", "side"));
    parts.push_back(catalog_.makePart("tank-s", "ghost-tank", "ghost", "bottom"));

    vehicle::VehicleTree tree(parts);
    int target = StagingLogic::select_next_decoupler(parts, tree);
    ASSERT_GE(target, 0);
    EXPECT_EQ(parts[static_cast<size_t>(target)].instance_id, "dec-a");
}

TEST_F(StagingTest, NoDecouplerSelectsNothing) {
    std::vector<Part> parts = {catalog_.makePart("cmd-mk1", "pod")};
    vehicle::VehicleTree tree(parts);
    EXPECT_EQ(StagingLogic::select_next_decoupler(parts, tree), -1);
}

TEST_F(StagingTest, StagingCreatesDebrisFromSubtree) {
    ASSERT_TRUE(StagingLogic::perform_stage(state_, 1.0));

    ASSERT_EQ(state_.parts.size(), 5u);
    EXPECT_EQ(indexOf(state_.parts, "dec-lower"), state_.parts.size());
    EXPECT_EQ(indexOf(state_.parts, "eng-lower"), state_.parts.size());

    ASSERT_EQ(state_.debris.size(), 1u);
    const Debris& debris = state_.debris.front();
    EXPECT_EQ(debris.id, "debris-dec-lower");
    EXPECT_EQ(debris.parts.size(), 3u);
    for (const auto& p : debris.parts) {
        EXPECT_FALSE(p.is_thrusting);
    }

    // Debris root is the fired decoupler
    size_t root = indexOf(debris.parts, "dec-lower");
    ASSERT_LT(root, debris.parts.size());
    EXPECT_TRUE(debris.parts[root].isRoot());

    ASSERT_FALSE(state_.events.empty());
    EXPECT_EQ(state_.events.back(), "Staged: TR-18A Stack Decoupler");
}

TEST_F(StagingTest, DebrisInheritsKinematicsWithSeparationPush) {
    StagingLogic::perform_stage(state_, 1.0);
    const Debris& debris = state_.debris.front();

    EXPECT_EQ(debris.body.position, state_.body.position);
    EXPECT_DOUBLE_EQ(debris.body.rotation, state_.body.rotation);
    EXPECT_DOUBLE_EQ(debris.body.angular_velocity, state_.body.angular_velocity);
    // Heading at rotation 0 is (0, -1), the push goes the other way
    EXPECT_NEAR(debris.body.velocity.x(), 120.0, 1e-12);
    EXPECT_NEAR(debris.body.velocity.y(), -29.0, 1e-12);
}

TEST_F(StagingTest, StagedPartsAreDeepCopies) {
    StagingLogic::perform_stage(state_, 1.0);
    Debris& debris = state_.debris.front();
    size_t tank = indexOf(debris.parts, "tank-lower");
    ASSERT_LT(tank, debris.parts.size());

    debris.parts[tank].current_fuel = 0.0;
    EXPECT_DOUBLE_EQ(utils::totalFuel(state_.parts), 500.0);
}

TEST_F(StagingTest, StagesInOrderThenDeploysParachutes) {
    ASSERT_TRUE(StagingLogic::perform_stage(state_, 1.0));
    ASSERT_TRUE(StagingLogic::perform_stage(state_, 1.0));
    EXPECT_EQ(state_.debris.size(), 2u);
    EXPECT_EQ(state_.debris.back().id, "debris-dec-upper");
    ASSERT_EQ(state_.parts.size(), 2u);

    ASSERT_TRUE(StagingLogic::perform_stage(state_, 1.0));
    EXPECT_EQ(state_.events.back(), "Parachutes deployed");
    EXPECT_TRUE(state_.parts[indexOf(state_.parts, "chute")].is_deployed);

    // Nothing left to do
    size_t events = state_.events.size();
    EXPECT_FALSE(StagingLogic::perform_stage(state_, 1.0));
    EXPECT_EQ(state_.events.size(), events);
}

TEST_F(StagingTest, DeployParachutesCountsNewDeployments) {
    EXPECT_EQ(StagingLogic::deploy_parachutes(state_.parts), 1);
    EXPECT_EQ(StagingLogic::deploy_parachutes(state_.parts), 0);
}

TEST(StageAnalysisTest, TwoStageVehicle) {
    vehicle::PartCatalog catalog;
    std::vector<Part> parts;
    parts.push_back(catalog.makePart("cmd-mk1", "pod"));
    parts.push_back(catalog.makePart("decoupler-s", "dec", "pod", "bottom"));
    parts.push_back(catalog.makePart("tank-m", "tank", "dec", "bottom"));
    parts.push_back(catalog.makePart("eng-swivel", "eng", "tank", "bottom"));

    const double g0 = 9.81;
    std::vector<StageStats> stats = calculate_stage_stats(parts, g0);
    ASSERT_EQ(stats.size(), 2u);

    const StageStats& booster = stats[0];
    EXPECT_EQ(booster.stage_index, 1);
    EXPECT_EQ(booster.part_count, 2);
    EXPECT_DOUBLE_EQ(booster.dry_mass, 1750.0);
    EXPECT_DOUBLE_EQ(booster.wet_mass, 3750.0);
    EXPECT_DOUBLE_EQ(booster.start_mass, 4600.0);
    EXPECT_DOUBLE_EQ(booster.end_mass, 2600.0);
    EXPECT_DOUBLE_EQ(booster.thrust, 215000.0);
    EXPECT_NEAR(booster.isp, 215000.0 / (80.0 * g0), 1e-9);
    EXPECT_NEAR(booster.delta_v, 215000.0 / 80.0 * std::log(4600.0 / 2600.0), 1e-6);
    EXPECT_NEAR(booster.burn_time, 25.0, 1e-12);
    EXPECT_NEAR(booster.twr, 215000.0 / (4600.0 * g0), 1e-9);

    const StageStats& payload = stats[1];
    EXPECT_EQ(payload.stage_index, 0);
    EXPECT_EQ(payload.part_count, 2);
    EXPECT_DOUBLE_EQ(payload.start_mass, 850.0);
    EXPECT_EQ(payload.delta_v, 0.0);
    EXPECT_EQ(payload.twr, 0.0);
}

TEST(StageAnalysisTest, RootlessListIsEmpty) {
    EXPECT_TRUE(calculate_stage_stats({}).empty());
}
