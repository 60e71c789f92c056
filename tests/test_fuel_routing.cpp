#include <gtest/gtest.h>
#include <algorithm>
#include "../src/flightsim/types.hpp"
#include "../src/flightsim/propulsion/fuel_routing.hpp"
#include "../src/flightsim/vehicle/part_catalog.hpp"
#include "../src/flightsim/vehicle/vehicle_tree.hpp"

using namespace flightsim;
using namespace flightsim::propulsion;

class FuelRoutingTest : public ::testing::Test {
protected:
    Part tank(const std::string& id, const std::string& parent, double fuel, double capacity = 1000.0) {
        Part p;
        p.type = PartType::TANK;
        p.mass = 10.0;
        p.width = 1.0;
        p.fuel_capacity = capacity;
        p.current_fuel = fuel;
        p.instance_id = id;
        p.parent_id = parent;
        return p;
    }

    Part engine(const std::string& id, const std::string& parent) {
        Part p = catalog_.makePart("eng-swivel", id, parent, "bottom");
        return p;
    }

    Part decoupler(const std::string& id, const std::string& parent) {
        return catalog_.makePart("decoupler-s", id, parent, "bottom");
    }

    static bool contains(const std::vector<FuelSource>& sources, size_t index, int distance) {
        return std::any_of(sources.begin(), sources.end(), [&](const FuelSource& s) {
            return s.part_index == index && s.distance == distance;
        });
    }

    vehicle::PartCatalog catalog_;
};

TEST_F(FuelRoutingTest, TankAdjacentToEngineIsDistanceOne) {
    std::vector<Part> parts = {tank("t", "", 100.0), engine("e", "t")};
    vehicle::VehicleTree tree(parts);

    std::vector<FuelSource> sources = find_fuel_sources(1, parts, tree);
    ASSERT_EQ(sources.size(), 1u);
    EXPECT_EQ(sources[0].part_index, 0u);
    EXPECT_EQ(sources[0].distance, 1);
}

TEST_F(FuelRoutingTest, DecouplerBlocksFuelFlow) {
    std::vector<Part> parts = {tank("t", "", 100.0), decoupler("d", "t"), engine("e", "d")};
    vehicle::VehicleTree tree(parts);

    EXPECT_TRUE(find_fuel_sources(2, parts, tree).empty());
}

TEST_F(FuelRoutingTest, DecouplerBlocksInBothDirections) {
    // Engine above a decoupler cannot reach the tank hanging below it
    std::vector<Part> parts = {engine("e", ""), decoupler("d", "e"), tank("t", "d", 100.0)};
    parts[0].parent_id.clear();
    vehicle::VehicleTree tree(parts);

    EXPECT_TRUE(find_fuel_sources(0, parts, tree).empty());
}

TEST_F(FuelRoutingTest, SearchesParentsAndChildren) {
    // upper -> engine -> lower
    std::vector<Part> parts = {tank("upper", "", 50.0), engine("e", "upper"), tank("lower", "e", 70.0)};
    vehicle::VehicleTree tree(parts);

    std::vector<FuelSource> sources = find_fuel_sources(1, parts, tree);
    EXPECT_EQ(sources.size(), 2u);
    EXPECT_TRUE(contains(sources, 0, 1));
    EXPECT_TRUE(contains(sources, 2, 1));
}

TEST_F(FuelRoutingTest, DistancesCountHops) {
    std::vector<Part> parts = {tank("far", "", 10.0), tank("near", "far", 10.0), engine("e", "near")};
    vehicle::VehicleTree tree(parts);

    std::vector<FuelSource> sources = find_fuel_sources(2, parts, tree);
    EXPECT_TRUE(contains(sources, 1, 1));
    EXPECT_TRUE(contains(sources, 0, 2));
}

TEST_F(FuelRoutingTest, EngineOwnFuelIsDistanceZero) {
    std::vector<Part> parts = {tank("t", "", 10.0), engine("e", "t")};
    parts[1].fuel_capacity = 40.0;
    parts[1].current_fuel = 40.0;
    vehicle::VehicleTree tree(parts);

    std::vector<FuelSource> sources = find_fuel_sources(1, parts, tree);
    EXPECT_TRUE(contains(sources, 1, 0));
    EXPECT_TRUE(contains(sources, 0, 1));
}

TEST_F(FuelRoutingTest, StackDecouplerBelowBlocksEngine) {
    std::vector<Part> parts = {tank("t", "", 100.0), engine("upper", "t"), decoupler("d", "upper"),
                               tank("t2", "d", 100.0), engine("lower", "t2")};
    vehicle::VehicleTree tree(parts);

    EXPECT_TRUE(is_engine_blocked_by_stage(1, parts, tree));
    EXPECT_FALSE(is_engine_blocked_by_stage(4, parts, tree));
}

TEST_F(FuelRoutingTest, RadialDecouplerDoesNotBlockEngine) {
    std::vector<Part> parts = {tank("t", "", 100.0), engine("e", "t"),
                               catalog_.makePart("decoupler-r", "r", "e", "bottom")};
    vehicle::VehicleTree tree(parts);

    EXPECT_FALSE(is_engine_blocked_by_stage(1, parts, tree));
}

TEST_F(FuelRoutingTest, PlanDrainsFarthestTierFirst) {
    std::vector<Part> parts = {tank("far", "", 100.0), tank("near", "far", 100.0), engine("e", "near")};
    vehicle::VehicleTree tree(parts);

    EngineDraw draw = plan_engine_draw(2, 30.0, parts, tree);
    ASSERT_EQ(draw.claims.size(), 1u);
    EXPECT_EQ(draw.claims[0].tank_index, 0u);
    EXPECT_NEAR(draw.claims[0].amount, 30.0, 1e-12);

    // Planning never touches fuel
    EXPECT_DOUBLE_EQ(parts[0].current_fuel, 100.0);
}

TEST_F(FuelRoutingTest, PlanSpillsIntoNearerTier) {
    std::vector<Part> parts = {tank("far", "", 10.0), tank("near", "far", 100.0), engine("e", "near")};
    vehicle::VehicleTree tree(parts);

    EngineDraw draw = plan_engine_draw(2, 30.0, parts, tree);
    ASSERT_EQ(draw.claims.size(), 2u);
    EXPECT_EQ(draw.claims[0].tank_index, 0u);
    EXPECT_NEAR(draw.claims[0].amount, 10.0, 1e-12);
    EXPECT_EQ(draw.claims[1].tank_index, 1u);
    EXPECT_NEAR(draw.claims[1].amount, 20.0, 1e-12);
}

TEST_F(FuelRoutingTest, PlanSplitsTierProportionally) {
    std::vector<Part> parts = {engine("e", ""), tank("a", "e", 100.0), tank("b", "e", 50.0)};
    parts[0].parent_id.clear();
    vehicle::VehicleTree tree(parts);

    EngineDraw draw = plan_engine_draw(0, 30.0, parts, tree);
    ASSERT_EQ(draw.claims.size(), 2u);
    EXPECT_NEAR(draw.claims[0].amount, 20.0, 1e-9);
    EXPECT_NEAR(draw.claims[1].amount, 10.0, 1e-9);
}

TEST_F(FuelRoutingTest, PlanIgnoresEmptyTanks) {
    std::vector<Part> parts = {tank("t", "", 0.0), engine("e", "t")};
    vehicle::VehicleTree tree(parts);

    EngineDraw draw = plan_engine_draw(1, 30.0, parts, tree);
    EXPECT_TRUE(draw.claims.empty());
    EXPECT_DOUBLE_EQ(draw.demand, 30.0);
}
