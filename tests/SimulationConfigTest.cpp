#include "SimulationConfig.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

TEST(SimulationConfigTest, EmptyObjectKeepsDefaults) {
    SimulationConfig config = parseSimulationConfig("{}");
    EXPECT_EQ(config.num_games, 100);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_FALSE(config.use_parallel);
    EXPECT_EQ(config.batches, 0);
    EXPECT_EQ(config.precision, 2);
}

TEST(SimulationConfigTest, ReadsEveryKey) {
    SimulationConfig config = parseSimulationConfig(
        R"({"num_games": 5000, "seed": 42, "use_parallel": true, "batches": 50, "precision": 3})");
    EXPECT_EQ(config.num_games, 5000);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 42u);
    EXPECT_TRUE(config.use_parallel);
    EXPECT_EQ(config.batches, 50);
    EXPECT_EQ(config.precision, 3);
}

TEST(SimulationConfigTest, NullSeedMeansClockSeeded) {
    SimulationConfig config = parseSimulationConfig(R"({"seed": null})");
    EXPECT_FALSE(config.seed.has_value());
}

TEST(SimulationConfigTest, RejectsMalformedJson) {
    EXPECT_THROW(parseSimulationConfig("{\"num_games\": "), std::runtime_error);
    EXPECT_THROW(parseSimulationConfig("[1, 2, 3]"), std::runtime_error);
}

TEST(SimulationConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(parseSimulationConfig(R"({"num_games": "many"})"), std::runtime_error);
    EXPECT_THROW(parseSimulationConfig(R"({"use_parallel": 1})"), std::runtime_error);
}

TEST(SimulationConfigTest, RejectsNegativeSeed) {
    EXPECT_THROW(parseSimulationConfig(R"({"seed": -1})"), std::runtime_error);
}

TEST(SimulationConfigTest, RejectsSeedAbove32Bits) {
    EXPECT_THROW(parseSimulationConfig(R"({"seed": 4294967296})"), std::runtime_error);
    SimulationConfig config = parseSimulationConfig(R"({"seed": 4294967295})");
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 4294967295u);
}

TEST(SimulationConfigTest, RejectsNegativeBatches) {
    EXPECT_THROW(parseSimulationConfig(R"({"batches": -4})"), std::runtime_error);
}

TEST(SimulationConfigTest, RejectsFewerThanOneGame) {
    EXPECT_THROW(parseSimulationConfig(R"({"num_games": 0})"), std::runtime_error);
    EXPECT_THROW(parseSimulationConfig(R"({"num_games": -10})"), std::runtime_error);
}

TEST(SimulationConfigTest, RejectsPrecisionOutOfRange) {
    EXPECT_THROW(parseSimulationConfig(R"({"precision": 11})"), std::runtime_error);
    EXPECT_THROW(parseSimulationConfig(R"({"precision": -1})"), std::runtime_error);
}

TEST(SimulationConfigTest, LoadsFromFile) {
    const std::string path = testing::TempDir() + "montyhall_config_test.json";
    {
        std::ofstream file(path);
        ASSERT_TRUE(file.is_open());
        file << R"({"num_games": 250, "seed": 7})";
    }
    SimulationConfig config = loadSimulationConfig(path);
    EXPECT_EQ(config.num_games, 250);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 7u);
    std::remove(path.c_str());
}

TEST(SimulationConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadSimulationConfig(testing::TempDir() + "no_such_montyhall_config.json"), std::runtime_error);
}
