#include "MonteCarloSimulator.h"
#include <gtest/gtest.h>
#include <omp.h>
#include <limits>
#include <sstream>
#include <stdexcept>

using MontyHall::Outcome;
using MontyHall::Strategy;

namespace {

void expectSameResults(const BatchResult& a, const BatchResult& b) {
    ASSERT_EQ(a.results.size(), b.results.size());
    for (size_t i = 0; i < a.results.size(); ++i) {
        ASSERT_EQ(a.results[i].strategy, b.results[i].strategy) << "result " << i;
        ASSERT_EQ(a.results[i].outcome, b.results[i].outcome) << "result " << i;
    }
    ASSERT_EQ(a.proportions.size(), b.proportions.size());
    for (size_t i = 0; i < a.proportions.size(); ++i) {
        EXPECT_EQ(a.proportions[i].wins, b.proportions[i].wins);
        EXPECT_DOUBLE_EQ(a.proportions[i].win, b.proportions[i].win);
    }
}

} // namespace

TEST(MonteCarloSimulatorTest, RejectsFewerThanOneGame) {
    MonteCarloSimulator simulator(1);
    EXPECT_THROW(simulator.run(0), MontyHall::InvalidArgument);
    EXPECT_THROW(simulator.run(-5), std::invalid_argument);
    EXPECT_THROW(simulator.run(0, true), MontyHall::InvalidArgument);
}

TEST(MonteCarloSimulatorTest, SingleGameGivesTwoResultsAndADegenerateTable) {
    MonteCarloSimulator simulator(31);
    simulator.run(1);
    const BatchResult& result = simulator.getBatchResult();

    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.results[0].strategy, Strategy::Stay);
    EXPECT_EQ(result.results[1].strategy, Strategy::Switch);
    EXPECT_EQ(result.num_games, 1);

    ASSERT_EQ(result.proportions.size(), 2u);
    EXPECT_EQ(result.proportions[0].strategy, Strategy::Stay);
    EXPECT_EQ(result.proportions[1].strategy, Strategy::Switch);
    for (const StrategyRow& row : result.proportions) {
        EXPECT_TRUE((row.win == 1.0 && row.lose == 0.0) || (row.win == 0.0 && row.lose == 1.0));
        EXPECT_TRUE(row.confidence_intervals.empty());
    }
    EXPECT_NE(result.proportions[0].win, result.proportions[1].win);
}

TEST(MonteCarloSimulatorTest, ResultsAreRoundMajorWithOneWinnerPerRound) {
    MonteCarloSimulator simulator(8);
    simulator.run(500);
    const BatchResult& result = simulator.getBatchResult();

    ASSERT_EQ(result.results.size(), 1000u);
    long long stay_wins = 0;
    for (size_t i = 0; i < result.results.size(); i += 2) {
        EXPECT_EQ(result.results[i].strategy, Strategy::Stay);
        EXPECT_EQ(result.results[i + 1].strategy, Strategy::Switch);
        EXPECT_NE(result.results[i].outcome, result.results[i + 1].outcome);
        if (result.results[i].outcome == Outcome::Win) stay_wins++;
    }
    EXPECT_EQ(result.proportions[0].wins, stay_wins);
    EXPECT_EQ(result.proportions[0].wins + result.proportions[0].losses, 500);
    EXPECT_EQ(result.proportions[1].wins, 500 - stay_wins);
}

TEST(MonteCarloSimulatorTest, SwitchingWinsTwoThirdsOfTheTime) {
    MonteCarloSimulator simulator(12345);
    simulator.run(10000);
    const BatchResult& result = simulator.getBatchResult();

    EXPECT_NEAR(result.proportions[0].win, 0.33, 0.03);
    EXPECT_NEAR(result.proportions[1].win, 0.67, 0.03);
    for (const StrategyRow& row : result.proportions) {
        EXPECT_NEAR(row.win + row.lose, 1.0, 1e-9);
    }
}

TEST(MonteCarloSimulatorTest, SameSeedReproducesTheBatch) {
    MonteCarloSimulator first(2024);
    MonteCarloSimulator second(2024);
    first.run(2000);
    second.run(2000);
    expectSameResults(first.getBatchResult(), second.getBatchResult());
}

TEST(MonteCarloSimulatorTest, ParallelRunDoesNotDependOnThreadCount) {
    const int saved_threads = omp_get_max_threads();

    omp_set_num_threads(1);
    MonteCarloSimulator one_thread(404);
    one_thread.run(25000, true);

    omp_set_num_threads(4);
    MonteCarloSimulator four_threads(404);
    four_threads.run(25000, true);

    omp_set_num_threads(saved_threads);

    expectSameResults(one_thread.getBatchResult(), four_threads.getBatchResult());
}

TEST(MonteCarloSimulatorTest, ParallelRunKeepsRoundInvariants) {
    MonteCarloSimulator simulator(55);
    simulator.run(20001, true);
    const BatchResult& result = simulator.getBatchResult();

    ASSERT_EQ(result.results.size(), 40002u);
    long long switch_wins = 0;
    for (size_t i = 0; i < result.results.size(); i += 2) {
        ASSERT_EQ(result.results[i].strategy, Strategy::Stay);
        ASSERT_EQ(result.results[i + 1].strategy, Strategy::Switch);
        ASSERT_NE(result.results[i].outcome, result.results[i + 1].outcome);
        if (result.results[i + 1].outcome == Outcome::Win) switch_wins++;
    }
    EXPECT_EQ(result.proportions[1].wins, switch_wins);
    EXPECT_NEAR(result.proportions[1].win, 0.67, 0.03);
}

TEST(MonteCarloSimulatorTest, BatchRunReportsConfidenceIntervals) {
    MonteCarloSimulator simulator(9);
    simulator.run(50, 200, false);
    const BatchResult& result = simulator.getBatchResult();

    EXPECT_EQ(result.num_games, 10000);
    ASSERT_EQ(result.results.size(), 20000u);

    const double expected[] = {1.0 / 3.0, 2.0 / 3.0};
    for (size_t r = 0; r < result.proportions.size(); ++r) {
        const StrategyRow& row = result.proportions[r];
        ASSERT_EQ(row.confidence_intervals.size(), 3u);
        EXPECT_DOUBLE_EQ(row.confidence_intervals[0].level, 90.0);
        EXPECT_DOUBLE_EQ(row.confidence_intervals[2].level, 99.0);

        const ConfidenceInterval& ci99 = row.confidence_intervals[2];
        EXPECT_LT(ci99.lower_bound, ci99.upper_bound);
        EXPECT_NEAR((ci99.lower_bound + ci99.upper_bound) / 2.0, expected[r], 0.03);
        EXPECT_LT(ci99.upper_bound - ci99.lower_bound, 0.1);

        // Wider confidence, wider interval
        const ConfidenceInterval& ci90 = row.confidence_intervals[0];
        EXPECT_LE(ci99.lower_bound, ci90.lower_bound);
        EXPECT_GE(ci99.upper_bound, ci90.upper_bound);
    }
}

TEST(MonteCarloSimulatorTest, ParallelBatchRunMatchesItself) {
    MonteCarloSimulator first(77);
    MonteCarloSimulator second(77);
    first.run(8, 500, true);
    second.run(8, 500, true);
    expectSameResults(first.getBatchResult(), second.getBatchResult());
    EXPECT_EQ(first.getBatchResult().proportions[0].confidence_intervals.size(), 3u);
}

TEST(MonteCarloSimulatorTest, SingleBatchHasNoInterval) {
    MonteCarloSimulator simulator(6);
    simulator.run(1, 100, false);
    for (const StrategyRow& row : simulator.getBatchResult().proportions) {
        EXPECT_TRUE(row.confidence_intervals.empty());
    }
}

TEST(MonteCarloSimulatorTest, BatchRunRejectsEmptyBatches) {
    MonteCarloSimulator simulator(6);
    EXPECT_THROW(simulator.run(0, 100, false), MontyHall::InvalidArgument);
    EXPECT_THROW(simulator.run(10, 0, true), MontyHall::InvalidArgument);
}

TEST(MonteCarloSimulatorTest, BatchRunRejectsOverflowingRoundCount) {
    MonteCarloSimulator simulator(6);
    const long long max = std::numeric_limits<long long>::max();
    EXPECT_THROW(simulator.run(max / 2, 4, false), MontyHall::InvalidArgument);
    EXPECT_THROW(simulator.run(3, max, false), MontyHall::InvalidArgument);
    EXPECT_THROW(simulator.run(max, true), MontyHall::InvalidArgument);
}

TEST(MonteCarloSimulatorTest, FailedRunKeepsPreviousResults) {
    MonteCarloSimulator simulator(17);
    simulator.run(20);
    const BatchResult before = simulator.getBatchResult();

    EXPECT_THROW(simulator.run(0), MontyHall::InvalidArgument);
    EXPECT_THROW(simulator.run(3, std::numeric_limits<long long>::max(), false), MontyHall::InvalidArgument);

    const BatchResult& after = simulator.getBatchResult();
    EXPECT_EQ(after.num_games, 20);
    EXPECT_EQ(after.results.size(), 40u);
    expectSameResults(before, after);
}

TEST(MonteCarloSimulatorTest, RunReplacesPreviousResults) {
    MonteCarloSimulator simulator(17);
    simulator.run(300);
    simulator.run(20);
    EXPECT_EQ(simulator.getBatchResult().results.size(), 40u);
    EXPECT_EQ(simulator.getBatchResult().proportions.size(), 2u);
    EXPECT_EQ(simulator.getBatchResult().proportions[0].wins + simulator.getBatchResult().proportions[0].losses, 20);
}

TEST(MonteCarloSimulatorTest, PrecisionIsConfigurable) {
    MonteCarloSimulator simulator(21);
    EXPECT_THROW(simulator.setPrecision(-1), MontyHall::InvalidArgument);
    EXPECT_THROW(simulator.setPrecision(11), MontyHall::InvalidArgument);

    simulator.setPrecision(3);
    simulator.run(777);
    const BatchResult& result = simulator.getBatchResult();
    EXPECT_EQ(result.precision, 3);
    const StrategyRow& stay = result.proportions[0];
    EXPECT_NEAR(stay.win, static_cast<double>(stay.wins) / 777, 0.0005 + 1e-12);
    EXPECT_NEAR(stay.win + stay.lose, 1.0, 1e-9);
}

TEST(MonteCarloSimulatorTest, PrintsProportionsTable) {
    MonteCarloSimulator simulator(3);
    simulator.run(1);
    std::ostringstream out;
    simulator.printResults(out);
    const std::string text = out.str();

    EXPECT_NE(text.find("Games Played:      1"), std::string::npos);
    EXPECT_NE(text.find("WIN"), std::string::npos);
    EXPECT_NE(text.find("LOSE"), std::string::npos);
    EXPECT_NE(text.find("stay"), std::string::npos);
    EXPECT_NE(text.find("switch"), std::string::npos);
    EXPECT_NE(text.find("1.00"), std::string::npos);
    EXPECT_NE(text.find("0.00"), std::string::npos);
    EXPECT_EQ(text.find("Confidence Interval"), std::string::npos);
}

TEST(MonteCarloSimulatorTest, PrintsIntervalsForBatchRuns) {
    MonteCarloSimulator simulator(3);
    simulator.run(10, 100, false);
    std::ostringstream out;
    simulator.printResults(out);
    EXPECT_NE(out.str().find("95.0% Confidence Interval"), std::string::npos);
    EXPECT_NE(out.str().find("Batched Means"), std::string::npos);
}
