#ifndef MONTE_CARLO_SIMULATOR_H
#define MONTE_CARLO_SIMULATOR_H

#include <vector>
#include <random>
#include <iostream>
#include "MontyHallGame.h"

// Struct to hold confidence interval results
struct ConfidenceInterval {
    double level;
    double lower_bound;
    double upper_bound;
};

// One row of the proportions table
struct StrategyRow {
    MontyHall::Strategy strategy;
    long long wins = 0;
    long long losses = 0;
    double win = 0.0;   // rounded to the table precision
    double lose = 0.0;  // 1 - win, so the row sums to exactly 1
    std::vector<ConfidenceInterval> confidence_intervals; // empty unless run in batches
};

struct BatchResult {
    long long num_games = 0;
    int precision = 2;
    // (strategy, outcome) for every round: round 1 stay, round 1 switch, round 2 stay, ...
    std::vector<MontyHall::RoundResult> results;
    std::vector<StrategyRow> proportions; // rows: stay, switch
};

class MonteCarloSimulator {
public:
    MonteCarloSimulator();
    explicit MonteCarloSimulator(std::mt19937::result_type seed);

    // Decimal places used for the proportions table. Must be in [0, 10].
    void setPrecision(int decimals);

    // --- Main Execution ---
    // Batch run: k batches of m rounds, with batched-means confidence intervals per strategy
    void run(long long k_batches, long long m_batch_size, bool useParallel);
    // Plain run of n rounds
    void run(long long numGames, bool useParallel = false);

    const BatchResult& getBatchResult() const { return m_batch_result; }
    void printResults(std::ostream& out = std::cout) const;

private:
    std::mt19937 m_rng; // Master RNG; also seeds the parallel batches
    int m_precision = 2;

    BatchResult m_batch_result; // only replaced once a run completes

    // Counts gathered while a run is in progress
    struct RunTally {
        long long stay_wins = 0;
        long long switch_wins = 0;
        // Win proportion of each batch, per strategy
        std::vector<double> stay_batch_means;
        std::vector<double> switch_batch_means;
        std::vector<MontyHall::RoundResult> results;
    };

    // --- Private Runner Methods ---
    void runSingleThread(long long numGames, long long batchSize, RunTally& tally);
    void runParallel(long long numGames, long long batchSize, RunTally& tally);

    // --- Private Helper Methods ---
    BatchResult analyzeResults(RunTally& tally, long long numGames, long long k) const;
    StrategyRow buildRow(MontyHall::Strategy strategy, long long wins, long long numGames,
                         const std::vector<double>& batch_means, long long k) const;
};

#endif // MONTE_CARLO_SIMULATOR_H
