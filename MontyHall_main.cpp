/*
 * ============================================================================
 * Monty Hall Simulator - Main Execution File
 * ============================================================================
 *
 * HOW TO BUILD AND RUN:
 * ---------------------
 *   cmake -B build
 *   cmake --build build
 *   ./build/montyhall_simulator                 # 100 games
 *   ./build/montyhall_simulator 10000 --seed 7  # reproducible run
 *
 * OPTIONS:
 * --------
 *   [num_games]        Number of rounds to play (default 100)
 *   --config FILE      JSON settings, see MontyHall_Config.json
 *   --seed N           Fixed seed for a reproducible run
 *   --batches K        Split the run into K batches and report confidence intervals
 *   --parallel         Run batches on all cores (OpenMP)
 *   --precision P      Decimal places in the proportions table (default 2)
 *   --demo             Also play and narrate a single round
 *
 * Command-line options override values from the config file.
 * ============================================================================
 */

#include "CommandLine.h"
#include "MonteCarloSimulator.h"
#include "MontyHallGame.h"
#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        // --- Configuration ---
        const CommandLineOptions options = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
        const SimulationConfig& config = options.config;

        // --- Initialization ---
        const std::uint32_t seed = config.seed
            ? *config.seed
            : static_cast<std::uint32_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
        std::cout << "[Init] Games: " << config.num_games
                  << " | Seed: " << seed
                  << " | Config File: " << (options.config_file.empty() ? "(none)" : options.config_file) << std::endl;

        MonteCarloSimulator simulator(seed);
        simulator.setPrecision(config.precision);

        if (options.demo) {
            std::mt19937 demo_rng(demoSeed(seed));
            MontyHall::RoundReport round = MontyHall::playRound(demo_rng);
            std::cout << "\n------ Single Round Walkthrough ------" << std::endl;
            MontyHall::printRoundReport(round, MontyHall::Strategy::Stay, std::cout);
            std::cout << std::endl;
            MontyHall::printRoundReport(round, MontyHall::Strategy::Switch, std::cout);
        }

        // --- Execution ---
        const BatchPlan plan = planBatches(config);
        if (plan.batches > 0) {
            simulator.run(plan.batches, plan.rounds_per_batch, config.use_parallel);
        } else {
            simulator.run(config.num_games, config.use_parallel);
        }

        simulator.printResults(std::cout);

    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
