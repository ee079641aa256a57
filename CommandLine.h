#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#include <cstdint>
#include <string>
#include <vector>
#include "SimulationConfig.h"

struct CommandLineOptions {
    SimulationConfig config;
    std::string config_file; // empty: no --config given
    bool demo = false;
};

// How a batched run splits the requested games
struct BatchPlan {
    long long batches = 0;          // 0: plain run without intervals
    long long rounds_per_batch = 0;
    long long skipped_games = 0;    // games dropped so that every batch has the same size
};

/**
 * @brief Parses an integer argument, rejecting trailing characters.
 * @throws MontyHall::InvalidArgument if the text is not a whole integer in range.
 */
long long parseCount(const std::string& text, const std::string& what);

/**
 * @brief Builds the run settings from the program arguments (without the program name).
 *
 * The --config file is read first, every other flag then overrides its values.
 *
 * @throws MontyHall::InvalidArgument for unknown or malformed values.
 * @throws std::runtime_error if the config file cannot be loaded.
 */
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Splits config.num_games into config.batches equal batches.
 *
 * Leftover games are dropped with a [Warning].
 *
 * @throws MontyHall::InvalidArgument if there are fewer games than batches.
 */
BatchPlan planBatches(const SimulationConfig& config);

// Seed for the --demo round, kept apart from the stream the simulator draws from
std::uint32_t demoSeed(std::uint32_t seed);

#endif // COMMAND_LINE_H
