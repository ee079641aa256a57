#ifndef SIMULATION_CONFIG_H
#define SIMULATION_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>

// Settings for one simulator invocation. Every field has a usable default.
struct SimulationConfig {
    long long num_games = 100;
    std::optional<std::uint32_t> seed; // unset: seeded from the clock
    bool use_parallel = false;
    long long batches = 0;             // 0: no batched-means confidence intervals
    int precision = 2;                 // decimals in the proportions table
};

/**
 * @brief Loads a simulator configuration from a JSON file.
 *
 * Recognized keys: "num_games", "seed", "use_parallel", "batches", "precision".
 * Missing keys keep their defaults.
 *
 * @param filename The path to the JSON configuration file.
 * @throws std::runtime_error if the file cannot be opened, holds invalid JSON or types, or a
 *         value is out of range (num_games < 1, negative seed or batches, precision outside [0, 10]).
 */
SimulationConfig loadSimulationConfig(const std::string& filename);

/**
 * @brief Parses a configuration from JSON text. Same rules as loadSimulationConfig().
 */
SimulationConfig parseSimulationConfig(const std::string& json_text);

#endif // SIMULATION_CONFIG_H
