#include "SimulationConfig.h"
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static std::uint32_t readSeed(const json& seed) {
    // Non-negative literals parse as unsigned; a negative seed must not wrap around.
    if (!seed.is_number_unsigned() || seed.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("\"seed\" must be an integer between 0 and "
                                 + std::to_string(std::numeric_limits<std::uint32_t>::max()) + ", got "
                                 + seed.dump() + ".");
    }
    return static_cast<std::uint32_t>(seed.get<std::uint64_t>());
}

static SimulationConfig fromJSON(const json& data) {
    SimulationConfig config;
    if (!data.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object.");
    }

    try {
        if (data.contains("num_games")) config.num_games = data.at("num_games").get<long long>();
        if (data.contains("seed") && !data.at("seed").is_null()) {
            config.seed = readSeed(data.at("seed"));
        }
        if (data.contains("use_parallel")) config.use_parallel = data.at("use_parallel").get<bool>();
        if (data.contains("batches")) config.batches = data.at("batches").get<long long>();
        if (data.contains("precision")) config.precision = data.at("precision").get<int>();
    } catch (json::exception& e) {
        throw std::runtime_error("JSON configuration error: " + std::string(e.what()));
    }

    if (config.num_games < 1) {
        throw std::runtime_error("\"num_games\" must be at least 1, got " + std::to_string(config.num_games) + ".");
    }
    if (config.batches < 0) {
        throw std::runtime_error("\"batches\" must not be negative, got " + std::to_string(config.batches) + ".");
    }
    if (config.precision < 0 || config.precision > 10) {
        throw std::runtime_error("\"precision\" must be between 0 and 10, got "
                                 + std::to_string(config.precision) + ".");
    }
    return config;
}

SimulationConfig parseSimulationConfig(const std::string& json_text) {
    json data;
    try {
        data = json::parse(json_text);
    } catch (json::exception& e) {
        throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
    }
    return fromJSON(data);
}

SimulationConfig loadSimulationConfig(const std::string& filename) {
    std::cout << "[Config] Loading simulator settings from '" << filename << "'..." << std::endl;

    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open JSON file: " + filename);
    }

    json data;
    try {
        data = json::parse(file);
    } catch (json::exception& e) {
        throw std::runtime_error("JSON parsing error in " + filename + ": " + std::string(e.what()));
    }

    SimulationConfig config = fromJSON(data);
    std::cout << "  Games:     " << config.num_games << std::endl;
    std::cout << "  Seed:      " << (config.seed ? std::to_string(*config.seed) : std::string("clock")) << std::endl;
    std::cout << "  Parallel:  " << (config.use_parallel ? "yes" : "no") << std::endl;
    std::cout << "  Batches:   " << config.batches << std::endl;
    std::cout << "  Precision: " << config.precision << std::endl;
    return config;
}
