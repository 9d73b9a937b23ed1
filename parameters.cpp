#include "parameters.hpp"
#include "utils.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <stdexcept>

InsertionMethod parse_insertion_method(const std::string& value) {
    if (value == "IA" || value == "exhaustive") return InsertionMethod::EXHAUSTIVE;
    if (value == "IB" || value == "randomized-restricted") return InsertionMethod::RANDOMIZED_RESTRICTED;
    throw std::invalid_argument("unknown insertion method '" + value + "'");
}

ObjectiveMode parse_objective_mode(const std::string& value) {
    if (value == "pooled") return ObjectiveMode::POOLED;
    if (value == "served") return ObjectiveMode::SERVED;
    throw std::invalid_argument("unknown objective mode '" + value + "'");
}

std::string to_string(InsertionMethod method) {
    return method == InsertionMethod::EXHAUSTIVE ? "IA" : "IB";
}

std::string to_string(ObjectiveMode mode) {
    return mode == ObjectiveMode::POOLED ? "pooled" : "served";
}

static bool parse_flag(const std::string& value) {
    if (value == "1" || value == "true" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "no") return false;
    throw std::invalid_argument("not a boolean: " + value);
}

void load_parameters_from_file(const std::string& filename, GRASP_Params& grasp_params, Instance_Params& instance_params) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "WARNING: could not open parameter file '" << filename << "'. Using default values." << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string key, value;
        if (std::getline(ss, key, '=') && std::getline(ss, value)) {
            trim(key);
            trim(value);

            try {
                // GRASP parameters
                if (key == "alpha") grasp_params.alpha = std::stod(value);
                else if (key == "beta") grasp_params.beta = std::stod(value);
                else if (key == "limitRCL") grasp_params.limitRCL = std::stod(value);
                else if (key == "capacity") grasp_params.capacity = std::stoi(value);
                else if (key == "speed") grasp_params.speed = std::stod(value);
                else if (key == "insertionMethod") grasp_params.insertionMethod = parse_insertion_method(value);
                else if (key == "objectiveMode") grasp_params.objectiveMode = parse_objective_mode(value);
                else if (key == "maxIterations") grasp_params.maxIterations = std::stoi(value);
                else if (key == "maxLocalSearchRounds") grasp_params.maxLocalSearchRounds = std::stoi(value);
                else if (key == "insertAttemptBudget") grasp_params.insertAttemptBudget = std::stoi(value);
                else if (key == "swapAttemptBudget") grasp_params.swapAttemptBudget = std::stoi(value);
                else if (key == "swapFraction") grasp_params.swapFraction = std::stod(value);
                else if (key == "timeBudget") grasp_params.timeBudget = std::stod(value);
                else if (key == "newRoutePenalty") grasp_params.newRoutePenalty = std::stod(value);
                else if (key == "recombine") grasp_params.recombine = parse_flag(value);
                else if (key == "recombineTimeLimit") grasp_params.recombineTimeLimit = std::stod(value);
                // Instance parameters
                else if (key == "timeWindow") instance_params.timeWindow = std::stoi(value);
                else if (key == "timeframe") instance_params.timeframe = std::stoi(value);
                else if (key == "size") instance_params.size = std::stoi(value);
                else if (key == "testSize") instance_params.testSize = std::stoi(value);
                else if (key == "nbTests") instance_params.nbTests = std::stoi(value);
                else if (key == "dataSaved") instance_params.dataSaved = parse_flag(value);
                else if (key == "checkpoint") instance_params.checkpoint = value;
                else if (key == "output") instance_params.output = value;
                else if (key == "fareBase") instance_params.fareBase = std::stod(value);
                else if (key == "farePerKm") instance_params.farePerKm = std::stod(value);
                else std::cerr << "WARNING: unknown parameter '" << key << "' ignored." << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "WARNING: invalid value '" << value << "' for key '" << key << "'. Keeping the default." << std::endl;
            }
        }
    }
    std::cout << "Parameters read from '" << filename << "'." << std::endl;
}

void validate_parameters(const GRASP_Params& grasp_params, const Instance_Params& instance_params) {
    if (!(grasp_params.alpha > 1.0))
        throw std::invalid_argument("alpha must be greater than 1");
    if (!(grasp_params.beta > 0.0 && grasp_params.beta <= 1.0))
        throw std::invalid_argument("beta must lie in (0, 1]");
    if (!(grasp_params.limitRCL > 0.0 && grasp_params.limitRCL <= 1.0))
        throw std::invalid_argument("limitRCL must lie in (0, 1]");
    if (grasp_params.capacity <= 0)
        throw std::invalid_argument("capacity must be positive");
    if (!(grasp_params.speed > 0.0))
        throw std::invalid_argument("speed must be positive");
    if (grasp_params.maxIterations < 0)
        throw std::invalid_argument("maxIterations must not be negative");
    if (grasp_params.maxLocalSearchRounds < 0)
        throw std::invalid_argument("maxLocalSearchRounds must not be negative");
    if (grasp_params.insertAttemptBudget <= 0)
        throw std::invalid_argument("insertAttemptBudget must be positive");
    if (grasp_params.swapAttemptBudget < 0)
        throw std::invalid_argument("swapAttemptBudget must not be negative");
    if (!(grasp_params.swapFraction >= 0.0 && grasp_params.swapFraction <= 1.0))
        throw std::invalid_argument("swapFraction must lie in [0, 1]");
    if (!(grasp_params.timeBudget >= 0.0))
        throw std::invalid_argument("timeBudget must not be negative");
    if (!(grasp_params.newRoutePenalty >= 0.0))
        throw std::invalid_argument("newRoutePenalty must not be negative");
    if (!(grasp_params.recombineTimeLimit >= 0.0))
        throw std::invalid_argument("recombineTimeLimit must not be negative");

    if (instance_params.timeWindow < 0)
        throw std::invalid_argument("timeWindow must not be negative");
    if (instance_params.timeframe <= 0)
        throw std::invalid_argument("timeframe must be positive");
    if (instance_params.size < 0 || instance_params.testSize < 0)
        throw std::invalid_argument("size and testSize must not be negative");
    if (instance_params.nbTests <= 0)
        throw std::invalid_argument("nbTests must be positive");
    if (instance_params.fareBase < 0.0 || instance_params.farePerKm < 0.0)
        throw std::invalid_argument("fare model must not be negative");
}
