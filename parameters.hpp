#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <string>

enum class InsertionMethod {
    EXHAUSTIVE,            // IA
    RANDOMIZED_RESTRICTED  // IB
};

enum class ObjectiveMode {
    POOLED, // requests riding in a route with at least 2 requests
    SERVED  // every request assigned to a route
};

// GRASP parameters
struct GRASP_Params {
    double alpha = 1.5;             // max ride time / direct time
    double beta = 0.1;              // RCL size ratio
    double limitRCL = 0.2;          // RCL cap for the initial construction
    int capacity = 2;               // seats per vehicle, driver excluded
    double speed = 40.0;            // km/h
    InsertionMethod insertionMethod = InsertionMethod::EXHAUSTIVE;
    ObjectiveMode objectiveMode = ObjectiveMode::POOLED;
    int maxIterations = 0;          // 0 = until the time budget runs out
    int maxLocalSearchRounds = 10;
    int insertAttemptBudget = 5;
    int swapAttemptBudget = 5;
    double swapFraction = 0.1;
    double timeBudget = 30.0;       // seconds
    double newRoutePenalty = 3600.0; // seconds added to the cost of opening a route
    bool recombine = true;
    double recombineTimeLimit = 10.0;
};

// Instance loading / experiment parameters
struct Instance_Params {
    int timeWindow = 15;       // minutes
    int timeframe = 1000;      // seconds of requests kept from the first pickup
    int size = 0;              // rows read from the CSV (0 = all)
    int testSize = 0;          // requests sampled per run (0 = all)
    int nbTests = 1;
    bool dataSaved = false;    // load the checkpoint instead of the CSV
    std::string checkpoint;
    std::string output;
    double fareBase = 2.5;
    double farePerKm = 1.56;
};

void load_parameters_from_file(const std::string& filename, GRASP_Params& grasp_params, Instance_Params& instance_params);

/**
 * @brief Checks value ranges. Throws std::invalid_argument naming the first bad key.
 */
void validate_parameters(const GRASP_Params& grasp_params, const Instance_Params& instance_params);

InsertionMethod parse_insertion_method(const std::string& value);
ObjectiveMode parse_objective_mode(const std::string& value);
std::string to_string(InsertionMethod method);
std::string to_string(ObjectiveMode mode);

#endif // PARAMETERS_HPP
