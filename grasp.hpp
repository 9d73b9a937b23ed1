#ifndef GRASP_HPP
#define GRASP_HPP

#include "darp.hpp"
#include "deadline.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include "solution.hpp"
#include <random>
#include <string>
#include <vector>

enum class GraspState {
    INIT,
    CONSTRUCT,
    VALIDATE,
    LOCAL_SEARCH,
    PATH_RELINK,
    EVALUATE,
    PROMOTE_ELITE,
    TERMINATE
};

std::string to_string(GraspState state);

struct GraspResult {
    bool has_solution;             // false when no iteration completed
    Solution best;                 // elite; every request pooled out when !has_solution
    int iterations;
    double elapsed;                // s, whole run
    double elapsed_last_iteration; // s, at the end of the last completed iteration
    std::vector<int> initial_objectives;
    std::vector<Route> route_pool; // distinct routes of every evaluated solution, when recombine is on

    GraspResult() : has_solution(false), iterations(0), elapsed(0.0), elapsed_last_iteration(0.0) {}
};

/**
 * @brief GRASP with path relinking toward the elite solution.
 *
 * Each iteration: randomized construction, validation, local search, then
 * (once an elite exists) path relinking and a second local search. The
 * elite is replaced by a copy of the iteration's solution only when it is
 * strictly better. Stops on the deadline, on a full objective or after
 * params.maxIterations iterations (0 = no limit).
 *
 * @throws InvalidSolutionError if a stage produces an invalid solution.
 */
GraspResult run_grasp(const DARP& darp, const GRASP_Params& params, std::mt19937& rng,
                      const Deadline& deadline, bool verbose);

#endif // GRASP_HPP
