/*
 * evaluation.hpp
 *
 * Objective and reporting figures. Pure queries: nothing here mutates routes.
 */

#ifndef EVALUATION_HPP
#define EVALUATION_HPP

#include "darp.hpp"
#include "parameters.hpp"
#include "solution.hpp"
#include <vector>

/**
 * @brief Objective of a solution.
 *
 * POOLED: number of requests riding in a route that carries at least two
 * requests. SERVED: number of requests assigned to any route.
 * Upper bound in both modes: the number of requests.
 */
int compute_objective(const Solution& sol, const GRASP_Params& params);

/**
 * @brief Computes the objective and caches it in sol.objective.
 */
int evaluate_solution(Solution& sol, const GRASP_Params& params);

struct RequestStats {
    int request;
    double delay;        // ride time minus direct time (s)
    double delay_pct;    // % of the direct time
    double saving_pct;   // fare saving, % of the direct fare, clamped to [0, 100]
    double advance;      // requested pickup minus realized pickup (s)
    double advance_pct;  // % of the window margin
};

/**
 * @brief Figures for every pooled request (route with at least two requests).
 *
 * The shared fare splits each leg's distance among the riders on board
 * during that leg.
 */
std::vector<RequestStats> individual_stats(const Solution& sol, const DARP& darp);

struct FleetStats {
    std::vector<int> requests_per_route;
    double mean;
    int max;
};

FleetStats fleet_stats(const Solution& sol);

double mean(const std::vector<double>& values);
double stdev(const std::vector<double>& values); // sample deviation, 0 below two values

#endif // EVALUATION_HPP
