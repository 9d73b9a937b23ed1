/*
 * recombination.hpp
 *
 * Exact recombination of the routes met during the GRASP run: a set packing
 * model solved with Gurobi picks disjoint routes of maximum objective weight.
 */
#ifndef RECOMBINATION_HPP
#define RECOMBINATION_HPP

#include <vector>
#include <random>
#include <gurobi_c++.h>
#include "darp.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include "solution.hpp"

/**
 * @brief Contribution of a route to the objective: its request count, or 0
 * for a route with a single request in POOLED mode.
 */
int route_weight(const Route& route, const GRASP_Params& params);

/**
 * @brief Solves max sum(w_k x_k) s.t. every request covered by at most one
 * selected route, x binary, within params.recombineTimeLimit seconds.
 *
 * Routes of 'start' found in the pool seed the MIP start. The selected
 * routes form a new solution; requests left out go through the usual
 * insertion before the result is validated.
 *
 * @return false when Gurobi fails or finds nothing ('result' untouched).
 * @throws InvalidSolutionError if the recombined solution is invalid.
 */
bool recombine_routes(const std::vector<Route>& pool, const Solution& start, const DARP& darp,
                      const GRASP_Params& params, std::mt19937& rng, Solution& result, bool verbose);

#endif // RECOMBINATION_HPP
