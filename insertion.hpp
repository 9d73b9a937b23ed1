/*
 * insertion.hpp
 *
 * Cheapest insertion of pickup/dropoff pairs, exhaustive (IA) or sampled from
 * a Restricted Candidate List (IB). Both strategies walk the unassigned pool
 * in pickup order with a bounded number of attempts per request.
 */

#ifndef INSERTION_HPP
#define INSERTION_HPP

#include "darp.hpp"
#include "deadline.hpp"
#include "parameters.hpp"
#include "solution.hpp"
#include <random>
#include <vector>

struct InsertionMove {
    int route;       // -1 opens a new route
    int pickupPos;
    int dropoffPos;
    double cost;
};

/**
 * @brief Every feasible insertion of 'request' in the current routes, plus
 * the new route when allowed. 'excluded_route' (if >= 0) is skipped.
 */
std::vector<InsertionMove> enumerate_insertions(const Solution& sol, int request,
                                                const DARP& darp, const GRASP_Params& params,
                                                bool allow_new_route, int excluded_route = -1);

/**
 * @brief Cheapest feasible position of 'request' inside a single route.
 * @return false when no position fits.
 */
bool find_best_insertion(const Route& route, int request, const DARP& darp,
                         const GRASP_Params& params, InsertionMove& best);

/**
 * @brief Commits a move found by the enumeration. The trial is scheduled
 * again before the route is written, so a stale move is rejected.
 */
bool apply_insertion(Solution& sol, int request, const InsertionMove& move,
                     const DARP& darp, const GRASP_Params& params);

/**
 * @brief Places one unassigned request with the configured strategy.
 *
 * IA commits the cheapest candidate. IB sorts the candidates by cost and
 * draws uniformly among the max(1, ceil(rcl_ratio * |candidates|)) cheapest.
 * @return false if nothing fits (the request stays in the pool).
 */
bool insert_request(Solution& sol, int request, const DARP& darp, const GRASP_Params& params,
                    std::mt19937& rng, double rcl_ratio, bool allow_new_route = true);

/**
 * @brief Tries to place the whole pool, in passes, at most
 * params.insertAttemptBudget attempts per request. Stops after a pass that
 * places nothing, or when the deadline expires.
 * @return number of requests placed.
 */
int insert_requests(Solution& sol, const DARP& darp, const GRASP_Params& params,
                    std::mt19937& rng, const Deadline& deadline, double rcl_ratio);

// Same with the configured RCL ratio (beta)
int insert_requests(Solution& sol, const DARP& darp, const GRASP_Params& params,
                    std::mt19937& rng, const Deadline& deadline);

/**
 * @brief Greedy randomized construction from an empty solution. With IB the
 * RCL is additionally capped by limitRCL.
 */
Solution build_initial_solution(const DARP& darp, const GRASP_Params& params,
                                std::mt19937& rng, const Deadline& deadline);

#endif // INSERTION_HPP
