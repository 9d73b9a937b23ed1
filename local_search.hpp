/*
 * local_search.hpp
 * Improvement phase of a GRASP iteration: repeated insertion of the pool,
 * reinsertion of riders travelling alone and random relocate/swap moves.
 */
#ifndef LOCAL_SEARCH_HPP
#define LOCAL_SEARCH_HPP

#include "darp.hpp"
#include "deadline.hpp"
#include "parameters.hpp"
#include "solution.hpp"
#include <random>

/**
 * @brief Tries to move every request riding alone into another existing
 * route. A move is kept when the objective does not drop.
 * @return number of moves kept.
 */
int reinsert_solo_riders(Solution& sol, const DARP& darp, const GRASP_Params& params,
                         const Deadline& deadline);

/**
 * @brief Relocates or swaps max(1, round(swapFraction x assigned)) random
 * requests with requests of other routes, at most swapAttemptBudget
 * partner routes each. Rejected moves leave the solution untouched.
 * @return number of moves committed.
 */
int diversify(Solution& sol, const DARP& darp, const GRASP_Params& params,
              std::mt19937& rng, const Deadline& deadline);

/**
 * @brief Orchestrates the rounds until maxLocalSearchRounds, a full
 * objective or the deadline. 'sol' ends as the best solution seen, never
 * worse than the one passed in.
 * @return number of rounds run.
 */
int local_search(Solution& sol, const DARP& darp, const GRASP_Params& params,
                 std::mt19937& rng, const Deadline& deadline, bool verbose);

#endif // LOCAL_SEARCH_HPP
