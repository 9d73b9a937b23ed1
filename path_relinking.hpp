#ifndef PATH_RELINKING_HPP
#define PATH_RELINKING_HPP

#include "darp.hpp"
#include "deadline.hpp"
#include "parameters.hpp"
#include "solution.hpp"
#include <random>

/**
 * @brief Walks from 'working' toward 'elite' by rebuilding the elite's
 * request groups one move at a time.
 *
 * Elite routes are taken by first pickup time. Each member of a group is
 * moved into the route of the group's anchor (its first member already
 * placed); when it does not fit, up to swapAttemptBudget foreign riders of
 * that route are evicted and reinserted elsewhere or pooled. Steps that
 * still fail are skipped.
 *
 * @return the best intermediate solution, evaluated. Its objective is at
 * least min(objective(working), objective(elite)).
 */
Solution path_relinking(const Solution& working, const Solution& elite, const DARP& darp,
                        const GRASP_Params& params, std::mt19937& rng, const Deadline& deadline);

#endif // PATH_RELINKING_HPP
