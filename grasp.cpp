#include "grasp.hpp"
#include "evaluation.hpp"
#include "feasibility.hpp"
#include "insertion.hpp"
#include "local_search.hpp"
#include "path_relinking.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>

using std::vector;

std::string to_string(GraspState state) {
    switch (state) {
        case GraspState::INIT: return "INIT";
        case GraspState::CONSTRUCT: return "CONSTRUCT";
        case GraspState::VALIDATE: return "VALIDATE";
        case GraspState::LOCAL_SEARCH: return "LOCAL_SEARCH";
        case GraspState::PATH_RELINK: return "PATH_RELINK";
        case GraspState::EVALUATE: return "EVALUATE";
        case GraspState::PROMOTE_ELITE: return "PROMOTE_ELITE";
        case GraspState::TERMINATE: return "TERMINATE";
    }
    return "UNKNOWN";
}

// Keeps one copy of each route, routes being told apart by their request set
static void collect_routes(const Solution& sol, vector<Route>& pool, std::set<vector<int> >& seen) {
    for (const Route& route : sol.routes) {
        vector<int> key = route.requests();
        std::sort(key.begin(), key.end());
        if (seen.insert(key).second) pool.push_back(route);
    }
}

GraspResult run_grasp(const DARP& darp, const GRASP_Params& params, std::mt19937& rng,
                      const Deadline& deadline, bool verbose) {
    const int n = darp.nRequests();

    GraspResult result;
    result.best = Solution(n);

    Solution current(n);
    std::set<vector<int> > seen_routes;
    bool has_elite = false;

    GraspState state = GraspState::INIT;
    while (state != GraspState::TERMINATE) {
        switch (state) {
            case GraspState::INIT:
                if (verbose) std::cout << "Starting GRASP iterations on " << n << " requests...\n";
                state = deadline.expired() ? GraspState::TERMINATE : GraspState::CONSTRUCT;
                break;

            case GraspState::CONSTRUCT:
                if (verbose) {
                    std::cout << "\n----- Iteration " << result.iterations + 1 << " ----- : "
                              << std::fixed << std::setprecision(2) << deadline.elapsed() << "\n";
                }
                current = build_initial_solution(darp, params, rng, deadline);
                // An interrupted construction is not an iteration
                if (deadline.expired()) {
                    state = GraspState::TERMINATE;
                    break;
                }
                result.initial_objectives.push_back(evaluate_solution(current, params));
                if (verbose) std::cout << "0. Construction : " << current.objective << "\n";
                state = GraspState::VALIDATE;
                break;

            case GraspState::VALIDATE:
                check_solution(current, darp, params);
                state = GraspState::LOCAL_SEARCH;
                break;

            case GraspState::LOCAL_SEARCH:
                local_search(current, darp, params, rng, deadline, verbose);
                check_solution(current, darp, params);
                if (verbose) std::cout << "1. Local Search : " << current.objective << "\n";
                state = has_elite ? GraspState::PATH_RELINK : GraspState::EVALUATE;
                break;

            case GraspState::PATH_RELINK:
                current = path_relinking(current, result.best, darp, params, rng, deadline);
                check_solution(current, darp, params);
                if (verbose) std::cout << "2. Path Relinking : " << current.objective << "\n";

                local_search(current, darp, params, rng, deadline, verbose);
                check_solution(current, darp, params);
                if (verbose) std::cout << "3. Second Local Search : " << current.objective << "\n";
                state = GraspState::EVALUATE;
                break;

            case GraspState::EVALUATE:
                evaluate_solution(current, params);
                if (params.recombine) collect_routes(current, result.route_pool, seen_routes);
                result.iterations++;
                result.elapsed_last_iteration = deadline.elapsed();

                if (!has_elite || current.objective > result.best.objective) {
                    state = GraspState::PROMOTE_ELITE;
                    break;
                }
                state = GraspState::CONSTRUCT;
                break;

            case GraspState::PROMOTE_ELITE:
                result.best = current;
                has_elite = true;
                state = GraspState::CONSTRUCT;
                break;

            case GraspState::TERMINATE:
                break;
        }

        // Stopping test at the end of every iteration
        if (state == GraspState::CONSTRUCT && result.iterations > 0) {
            if (verbose) std::cout << "Elite obj : " << result.best.objective << "\n";
            if (deadline.expired() || result.best.objective == n ||
                (params.maxIterations > 0 && result.iterations >= params.maxIterations)) {
                state = GraspState::TERMINATE;
            }
        }
    }

    result.has_solution = has_elite;
    result.elapsed = deadline.elapsed();
    if (verbose) {
        std::cout << "GRASP finished after " << result.iterations << " iterations, "
                  << std::fixed << std::setprecision(2) << result.elapsed << " s\n";
    }
    return result;
}
