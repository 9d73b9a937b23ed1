#include "local_search.hpp"
#include "evaluation.hpp"
#include "insertion.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

using std::vector;

// Any request sharing the route with 'request', -1 if it rides alone
static int other_member(const Route& route, int request) {
    for (const Stop& s : route.stops) {
        if (s.request != request) return s.request;
    }
    return -1;
}

/**
 * @brief Cheapest insertion of 'request' in the route of 'anchor', or in a
 * new route when anchor is -1.
 */
static bool insert_next_to(Solution& sol, int request, int anchor, const DARP& darp, const GRASP_Params& params) {
    InsertionMove move;
    if (anchor < 0) {
        move.route = -1;
        move.pickupPos = 0;
        move.dropoffPos = 0;
        move.cost = 0.0;
    } else {
        int target = sol.route_of[anchor];
        if (!find_best_insertion(sol.routes[target], request, darp, params, move)) return false;
        move.route = target;
    }
    return apply_insertion(sol, request, move, darp, params);
}

static bool try_relocate(Solution& sol, int r, int s, const DARP& darp, const GRASP_Params& params) {
    Solution trial = sol;
    trial.removeRequest(r, darp);
    if (!insert_next_to(trial, r, s, darp, params)) return false;
    if (compute_objective(trial, params) < compute_objective(sol, params)) return false;
    sol = trial;
    return true;
}

static bool try_swap(Solution& sol, int r, int s, const DARP& darp, const GRASP_Params& params) {
    int anchor_a = other_member(sol.routes[sol.route_of[r]], r);
    int anchor_b = other_member(sol.routes[sol.route_of[s]], s);
    if (anchor_a < 0 && anchor_b < 0) return false;

    Solution trial = sol;
    trial.removeRequest(r, darp);
    trial.removeRequest(s, darp);
    if (!insert_next_to(trial, r, anchor_b, darp, params)) return false;
    if (!insert_next_to(trial, s, anchor_a, darp, params)) return false;
    if (compute_objective(trial, params) < compute_objective(sol, params)) return false;
    sol = trial;
    return true;
}

int reinsert_solo_riders(Solution& sol, const DARP& darp, const GRASP_Params& params,
                         const Deadline& deadline) {
    vector<int> solo;
    for (const Route& route : sol.routes) {
        if (route.nRequests() == 1) solo.push_back(route.stops.front().request);
    }

    int moved = 0;
    for (int r : solo) {
        if (deadline.expired()) break;
        // An earlier move may have given this rider company
        int idx = sol.route_of[r];
        if (idx < 0 || sol.routes[idx].nRequests() != 1) continue;

        Solution trial = sol;
        trial.removeRequest(r, darp);
        vector<InsertionMove> moves = enumerate_insertions(trial, r, darp, params, false);
        if (moves.empty()) continue;

        size_t best = 0;
        for (size_t i = 1; i < moves.size(); ++i) {
            if (moves[i].cost < moves[best].cost) best = i;
        }
        if (!apply_insertion(trial, r, moves[best], darp, params)) continue;
        if (compute_objective(trial, params) < compute_objective(sol, params)) continue;

        sol = trial;
        ++moved;
    }
    return moved;
}

int diversify(Solution& sol, const DARP& darp, const GRASP_Params& params,
              std::mt19937& rng, const Deadline& deadline) {
    if (sol.routes.size() < 2 || sol.nAssigned() == 0) return 0;

    // Relocate and swap keep every request assigned, so this list stays valid
    vector<int> assigned;
    for (int r = 0; r < sol.nRequests(); ++r) {
        if (sol.isAssigned(r)) assigned.push_back(r);
    }

    const int k = std::max(1, (int)std::lround(params.swapFraction * assigned.size()));
    int committed = 0;

    for (int i = 0; i < k; ++i) {
        int r = assigned[randint(rng, 0, (int)assigned.size() - 1)];

        for (int attempt = 0; attempt < params.swapAttemptBudget; ++attempt) {
            if (deadline.expired()) return committed;
            if (sol.routes.size() < 2) return committed;

            int ra = sol.route_of[r];
            int rb = randint(rng, 0, (int)sol.routes.size() - 2);
            if (rb >= ra) ++rb;

            vector<int> members = sol.routes[rb].requests();
            int s = members[randint(rng, 0, (int)members.size() - 1)];

            if (try_relocate(sol, r, s, darp, params) || try_swap(sol, r, s, darp, params)) {
                ++committed;
                break;
            }
        }
    }
    return committed;
}

int local_search(Solution& sol, const DARP& darp, const GRASP_Params& params,
                 std::mt19937& rng, const Deadline& deadline, bool verbose) {
    const int n = sol.nRequests();
    evaluate_solution(sol, params);
    Solution best = sol;

    int round = 0;
    while (round < params.maxLocalSearchRounds) {
        if (deadline.expired() || best.objective == n) break;
        ++round;
        int before = evaluate_solution(sol, params);

        // --- STEP 1: place what is still in the pool ---
        int inserted = insert_requests(sol, darp, params, rng, deadline);

        // --- STEP 2: give company to riders travelling alone ---
        int moved = reinsert_solo_riders(sol, darp, params, deadline);

        int after = evaluate_solution(sol, params);
        if (after > best.objective) best = sol;

        // --- STEP 3: shake when the round was flat ---
        int shaken = 0;
        if (after <= before) {
            shaken = diversify(sol, darp, params, rng, deadline);
            if (evaluate_solution(sol, params) > best.objective) best = sol;
        }

        if (verbose) {
            std::cout << "    LS round " << round << ": inserted " << inserted
                      << ", reinserted " << moved << ", shaken " << shaken
                      << ", obj " << sol.objective << " (best " << best.objective << ")\n";
        }
    }

    sol = best;
    return round;
}
