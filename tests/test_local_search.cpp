#include <iostream>
#include <vector>
#include "evaluation.hpp"
#include "feasibility.hpp"
#include "insertion.hpp"
#include "local_search.hpp"
#include "test_helpers.hpp"

// Every listed request in a car of its own
static Solution all_alone(const DARP& darp, const GRASP_Params& params) {
    Solution sol(darp.nRequests());
    for (int r = 0; r < darp.nRequests(); ++r) {
        InsertionMove open;
        open.route = -1;
        open.pickupPos = 0;
        open.dropoffPos = 0;
        open.cost = 0.0;
        apply_insertion(sol, r, open, darp, params);
    }
    return sol;
}

int main() {
    GRASP_Params params = test_params();
    std::mt19937 rng(21);
    Deadline forever(60.0);

    std::cout << "--- Solo riders ---" << std::endl;
    DARP par = parallel_instance();
    Solution alone = all_alone(par, params);
    check(compute_objective(alone, params) == 0, "nobody shares at first");
    int moved = reinsert_solo_riders(alone, par, params, forever);
    check(moved >= 1, "solo riders moved");
    check(compute_objective(alone, params) >= 2, "moved riders now share");
    check(validate_solution(alone, par, params).ok, "still valid");

    std::cout << "--- Diversification ---" << std::endl;
    DARP darp = random_instance(14, 5);
    Solution start = build_initial_solution(darp, params, rng, forever);
    int assigned = start.nAssigned();
    Solution shaken = start;
    params.swapFraction = 0.5;
    diversify(shaken, darp, params, rng, forever);
    check(validate_solution(shaken, darp, params).ok, "shaken solution valid");
    check(shaken.nAssigned() == assigned, "relocate and swap keep every rider assigned");
    check(compute_objective(shaken, params) >= compute_objective(start, params), "objective never drops");

    std::cout << "--- Rounds ---" << std::endl;
    Solution improved = start;
    int before = evaluate_solution(improved, params);
    int rounds = local_search(improved, darp, params, rng, forever, false);
    check(rounds <= params.maxLocalSearchRounds && (rounds >= 1 || before == darp.nRequests()),
          "round budget respected");
    check(improved.objective >= before, "never worse than the input");
    check(improved.objective == compute_objective(improved, params), "result evaluated");
    check(validate_solution(improved, darp, params).ok, "result valid");

    Solution frozen = start;
    evaluate_solution(frozen, params);
    Deadline expired(0.0);
    check(local_search(frozen, darp, params, rng, expired, false) == 0, "expired deadline runs no round");
    check(frozen.routes.size() == start.routes.size(), "solution untouched");

    DARP pair = empty_instance();
    add_trip(pair, 1000.0, 0.0, 0.0, 10.0, 0.0);
    add_trip(pair, 1000.0, 0.0, 0.1, 10.0, 0.1);
    Solution full = build_initial_solution(pair, params, rng, forever);
    evaluate_solution(full, params);
    check(full.objective == 2, "both riders pooled by construction");
    check(local_search(full, pair, params, rng, forever, false) == 0, "full objective stops at once");

    return finish("test_local_search");
}
