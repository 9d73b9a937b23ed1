#include <iostream>
#include <vector>
#include "evaluation.hpp"
#include "feasibility.hpp"
#include "insertion.hpp"
#include "test_helpers.hpp"

using std::vector;

// Parallel riders plus one whose dropoff window closes before it can be reached
static DARP with_impossible_rider() {
    DARP darp = parallel_instance();
    Point pu = {0.0, 0.0};
    Point dr = {20.0, 0.0};
    Request r = darp.makeRequest(1005.0, pu, dr);
    r.dropoff_window.earliest = r.pickup_window.earliest;
    r.dropoff_window.latest = r.pickup_window.earliest + 60.0;
    darp.addRequest(r);
    darp.sortAndReindex();
    return darp;
}

int main() {
    DARP darp = parallel_instance();
    GRASP_Params params = test_params();
    std::mt19937 rng(7);
    Deadline forever(60.0);

    std::cout << "--- Candidates ---" << std::endl;
    Solution sol(darp.nRequests());
    vector<InsertionMove> first = enumerate_insertions(sol, 0, darp, params, true);
    check(first.size() == 1 && first[0].route == -1, "empty solution: only a new route");
    check(enumerate_insertions(sol, 0, darp, params, false).empty(), "nothing without new routes");

    check(insert_request(sol, 0, darp, params, rng, params.beta), "first rider placed");
    check(sol.routes.size() == 1 && !sol.isAssigned(1), "one car, rest still pooled");
    check(!insert_request(sol, 0, darp, params, rng, params.beta), "assigned rider not placed twice");

    vector<InsertionMove> moves = enumerate_insertions(sol, 1, darp, params, true);
    bool has_shared = false, has_new = false;
    for (const InsertionMove& m : moves) {
        if (m.route == 0) has_shared = true;
        if (m.route == -1) has_new = true;
    }
    check(has_shared && has_new, "shared and new-route candidates");
    vector<InsertionMove> others = enumerate_insertions(sol, 1, darp, params, false, 0);
    check(others.empty(), "excluded route skipped");

    InsertionMove best;
    check(find_best_insertion(sol.routes[0], 1, darp, params, best), "best position in the car");
    check(best.cost < params.newRoutePenalty, "sharing is cheaper than a new car");

    std::cout << "--- Strategies ---" << std::endl;
    Solution ia = build_initial_solution(darp, params, rng, forever);
    evaluate_solution(ia, params);
    check(validate_solution(ia, darp, params).ok, "IA construction valid");
    check(ia.objective >= 2, "IA pools at least two of three compatible riders");
    check(ia.unassigned.empty(), "IA serves everyone");

    GRASP_Params ib = params;
    ib.insertionMethod = InsertionMethod::RANDOMIZED_RESTRICTED;
    ib.beta = 1.0;
    ib.limitRCL = 1.0;
    for (unsigned int seed = 0; seed < 5; ++seed) {
        std::mt19937 gen(seed);
        Solution s = build_initial_solution(darp, ib, gen, forever);
        evaluate_solution(s, ib);
        if (!validate_solution(s, darp, ib).ok || !s.unassigned.empty()) {
            check(false, "IB construction valid for every seed");
            break;
        }
        if (seed == 4) check(true, "IB construction valid for every seed");
    }

    ib.beta = 0.01;
    Solution narrow(darp.nRequests());
    insert_request(narrow, 0, darp, ib, rng, ib.beta);
    insert_request(narrow, 1, darp, ib, rng, ib.beta);
    check(narrow.routes.size() == 1, "tiny RCL keeps only the cheapest move");

    std::cout << "--- Pool handling ---" << std::endl;
    DARP hard = with_impossible_rider();
    int impossible = -1;
    for (const Request& r : hard.requests) {
        if (r.dropoff_window.latest < r.pickup_window.latest) impossible = r.id;
    }
    for (int pass = 0; pass < 2; ++pass) {
        GRASP_Params p = params;
        if (pass == 1) p.insertionMethod = InsertionMethod::RANDOMIZED_RESTRICTED;
        Solution s(hard.nRequests());
        int placed = insert_requests(s, hard, p, rng, forever);
        check(placed == hard.nRequests() - 1, "every other rider placed (" + to_string(p.insertionMethod) + ")");
        check(s.unassigned.size() == 1 && s.unassigned[0] == impossible,
              "impossible rider stays pooled (" + to_string(p.insertionMethod) + ")");
        check(insert_requests(s, hard, p, rng, forever) == 0, "nothing left to place terminates");
    }

    DARP waiting = parallel_instance();
    int late = add_waiting_rider(waiting, 1005.0);
    for (int pass = 0; pass < 2; ++pass) {
        GRASP_Params p = params;
        if (pass == 1) p.insertionMethod = InsertionMethod::RANDOMIZED_RESTRICTED;
        Solution s(waiting.nRequests());
        int placed = insert_requests(s, waiting, p, rng, forever);
        check(late >= 0 && placed == waiting.nRequests() - 1 && !s.isAssigned(late),
              "rider forced over its ride time stays pooled (" + to_string(p.insertionMethod) + ")");
        check(validate_solution(s, waiting, p).ok, "solution without it valid (" + to_string(p.insertionMethod) + ")");
    }

    Deadline none(0.0);
    Solution idle(darp.nRequests());
    check(insert_requests(idle, darp, params, rng, none) == 0, "expired deadline places nothing");

    return finish("test_insertion");
}
