#include "insertion.hpp"
#include "feasibility.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using std::vector;

static const double INF = std::numeric_limits<double>::infinity();

// A trip can only host a rider whose ride can overlap it in time
static bool route_can_host(const Route& route, const Request& req, const DARP& darp) {
    if (route.empty()) return false;
    double first_earliest = darp.requests[route.stops.front().request].pickup_window.earliest;
    double last_latest = darp.requests[route.stops.back().request].dropoff_window.latest;
    if (req.dropoff_window.latest < first_earliest) return false;
    if (req.pickup_window.earliest > last_latest) return false;
    return true;
}

bool find_best_insertion(const Route& route, int request, const DARP& darp,
                         const GRASP_Params& params, InsertionMove& best) {
    const int n = (int)route.stops.size();
    bool found = false;
    best.cost = INF;
    for (int p = 0; p <= n; ++p) {
        for (int d = p; d <= n; ++d) {
            InsertionResult res = evaluate_insertion(route, request, p, d, darp, params);
            if (res.feasible && res.cost < best.cost) {
                best.pickupPos = p;
                best.dropoffPos = d;
                best.cost = res.cost;
                found = true;
            }
        }
    }
    return found;
}

vector<InsertionMove> enumerate_insertions(const Solution& sol, int request,
                                           const DARP& darp, const GRASP_Params& params,
                                           bool allow_new_route, int excluded_route) {
    vector<InsertionMove> moves;
    const Request& req = darp.requests[request];

    for (size_t ri = 0; ri < sol.routes.size(); ++ri) {
        if ((int)ri == excluded_route) continue;
        const Route& route = sol.routes[ri];
        if (!route_can_host(route, req, darp)) continue;

        const int n = (int)route.stops.size();
        for (int p = 0; p < n; ++p) {
            for (int d = std::max(p, 1); d <= n; ++d) {
                InsertionResult res = evaluate_insertion(route, request, p, d, darp, params);
                if (!res.feasible) continue;
                InsertionMove m;
                m.route = (int)ri;
                m.pickupPos = p;
                m.dropoffPos = d;
                m.cost = res.cost;
                moves.push_back(m);
            }
        }
    }

    if (allow_new_route) {
        Route empty_route;
        InsertionResult res = evaluate_insertion(empty_route, request, 0, 0, darp, params);
        if (res.feasible) {
            InsertionMove m;
            m.route = -1;
            m.pickupPos = 0;
            m.dropoffPos = 0;
            m.cost = res.cost;
            moves.push_back(m);
        }
    }
    return moves;
}

bool apply_insertion(Solution& sol, int request, const InsertionMove& move,
                     const DARP& darp, const GRASP_Params& params) {
    Route empty_route;
    const Route& route = move.route >= 0 ? sol.routes[move.route] : empty_route;

    vector<Stop> trial;
    InsertionResult res = evaluate_insertion(route, request, move.pickupPos, move.dropoffPos, darp, params, trial);
    if (!res.feasible) return false;

    sol.setRoute(move.route, trial, route_travel_time(trial, darp));
    return true;
}

bool insert_request(Solution& sol, int request, const DARP& darp, const GRASP_Params& params,
                    std::mt19937& rng, double rcl_ratio, bool allow_new_route) {
    if (sol.isAssigned(request)) return false;

    vector<InsertionMove> candidates = enumerate_insertions(sol, request, darp, params, allow_new_route);
    if (candidates.empty()) return false;

    size_t pick = 0;
    if (params.insertionMethod == InsertionMethod::EXHAUSTIVE) {
        for (size_t i = 1; i < candidates.size(); ++i) {
            if (candidates[i].cost < candidates[pick].cost) pick = i;
        }
    } else {
        // --- Restricted Candidate List ---
        std::stable_sort(candidates.begin(), candidates.end(), [](const InsertionMove& a, const InsertionMove& b) {
            return a.cost < b.cost;
        });
        size_t rcl_size = (size_t)std::ceil(rcl_ratio * candidates.size() - 1e-9);
        rcl_size = std::max<size_t>(1, std::min(rcl_size, candidates.size()));
        pick = (size_t)randint(rng, 0, (int)rcl_size - 1);
    }
    return apply_insertion(sol, request, candidates[pick], darp, params);
}

int insert_requests(Solution& sol, const DARP& darp, const GRASP_Params& params,
                    std::mt19937& rng, const Deadline& deadline, double rcl_ratio) {
    int inserted = 0;
    vector<int> attempts(sol.nRequests(), 0);

    bool progress = true;
    while (progress && !sol.unassigned.empty()) {
        progress = false;
        // Copy: the pool shrinks while we walk it
        const vector<int> pool = sol.unassigned;
        for (int r : pool) {
            if (deadline.expired()) return inserted;
            if (attempts[r] >= params.insertAttemptBudget) continue;
            attempts[r]++;
            if (insert_request(sol, r, darp, params, rng, rcl_ratio)) {
                ++inserted;
                progress = true;
            }
        }
    }
    return inserted;
}

int insert_requests(Solution& sol, const DARP& darp, const GRASP_Params& params,
                    std::mt19937& rng, const Deadline& deadline) {
    return insert_requests(sol, darp, params, rng, deadline, params.beta);
}

Solution build_initial_solution(const DARP& darp, const GRASP_Params& params,
                                std::mt19937& rng, const Deadline& deadline) {
    Solution sol(darp.nRequests());
    insert_requests(sol, darp, params, rng, deadline, std::min(params.beta, params.limitRCL));
    return sol;
}
