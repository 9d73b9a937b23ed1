#include "path_relinking.hpp"
#include "evaluation.hpp"
#include "insertion.hpp"
#include <algorithm>
#include <vector>

using std::vector;

static bool same_members(const Route& route, vector<int> group) {
    vector<int> members = route.requests();
    if (members.size() != group.size()) return false;
    std::sort(members.begin(), members.end());
    std::sort(group.begin(), group.end());
    return members == group;
}

static bool in_group(const vector<int>& group, int request) {
    return std::find(group.begin(), group.end(), request) != group.end();
}

/**
 * @brief One relinking move: 'request' joins the route of 'anchor'.
 *
 * Works on a copy. If the request does not fit, foreign riders of the
 * anchor route are evicted in random order, at most swapAttemptBudget of
 * them, until it does. Evicted riders are then reinserted anywhere or left
 * in the pool. 'current' is only replaced when the move succeeds.
 */
static bool relink_step(Solution& current, int request, int anchor, const vector<int>& group,
                        const DARP& darp, const GRASP_Params& params, std::mt19937& rng) {
    Solution trial = current;
    if (trial.isAssigned(request)) trial.removeRequest(request, darp);

    InsertionMove move;
    int target = trial.route_of[anchor];
    bool placed = find_best_insertion(trial.routes[target], request, darp, params, move);

    vector<int> evicted;
    if (!placed) {
        vector<int> foreign;
        for (int r : trial.routes[target].requests()) {
            if (!in_group(group, r)) foreign.push_back(r);
        }
        std::shuffle(foreign.begin(), foreign.end(), rng);

        for (size_t i = 0; i < foreign.size() && (int)i < params.swapAttemptBudget && !placed; ++i) {
            trial.removeRequest(foreign[i], darp);
            evicted.push_back(foreign[i]);
            target = trial.route_of[anchor];
            placed = find_best_insertion(trial.routes[target], request, darp, params, move);
        }
    }
    if (!placed) return false;

    move.route = target;
    if (!apply_insertion(trial, request, move, darp, params)) return false;

    for (int r : evicted) {
        insert_request(trial, r, darp, params, rng, params.beta);
    }
    current = trial;
    return true;
}

static bool by_first_pickup(const Route* a, const Route* b) {
    return a->stops.front().time < b->stops.front().time;
}

Solution path_relinking(const Solution& working, const Solution& elite, const DARP& darp,
                        const GRASP_Params& params, std::mt19937& rng, const Deadline& deadline) {
    Solution current = working;
    Solution best = working;
    evaluate_solution(best, params);

    vector<const Route*> guide;
    for (const Route& route : elite.routes) {
        if (!route.empty()) guide.push_back(&route);
    }
    std::stable_sort(guide.begin(), guide.end(), by_first_pickup);

    for (const Route* target : guide) {
        if (deadline.expired()) break;
        const vector<int> group = target->requests();

        int first_route = current.route_of[group[0]];
        if (first_route >= 0 && same_members(current.routes[first_route], group)) continue;

        // --- STEP 1: find or open the anchor route ---
        int anchor = -1;
        for (int r : group) {
            if (current.isAssigned(r)) {
                anchor = r;
                break;
            }
        }
        if (anchor < 0) {
            InsertionMove open;
            open.route = -1;
            open.pickupPos = 0;
            open.dropoffPos = 0;
            open.cost = 0.0;
            if (!apply_insertion(current, group[0], open, darp, params)) continue;
            anchor = group[0];
            if (evaluate_solution(current, params) > best.objective) best = current;
        }

        // --- STEP 2: bring the rest of the group in ---
        for (int r : group) {
            if (deadline.expired()) break;
            if (r == anchor || current.route_of[r] == current.route_of[anchor]) continue;
            if (!relink_step(current, r, anchor, group, darp, params, rng)) continue;
            if (evaluate_solution(current, params) > best.objective) best = current;
        }
    }

    evaluate_solution(best, params);
    return best;
}
