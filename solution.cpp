#include "solution.hpp"
#include "darp.hpp"
#include "feasibility.hpp"
#include <algorithm>

using std::vector;

Solution::Solution(int nRequests) : route_of(nRequests, -1), objective(-1) {
    unassigned.resize(nRequests);
    for (int i = 0; i < nRequests; ++i) unassigned[i] = i;
}

void Solution::refreshIndex() {
    std::fill(route_of.begin(), route_of.end(), -1);
    for (size_t r = 0; r < routes.size(); ++r) {
        for (const Stop& s : routes[r].stops) {
            route_of[s.request] = (int)r;
        }
    }
}

int Solution::setRoute(int route_idx, const vector<Stop>& stops, double cost) {
    if (route_idx < 0) {
        routes.push_back(Route());
        route_idx = (int)routes.size() - 1;
    }
    Route& route = routes[route_idx];
    route.stops = stops;
    route.cost = cost;

    for (const Stop& s : route.stops) {
        if (s.type != PICKUP) continue;
        if (route_of[s.request] < 0) {
            vector<int>::iterator it = std::lower_bound(unassigned.begin(), unassigned.end(), s.request);
            if (it != unassigned.end() && *it == s.request) unassigned.erase(it);
        }
        route_of[s.request] = route_idx;
    }
    objective = -1;
    return route_idx;
}

void Solution::removeRequest(int request, const DARP& darp) {
    int idx = route_of[request];
    if (idx < 0) return;

    // --- STEP 1: drop both stops and recount the load ---
    vector<Stop> remaining;
    remaining.reserve(routes[idx].stops.size());
    int load = 0;
    for (const Stop& s : routes[idx].stops) {
        if (s.request == request) continue;
        load += (s.type == PICKUP) ? 1 : -1;
        Stop copy = s;
        copy.load = load;
        remaining.push_back(copy);
    }

    // --- STEP 2: cut wherever the vehicle runs empty ---
    vector<vector<Stop> > segments;
    vector<Stop> current;
    for (const Stop& s : remaining) {
        current.push_back(s);
        if (s.load == 0) {
            segments.push_back(current);
            current.clear();
        }
    }

    if (segments.empty()) {
        routes.erase(routes.begin() + idx);
    } else {
        routes[idx].stops = segments[0];
        routes[idx].cost = route_travel_time(segments[0], darp);
        for (size_t k = 1; k < segments.size(); ++k) {
            Route extra;
            extra.stops = segments[k];
            extra.cost = route_travel_time(segments[k], darp);
            routes.push_back(extra);
        }
    }

    // --- STEP 3: back to the pool ---
    refreshIndex();
    unassigned.insert(std::lower_bound(unassigned.begin(), unassigned.end(), request), request);
    objective = -1;
}
