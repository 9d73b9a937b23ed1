/*
 * solution.hpp
 *
 * A complete assignment of requests to shared trips. Value type: copying a
 * Solution copies every route, which is how the elite is kept apart from the
 * working solution.
 */
#ifndef SOLUTION_HPP
#define SOLUTION_HPP

#include <vector>
#include "route.hpp"

class DARP;

struct Solution {
    std::vector<Route> routes;
    std::vector<int> unassigned; // ascending id, i.e. ascending pickup time
    std::vector<int> route_of;   // request -> route index, -1 when unassigned

    int objective; // -1 until evaluated, reset by every mutation

    explicit Solution(int nRequests = 0);

    int nRequests() const { return (int)route_of.size(); }
    int nAssigned() const { return nRequests() - (int)unassigned.size(); }
    bool isAssigned(int request) const { return route_of[request] >= 0; }

    /**
     * @brief Stores an already scheduled stop sequence as route 'route_idx'
     * (-1 appends a new route). Requests of the sequence that were in the
     * unassigned pool leave it. Requests must not belong to another route.
     * @return index of the stored route.
     */
    int setRoute(int route_idx, const std::vector<Stop>& stops, double cost);

    /**
     * @brief Takes a request out of its route and puts it back in the pool.
     *
     * Remaining stops keep their service times (still a valid schedule since
     * travel times satisfy the triangle inequality). The route is split
     * wherever the vehicle becomes empty and erased when nothing is left, so
     * route indices may change.
     */
    void removeRequest(int request, const DARP& darp);

    // Rebuilds route_of from the routes
    void refreshIndex();
};

#endif // SOLUTION_HPP
