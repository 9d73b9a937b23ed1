/*
 * route.hpp
 * Core data structure for a single shared vehicle trip.
 */
#ifndef ROUTE_HPP
#define ROUTE_HPP

#include <vector>

enum StopType { PICKUP, DROPOFF };

struct Stop {
    int request;
    StopType type;
    double time;   // service instant
    int load;      // passengers on board after the stop

    Stop() : request(-1), type(PICKUP), time(0.0), load(0) {}
    Stop(int request, StopType type) : request(request), type(type), time(0.0), load(0) {}
};

/**
 * @struct Route
 * @brief One vehicle trip: pickups and dropoffs in service order.
 *
 * The vehicle is never empty between the first and the last stop, so a
 * route with two or more requests is a pooled ride.
 */
struct Route {
    std::vector<Stop> stops;

    // Total vehicle travel time (seconds), kept in sync by the feasibility checker
    double cost;

    Route() : cost(0.0) {}

    int nRequests() const { return (int)stops.size() / 2; }
    bool empty() const { return stops.empty(); }
    bool contains(int request) const;

    // Requests in pickup order
    std::vector<int> requests() const;
};

#endif // ROUTE_HPP
