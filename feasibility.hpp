/*
 * feasibility.hpp
 *
 * Route scheduling and constraint checks: capacity, continuity of the shared
 * trip, time windows and maximum ride time (alpha x direct time).
 */
#ifndef FEASIBILITY_HPP
#define FEASIBILITY_HPP

#include "darp.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include "solution.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Tolerance used for every time comparison
const double TIME_EPS = 1e-6;

struct InsertionResult {
    bool feasible;
    double cost; // added vehicle travel time, plus the opening penalty for a new route
};

enum class ViolationKind {
    NONE,
    COVERAGE,
    ORDERING,
    CAPACITY,
    CONTINUITY,
    TIME_WINDOW,
    TRAVEL_TIME,
    RIDE_TIME,
    OBJECTIVE
};

struct ValidationResult {
    bool ok;
    ViolationKind kind;
    std::string detail;
};

class InvalidSolutionError : public std::runtime_error {
public:
    InvalidSolutionError(ViolationKind kind, const std::string& detail);
    ViolationKind kind() const { return kind_; }

private:
    ViolationKind kind_;
};

std::string to_string(ViolationKind kind);

/**
 * @brief Sum of the travel times between consecutive stops.
 */
double route_travel_time(const std::vector<Stop>& stops, const DARP& darp);

/**
 * @brief Computes loads and service times for a stop sequence.
 *
 * Times follow the forward time slack procedure of Cordeau & Laporte: start
 * from the earliest schedule, postpone the first stop by its forward slack,
 * then postpone each pickup by its own slack to shorten ride times.
 *
 * @return false if capacity, continuity, windows or ride times cannot be met.
 * The stop times are only meaningful when true is returned.
 */
bool schedule_stops(std::vector<Stop>& stops, const DARP& darp, const GRASP_Params& params);

/**
 * @brief Trial insertion of 'request' into 'route' without touching the route.
 *
 * The trial sequence is stops[0,p) + pickup + stops[p,d) + dropoff + stops[d,n)
 * with 0 <= p <= d <= n. An empty route stands for opening a new trip.
 */
InsertionResult evaluate_insertion(const Route& route, int request, int pickupPos, int dropoffPos,
                                   const DARP& darp, const GRASP_Params& params);

// Same, and hands back the scheduled trial sequence when feasible
InsertionResult evaluate_insertion(const Route& route, int request, int pickupPos, int dropoffPos,
                                   const DARP& darp, const GRASP_Params& params,
                                   std::vector<Stop>& trial);

/**
 * @brief Full re-check of every route plus the coverage of all requests.
 * Used as a correctness gate, not on the search path.
 */
ValidationResult validate_solution(const Solution& sol, const DARP& darp, const GRASP_Params& params);

// Throws InvalidSolutionError when validate_solution fails
void check_solution(const Solution& sol, const DARP& darp, const GRASP_Params& params);

#endif // FEASIBILITY_HPP
