#include "feasibility.hpp"
#include "evaluation.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <sstream>

using std::vector;

static const double INF = std::numeric_limits<double>::infinity();

InvalidSolutionError::InvalidSolutionError(ViolationKind kind, const std::string& detail)
    : std::runtime_error("invalid solution (" + to_string(kind) + "): " + detail), kind_(kind)
{
}

std::string to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::NONE: return "none";
        case ViolationKind::COVERAGE: return "coverage";
        case ViolationKind::ORDERING: return "ordering";
        case ViolationKind::CAPACITY: return "capacity";
        case ViolationKind::CONTINUITY: return "continuity";
        case ViolationKind::TIME_WINDOW: return "time window";
        case ViolationKind::TRAVEL_TIME: return "travel time";
        case ViolationKind::RIDE_TIME: return "ride time";
        case ViolationKind::OBJECTIVE: return "objective";
    }
    return "unknown";
}

static const Point& stop_location(const Stop& s, const DARP& darp) {
    const Request& r = darp.requests[s.request];
    return s.type == PICKUP ? r.pickup : r.dropoff;
}

static const TimeWindow& stop_window(const Stop& s, const DARP& darp) {
    const Request& r = darp.requests[s.request];
    return s.type == PICKUP ? r.pickup_window : r.dropoff_window;
}

double route_travel_time(const vector<Stop>& stops, const DARP& darp) {
    double total = 0.0;
    for (size_t i = 1; i < stops.size(); ++i) {
        total += darp.travelTime(stop_location(stops[i - 1], darp), stop_location(stops[i], darp));
    }
    return total;
}

bool schedule_stops(vector<Stop>& stops, const DARP& darp, const GRASP_Params& params) {
    const int n = (int)stops.size();
    if (n == 0) return true;
    if (n % 2 != 0) return false;

    // --- STEP 1: pairing, loads and continuity ---
    vector<int> partner(n, -1);
    int load = 0;
    for (int i = 0; i < n; ++i) {
        if (stops[i].type == PICKUP) {
            ++load;
        } else {
            for (int k = i - 1; k >= 0; --k) {
                if (stops[k].request == stops[i].request && stops[k].type == PICKUP) {
                    partner[i] = k;
                    partner[k] = i;
                    break;
                }
            }
            if (partner[i] < 0) return false; // dropoff ahead of its pickup
            --load;
        }
        if (load > params.capacity) return false;
        if (load <= 0 && i < n - 1) return false; // vehicle empty in the middle of the trip
        stops[i].load = load;
    }
    if (load != 0) return false;

    vector<double> tt(n, 0.0), e(n), l(n), B(n, 0.0), W(n, 0.0);
    for (int i = 0; i < n; ++i) {
        const TimeWindow& tw = stop_window(stops[i], darp);
        e[i] = tw.earliest;
        l[i] = tw.latest;
        if (i > 0) tt[i] = darp.travelTime(stop_location(stops[i - 1], darp), stop_location(stops[i], darp));
    }

    // Recomputes B after 'from' keeping B[from]; fails on a closed window
    auto forward = [&](int from) -> bool {
        for (int i = from + 1; i < n; ++i) {
            double arrival = B[i - 1] + tt[i];
            B[i] = std::max(arrival, e[i]);
            W[i] = B[i] - arrival;
            if (B[i] > l[i] + TIME_EPS) return false;
        }
        return true;
    };

    auto ride_limit = [&](int i) -> double {
        return params.alpha * darp.requests[stops[i].request].direct_time;
    };

    // Largest delay of stop i that keeps every later window and the ride
    // times of riders already on board at i
    auto forward_slack = [&](int i) -> double {
        double slack = INF;
        double waits = 0.0;
        for (int j = i; j < n; ++j) {
            if (j > i) waits += W[j];
            double own = l[j] - B[j];
            if (stops[j].type == DROPOFF && partner[j] < i) {
                own = std::min(own, ride_limit(j) - (B[j] - B[partner[j]]));
            }
            slack = std::min(slack, waits + std::max(0.0, own));
        }
        return slack;
    };

    auto waits_after = [&](int i) -> double {
        double total = 0.0;
        for (int p = i + 1; p < n; ++p) total += W[p];
        return total;
    };

    auto rides_ok = [&]() -> bool {
        for (int i = 0; i < n; ++i) {
            if (stops[i].type != DROPOFF) continue;
            if (B[i] - B[partner[i]] > ride_limit(i) + TIME_EPS) return false;
        }
        return true;
    };

    // --- STEP 2: earliest schedule ---
    B[0] = e[0];
    if (B[0] > l[0] + TIME_EPS) return false;
    if (!forward(0)) return false;

    // --- STEP 3: postpone the start to remove useless waiting ---
    B[0] += std::min(forward_slack(0), waits_after(0));
    if (!forward(0)) return false;

    // --- STEP 4: postpone pickups while some ride is too long ---
    if (!rides_ok()) {
        for (int j = 1; j < n; ++j) {
            if (stops[j].type != PICKUP) continue;
            double delay = std::min(forward_slack(j), waits_after(j));
            if (delay <= 0.0) continue;
            B[j] += delay;
            W[j] = B[j] - (B[j - 1] + tt[j]);
            if (!forward(j)) return false;
        }
        if (!rides_ok()) return false;
    }

    for (int i = 0; i < n; ++i) stops[i].time = B[i];
    return true;
}

InsertionResult evaluate_insertion(const Route& route, int request, int pickupPos, int dropoffPos,
                                   const DARP& darp, const GRASP_Params& params) {
    vector<Stop> trial;
    return evaluate_insertion(route, request, pickupPos, dropoffPos, darp, params, trial);
}

InsertionResult evaluate_insertion(const Route& route, int request, int pickupPos, int dropoffPos,
                                   const DARP& darp, const GRASP_Params& params,
                                   vector<Stop>& trial) {
    InsertionResult result;
    result.feasible = false;
    result.cost = INF;

    const int n = (int)route.stops.size();
    if (pickupPos < 0 || pickupPos > dropoffPos || dropoffPos > n) return result;
    // The trip would run empty between the old stops and the new ones
    if (n > 0 && (pickupPos == n || dropoffPos == 0)) return result;

    // Quick capacity test: the new rider is on board from pickupPos to dropoffPos
    int before = (pickupPos > 0) ? route.stops[pickupPos - 1].load : 0;
    if (before + 1 > params.capacity) return result;
    for (int k = pickupPos; k < dropoffPos; ++k) {
        if (route.stops[k].load + 1 > params.capacity) return result;
    }

    // Quick window test on the neighbours of the two new stops
    const Request& req = darp.requests[request];
    if (pickupPos > 0) {
        const Stop& prev = route.stops[pickupPos - 1];
        if (stop_window(prev, darp).earliest + darp.travelTime(stop_location(prev, darp), req.pickup)
            > req.pickup_window.latest + TIME_EPS) return result;
    }
    if (pickupPos < dropoffPos) {
        const Stop& next = route.stops[pickupPos];
        if (req.pickup_window.earliest + darp.travelTime(req.pickup, stop_location(next, darp))
            > stop_window(next, darp).latest + TIME_EPS) return result;
        const Stop& prev = route.stops[dropoffPos - 1];
        if (stop_window(prev, darp).earliest + darp.travelTime(stop_location(prev, darp), req.dropoff)
            > req.dropoff_window.latest + TIME_EPS) return result;
    }
    if (dropoffPos < n) {
        const Stop& next = route.stops[dropoffPos];
        if (req.dropoff_window.earliest + darp.travelTime(req.dropoff, stop_location(next, darp))
            > stop_window(next, darp).latest + TIME_EPS) return result;
    }

    trial.clear();
    trial.reserve(n + 2);
    for (int k = 0; k < pickupPos; ++k) trial.push_back(route.stops[k]);
    trial.push_back(Stop(request, PICKUP));
    for (int k = pickupPos; k < dropoffPos; ++k) trial.push_back(route.stops[k]);
    trial.push_back(Stop(request, DROPOFF));
    for (int k = dropoffPos; k < n; ++k) trial.push_back(route.stops[k]);

    if (!schedule_stops(trial, darp, params)) return result;

    double travel = route_travel_time(trial, darp);
    result.feasible = true;
    if (n == 0) {
        result.cost = travel + params.newRoutePenalty;
    } else {
        result.cost = travel - route_travel_time(route.stops, darp);
    }
    return result;
}

static ValidationResult fail(ViolationKind kind, const std::string& detail) {
    ValidationResult v;
    v.ok = false;
    v.kind = kind;
    v.detail = detail;
    return v;
}

ValidationResult validate_solution(const Solution& sol, const DARP& darp, const GRASP_Params& params) {
    const int N = darp.nRequests();
    std::ostringstream msg;

    if (sol.nRequests() != N) {
        msg << "solution indexes " << sol.nRequests() << " requests, instance has " << N;
        return fail(ViolationKind::COVERAGE, msg.str());
    }

    vector<int> in_routes(N, 0), in_pool(N, 0);
    for (int r : sol.unassigned) {
        if (r < 0 || r >= N) {
            msg << "unknown request " << r << " in the unassigned pool";
            return fail(ViolationKind::COVERAGE, msg.str());
        }
        in_pool[r]++;
    }

    // --- Check 1: every route on its own ---
    for (size_t ri = 0; ri < sol.routes.size(); ++ri) {
        const vector<Stop>& stops = sol.routes[ri].stops;
        const int n = (int)stops.size();
        if (n == 0) {
            msg << "route " << ri << " is empty";
            return fail(ViolationKind::CONTINUITY, msg.str());
        }

        std::map<int, int> pickup_at;
        std::set<int> dropped;
        int load = 0;
        for (int i = 0; i < n; ++i) {
            const Stop& s = stops[i];
            if (s.request < 0 || s.request >= N) {
                msg << "unknown request " << s.request << " in route " << ri;
                return fail(ViolationKind::COVERAGE, msg.str());
            }
            const Request& req = darp.requests[s.request];

            if (s.type == PICKUP) {
                if (pickup_at.count(s.request)) {
                    msg << "request " << s.request << " picked up twice in route " << ri;
                    return fail(ViolationKind::ORDERING, msg.str());
                }
                pickup_at[s.request] = i;
                in_routes[s.request]++;
                if (sol.route_of[s.request] != (int)ri) {
                    msg << "request " << s.request << " indexed in route " << sol.route_of[s.request]
                        << " but found in route " << ri;
                    return fail(ViolationKind::COVERAGE, msg.str());
                }
                ++load;
            } else {
                if (!pickup_at.count(s.request) || dropped.count(s.request)) {
                    msg << "dropoff of request " << s.request << " without a preceding pickup in route " << ri;
                    return fail(ViolationKind::ORDERING, msg.str());
                }
                dropped.insert(s.request);
                --load;
                double ride = s.time - stops[pickup_at[s.request]].time;
                if (ride > params.alpha * req.direct_time + TIME_EPS) {
                    msg << "request " << s.request << " rides " << ride << " s, limit "
                        << params.alpha * req.direct_time << " s";
                    return fail(ViolationKind::RIDE_TIME, msg.str());
                }
            }

            if (load < 0 || load > params.capacity || load != s.load) {
                msg << "load " << load << " (stored " << s.load << ") after stop " << i << " of route " << ri;
                return fail(ViolationKind::CAPACITY, msg.str());
            }
            if (load == 0 && i < n - 1) {
                msg << "route " << ri << " runs empty after stop " << i;
                return fail(ViolationKind::CONTINUITY, msg.str());
            }

            const TimeWindow& tw = stop_window(s, darp);
            if (s.time < tw.earliest - TIME_EPS || s.time > tw.latest + TIME_EPS) {
                msg << "stop " << i << " of route " << ri << " served at " << s.time
                    << " outside [" << tw.earliest << ", " << tw.latest << "]";
                return fail(ViolationKind::TIME_WINDOW, msg.str());
            }
            if (i > 0) {
                double travel = darp.travelTime(stop_location(stops[i - 1], darp), stop_location(s, darp));
                if (s.time + TIME_EPS < stops[i - 1].time + travel) {
                    msg << "stop " << i << " of route " << ri << " reached before the vehicle can get there";
                    return fail(ViolationKind::TRAVEL_TIME, msg.str());
                }
            }
        }
        if (dropped.size() != pickup_at.size()) {
            msg << "route " << ri << " leaves a rider on board";
            return fail(ViolationKind::ORDERING, msg.str());
        }
    }

    // --- Check 2: each request exactly once ---
    for (int r = 0; r < N; ++r) {
        if (in_routes[r] + in_pool[r] != 1) {
            msg << "request " << r << " appears " << in_routes[r] << " time(s) in routes and "
                << in_pool[r] << " time(s) in the pool";
            return fail(ViolationKind::COVERAGE, msg.str());
        }
        if (in_pool[r] && sol.route_of[r] != -1) {
            msg << "unassigned request " << r << " indexed in route " << sol.route_of[r];
            return fail(ViolationKind::COVERAGE, msg.str());
        }
    }

    // --- Check 3: cached objective ---
    if (sol.objective >= 0) {
        int actual = compute_objective(sol, params);
        if (actual != sol.objective) {
            msg << "cached objective " << sol.objective << ", actual " << actual;
            return fail(ViolationKind::OBJECTIVE, msg.str());
        }
    }

    ValidationResult ok;
    ok.ok = true;
    ok.kind = ViolationKind::NONE;
    return ok;
}

void check_solution(const Solution& sol, const DARP& darp, const GRASP_Params& params) {
    ValidationResult v = validate_solution(sol, darp, params);
    if (!v.ok) throw InvalidSolutionError(v.kind, v.detail);
}
