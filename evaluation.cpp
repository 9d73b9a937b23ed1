#include "evaluation.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

using std::vector;

int compute_objective(const Solution& sol, const GRASP_Params& params) {
    int total = 0;
    for (const Route& route : sol.routes) {
        int n = route.nRequests();
        if (params.objectiveMode == ObjectiveMode::SERVED || n >= 2) total += n;
    }
    return total;
}

int evaluate_solution(Solution& sol, const GRASP_Params& params) {
    sol.objective = compute_objective(sol, params);
    return sol.objective;
}

vector<RequestStats> individual_stats(const Solution& sol, const DARP& darp) {
    vector<RequestStats> stats;
    const double margin = darp.timeWindow * 60.0;

    for (const Route& route : sol.routes) {
        if (route.nRequests() < 2) continue;
        const vector<Stop>& stops = route.stops;

        // Distance billed to each rider: every leg is split among those on board
        std::map<int, double> shared_km;
        std::map<int, double> pickup_time;
        std::vector<int> on_board;
        for (size_t i = 0; i < stops.size(); ++i) {
            if (i > 0 && !on_board.empty()) {
                const Stop& prev = stops[i - 1];
                const Request& a = darp.requests[prev.request];
                const Request& b = darp.requests[stops[i].request];
                const Point& from = prev.type == PICKUP ? a.pickup : a.dropoff;
                const Point& to = stops[i].type == PICKUP ? b.pickup : b.dropoff;
                double share = darp.distance(from, to) / on_board.size();
                for (int r : on_board) shared_km[r] += share;
            }
            if (stops[i].type == PICKUP) {
                on_board.push_back(stops[i].request);
                pickup_time[stops[i].request] = stops[i].time;
                continue;
            }

            int r = stops[i].request;
            on_board.erase(std::find(on_board.begin(), on_board.end(), r));
            const Request& req = darp.requests[r];

            RequestStats s;
            s.request = r;
            s.delay = (stops[i].time - pickup_time[r]) - req.direct_time;
            s.delay_pct = req.direct_time > 0.0 ? 100.0 * s.delay / req.direct_time : 0.0;
            double shared_fare = darp.fareBase + darp.farePerKm * shared_km[r];
            double saving = req.direct_fare > 0.0 ? 100.0 * (1.0 - shared_fare / req.direct_fare) : 0.0;
            s.saving_pct = std::max(0.0, std::min(100.0, saving));
            s.advance = req.requested_pickup - pickup_time[r];
            s.advance_pct = margin > 0.0 ? 100.0 * s.advance / margin : 0.0;
            stats.push_back(s);
        }
    }
    return stats;
}

FleetStats fleet_stats(const Solution& sol) {
    FleetStats fs;
    fs.mean = 0.0;
    fs.max = 0;
    for (const Route& route : sol.routes) {
        fs.requests_per_route.push_back(route.nRequests());
        fs.max = std::max(fs.max, route.nRequests());
    }
    if (!fs.requests_per_route.empty()) {
        fs.mean = (double)std::accumulate(fs.requests_per_route.begin(), fs.requests_per_route.end(), 0)
                  / fs.requests_per_route.size();
    }
    return fs;
}

double mean(const vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double stdev(const vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - m) * (v - m);
    return std::sqrt(sq / (values.size() - 1));
}
