#include "report.hpp"
#include "evaluation.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

using std::vector;

static double max_of(const vector<double>& v) {
    return v.empty() ? 0.0 : *std::max_element(v.begin(), v.end());
}

static double min_of(const vector<double>& v) {
    return v.empty() ? 0.0 : *std::min_element(v.begin(), v.end());
}

RunStats compute_run_stats(const GraspResult& result, const Solution& final_solution,
                           const DARP& darp, const GRASP_Params& params) {
    RunStats s;
    s.nRequests = darp.nRequests();
    s.iterations = result.iterations;
    s.objective = compute_objective(final_solution, params);
    s.served = final_solution.nAssigned();
    s.objective_pct = s.nRequests > 0 ? 100.0 * s.objective / s.nRequests : 0.0;
    s.complete = s.objective == s.nRequests;

    FleetStats fleet = fleet_stats(final_solution);
    s.mean_requests_per_route = fleet.mean;
    s.max_requests_per_route = fleet.max;

    vector<double> initial(result.initial_objectives.begin(), result.initial_objectives.end());
    s.mean_initial_pct = s.nRequests > 0 ? 100.0 * mean(initial) / s.nRequests : 0.0;

    // --- Per-request figures of the pooled riders ---
    vector<double> delay, delay_pct, saving, advance, advance_pct;
    for (const RequestStats& r : individual_stats(final_solution, darp)) {
        delay.push_back(r.delay);
        delay_pct.push_back(r.delay_pct);
        saving.push_back(r.saving_pct);
        advance.push_back(r.advance);
        advance_pct.push_back(r.advance_pct);
    }

    s.mean_delay = mean(delay);
    s.mean_delay_pct = mean(delay_pct);
    s.std_delay = stdev(delay);
    s.max_delay = max_of(delay);
    s.max_delay_pct = max_of(delay_pct);
    s.min_delay = min_of(delay);
    s.min_delay_pct = min_of(delay_pct);

    s.mean_saving_pct = mean(saving);
    s.max_saving_pct = max_of(saving);
    s.min_saving_pct = min_of(saving);

    s.mean_advance = mean(advance);
    s.mean_advance_pct = mean(advance_pct);
    s.std_advance = stdev(advance);
    s.max_advance = max_of(advance);
    s.max_advance_pct = max_of(advance_pct);
    s.min_advance = min_of(advance);
    s.min_advance_pct = min_of(advance_pct);

    s.time = result.elapsed;
    s.time_per_iteration = result.iterations > 0 ? result.elapsed_last_iteration / result.iterations : 0.0;
    return s;
}

static void print_body(const RunStats& s, const GRASP_Params& params, std::ostream& out) {
    out << std::fixed << std::setprecision(1);
    out << "Number of requests : " << s.nRequests << "\n";
    out << "Number of GRASP iterations : " << s.iterations << "\n";
    out << "Best obj (" << to_string(params.objectiveMode) << ") : " << s.objective
        << " (" << s.objective_pct << " %)\n";
    out << "Requests served : " << s.served << "\n";
    out << (s.complete ? "Every request is " : "Not every request is ")
        << (params.objectiveMode == ObjectiveMode::POOLED ? "pooled" : "served") << "\n\n";

    out << "Capacity of the taxis : " << params.capacity << "\n";
    out << "Speed of the taxis : " << params.speed << " km/h\n";
    out << std::setprecision(2);
    out << "Average number of clients served by taxi : " << s.mean_requests_per_route << "\n";
    out << "Maximum number of clients served by 1 taxi : " << s.max_requests_per_route << "\n";
    out << std::setprecision(1);
    out << "Average objective of the initial greedy solutions : " << s.mean_initial_pct << " %\n\n";

    out << "Average delay of pooled customers : " << s.mean_delay << " sec (+" << s.mean_delay_pct << " %)\n";
    out << "Standard deviation of the delay : " << s.std_delay << " sec\n";
    out << "Maximum delay : " << s.max_delay << " sec (+" << s.max_delay_pct << " %)\n";
    out << "Minimum delay : " << s.min_delay << " sec (+" << s.min_delay_pct << " %)\n\n";

    out << std::setprecision(2) << "Value of alpha : " << params.alpha << "\n" << std::setprecision(1);
    out << "Average price saving of pooled customers : -" << s.mean_saving_pct << " %\n";
    out << "Maximum price saving : -" << s.max_saving_pct << " %\n";
    out << "Minimum price saving : -" << s.min_saving_pct << " %\n\n";

    out << "Average pickup advance : " << s.mean_advance << " sec (" << s.mean_advance_pct << " % of the window)\n";
    out << "Standard deviation of the pickup advance : " << s.std_advance << " sec\n";
    out << "Maximum pickup advance : " << s.max_advance << " sec (" << s.max_advance_pct << " %)\n";
    out << "Minimum pickup advance : " << s.min_advance << " sec (" << s.min_advance_pct << " %)\n\n";

    out << std::setprecision(2);
    out << "Computation time : " << s.time << " sec\n";
    out << "Average computation time by iteration : " << s.time_per_iteration << " sec\n";
}

void print_stats(const RunStats& stats, const GRASP_Params& params, std::ostream& out) {
    out << "\n---------------------------------------------------------\n";
    out << "                     Final stats                         \n";
    out << "---------------------------------------------------------\n\n";
    print_body(stats, params, out);
}

void print_global_stats(const vector<RunStats>& runs, const GRASP_Params& params, std::ostream& out) {
    if (runs.empty()) return;

    RunStats avg;
    const double k = (double)runs.size();
    double iterations = 0.0, objective = 0.0, served = 0.0, max_per_route = 0.0;
    int complete = 0;
    for (const RunStats& r : runs) {
        avg.nRequests = r.nRequests;
        iterations += r.iterations;
        objective += r.objective;
        served += r.served;
        max_per_route += r.max_requests_per_route;
        if (r.complete) ++complete;

        avg.objective_pct += r.objective_pct / k;
        avg.mean_requests_per_route += r.mean_requests_per_route / k;
        avg.mean_initial_pct += r.mean_initial_pct / k;
        avg.mean_delay += r.mean_delay / k;
        avg.mean_delay_pct += r.mean_delay_pct / k;
        avg.std_delay += r.std_delay / k;
        avg.max_delay += r.max_delay / k;
        avg.max_delay_pct += r.max_delay_pct / k;
        avg.min_delay += r.min_delay / k;
        avg.min_delay_pct += r.min_delay_pct / k;
        avg.mean_saving_pct += r.mean_saving_pct / k;
        avg.max_saving_pct += r.max_saving_pct / k;
        avg.min_saving_pct += r.min_saving_pct / k;
        avg.mean_advance += r.mean_advance / k;
        avg.mean_advance_pct += r.mean_advance_pct / k;
        avg.std_advance += r.std_advance / k;
        avg.max_advance += r.max_advance / k;
        avg.max_advance_pct += r.max_advance_pct / k;
        avg.min_advance += r.min_advance / k;
        avg.min_advance_pct += r.min_advance_pct / k;
        avg.time += r.time / k;
        avg.time_per_iteration += r.time_per_iteration / k;
    }
    avg.iterations = (int)(iterations / k + 0.5);
    avg.objective = (int)(objective / k + 0.5);
    avg.served = (int)(served / k + 0.5);
    avg.max_requests_per_route = (int)(max_per_route / k + 0.5);
    avg.complete = complete == (int)runs.size();

    out << "\n---------------------------------------------------------\n";
    out << "                   Global Final stats                    \n";
    out << "---------------------------------------------------------\n\n";
    out << "Runs : " << runs.size() << " (complete in " << complete << ")\n";
    print_body(avg, params, out);
}

static std::string format_clock(double seconds) {
    long t = (long)(seconds + 0.5);
    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << (t / 3600) % 24 << ":"
       << std::setw(2) << (t / 60) % 60 << ":" << std::setw(2) << t % 60;
    return os.str();
}

void print_solution(const Solution& sol, std::ostream& out) {
    for (size_t r = 0; r < sol.routes.size(); ++r) {
        const Route& route = sol.routes[r];
        out << "Route " << r << " (" << route.nRequests() << " requests, "
            << std::fixed << std::setprecision(1) << route.cost << " s):";
        for (const Stop& s : route.stops) {
            out << " " << (s.type == PICKUP ? "+" : "-") << s.request
                << "@" << format_clock(s.time) << "[" << s.load << "]";
        }
        out << "\n";
    }
    out << "Unassigned (" << sol.unassigned.size() << "):";
    for (int r : sol.unassigned) out << " " << r;
    out << "\n";
}

void write_solution(const std::string& filename, const Solution& sol, const DARP& darp,
                    const RunStats& stats, const GRASP_Params& params) {
    std::ofstream file(filename.c_str());
    if (!file) throw std::runtime_error("cannot write solution file: " + filename);

    file << "# objective " << stats.objective << " / " << stats.nRequests
         << " (" << to_string(params.objectiveMode) << ")\n";
    file << "# routes " << sol.routes.size() << ", unassigned " << sol.unassigned.size() << "\n";
    file << "# request pickup_time dropoff_time route\n";
    for (size_t r = 0; r < sol.routes.size(); ++r) {
        std::map<int, double> pickup;
        for (const Stop& s : sol.routes[r].stops) {
            if (s.type == PICKUP) {
                pickup[s.request] = s.time;
            } else {
                file << s.request << " " << std::fixed << std::setprecision(1)
                     << pickup[s.request] << " " << s.time << " " << r << "\n";
            }
        }
    }
    print_solution(sol, file);
    print_stats(stats, params, file);
    if (!file) throw std::runtime_error("error while writing " + filename);
}
