/*
 * report.hpp
 * Run statistics, console summaries and the solution file.
 */
#ifndef REPORT_HPP
#define REPORT_HPP

#include "darp.hpp"
#include "grasp.hpp"
#include "parameters.hpp"
#include "solution.hpp"
#include <ostream>
#include <string>
#include <vector>

// Figures of one solved run. Delays/advances in seconds, ratios in %.
struct RunStats {
    int nRequests = 0;
    int iterations = 0;
    int objective = 0;
    int served = 0;
    double objective_pct = 0.0;
    bool complete = false;          // objective reached the number of requests

    double mean_requests_per_route = 0.0;
    int max_requests_per_route = 0;
    double mean_initial_pct = 0.0;

    double mean_delay = 0.0, mean_delay_pct = 0.0, std_delay = 0.0;
    double max_delay = 0.0, max_delay_pct = 0.0, min_delay = 0.0, min_delay_pct = 0.0;

    double mean_saving_pct = 0.0, max_saving_pct = 0.0, min_saving_pct = 0.0;

    double mean_advance = 0.0, mean_advance_pct = 0.0, std_advance = 0.0;
    double max_advance = 0.0, max_advance_pct = 0.0, min_advance = 0.0, min_advance_pct = 0.0;

    double time = 0.0;
    double time_per_iteration = 0.0;
};

/**
 * @brief Gathers the figures of a run. 'final_solution' is the solution
 * reported (the elite, or its recombined version); it must be evaluated.
 */
RunStats compute_run_stats(const GraspResult& result, const Solution& final_solution,
                           const DARP& darp, const GRASP_Params& params);

void print_stats(const RunStats& stats, const GRASP_Params& params, std::ostream& out);

// Averages of every figure over the runs
void print_global_stats(const std::vector<RunStats>& runs, const GRASP_Params& params, std::ostream& out);

// Routes with stop times and loads, then the unassigned pool
void print_solution(const Solution& sol, std::ostream& out);

// Throws std::runtime_error if the file cannot be written
void write_solution(const std::string& filename, const Solution& sol, const DARP& darp,
                    const RunStats& stats, const GRASP_Params& params);

#endif // REPORT_HPP
