#include "darp.hpp"
#include "deadline.hpp"
#include "evaluation.hpp"
#include "feasibility.hpp"
#include "grasp.hpp"
#include "parameters.hpp"
#include "recombination.hpp"
#include "report.hpp"
#include <csignal>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_sigint(int) {
    g_interrupted = 1;
}

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " <trips_file|-> <params_file> <random_seed> [--verbose]\n\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  <trips_file>      Taxi trip records (.csv). '-' loads the checkpoint named in the\n";
    std::cerr << "                    parameter file (dataSaved = 1).\n";
    std::cerr << "  <params_file>     Configuration file (key = value).\n";
    std::cerr << "  <random_seed>     Integer seed of the random generator.\n";
    std::cerr << "  --verbose         (Optional) Progress logs.\n";
}

static void print_parameters(const GRASP_Params& gp, const Instance_Params& ip) {
    std::cout << "--- GRASP parameters ---\n";
    std::cout << " Insertion: " << to_string(gp.insertionMethod)
              << ", Objective: " << to_string(gp.objectiveMode)
              << ", Capacity: " << gp.capacity << ", Speed: " << gp.speed << " km/h\n"
              << " Alpha: " << gp.alpha << ", Beta: " << gp.beta << ", Limit RCL: " << gp.limitRCL << "\n"
              << " LS rounds: " << gp.maxLocalSearchRounds << ", Insert attempts: " << gp.insertAttemptBudget
              << ", Swap attempts: " << gp.swapAttemptBudget << ", Swap fraction: " << gp.swapFraction << "\n"
              << " Time budget: " << gp.timeBudget << " s, Max iterations: " << gp.maxIterations
              << ", Recombination: " << (gp.recombine ? "on" : "off") << "\n";
    std::cout << "--- Instance parameters ---\n";
    std::cout << " Time window: " << ip.timeWindow << " min, Timeframe: " << ip.timeframe << " s"
              << ", Test size: " << ip.testSize << ", Runs: " << ip.nbTests << "\n";
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string trips_file = argv[1];
    std::string params_file = argv[2];
    unsigned int seed;
    try {
        seed = std::stoul(argv[3]);
    } catch (const std::exception&) {
        std::cerr << "ERROR: invalid random seed '" << argv[3] << "'.\n";
        return 1;
    }
    bool verbose_mode = (argc > 4 && std::string(argv[4]) == "--verbose");

    std::mt19937 rng(seed);
    std::signal(SIGINT, on_sigint);

    try {
        GRASP_Params grasp_params;
        Instance_Params instance_params;
        load_parameters_from_file(params_file, grasp_params, instance_params);
        validate_parameters(grasp_params, instance_params);

        // --- STEP 1: instance ---
        DARP darp;
        darp.speed = grasp_params.speed;
        if (instance_params.dataSaved || trips_file == "-") {
            if (instance_params.checkpoint.empty()) {
                throw std::invalid_argument("dataSaved requires a 'checkpoint' path");
            }
            darp.loadCheckpoint(instance_params.checkpoint);
            if (darp.speed != grasp_params.speed) {
                std::cerr << "WARNING: checkpoint built for " << darp.speed
                          << " km/h, ignoring speed = " << grasp_params.speed << std::endl;
                grasp_params.speed = darp.speed;
            }
            std::cout << "Checkpoint read: " << instance_params.checkpoint << "\n";
        } else {
            darp.readDataFromFile(trips_file, instance_params);
            if (!instance_params.checkpoint.empty()) {
                darp.saveCheckpoint(instance_params.checkpoint);
                std::cout << "Checkpoint written: " << instance_params.checkpoint << "\n";
            }
            std::cout << "Trips read: " << trips_file << "\n";
        }
        std::cout << "Random seed: " << seed << "\n";
        print_parameters(grasp_params, instance_params);
        darp.printData();

        // --- STEP 2: independent runs on random samples ---
        std::vector<RunStats> runs;
        for (int test = 0; test < instance_params.nbTests; ++test) {
            std::cout << "\n     ----    " << test << "   ---\n";
            DARP instance = darp.sample(instance_params.testSize, rng);

            Deadline deadline(grasp_params.timeBudget);
            deadline.watch(&g_interrupted);
            GraspResult result = run_grasp(instance, grasp_params, rng, deadline, verbose_mode);

            if (!result.has_solution) {
                std::cout << "No GRASP iteration completed within " << grasp_params.timeBudget
                          << " s: no solution for this run.\n";
                if (g_interrupted) break;
                continue;
            }

            Solution final_solution = result.best;
            if (grasp_params.recombine && !g_interrupted) {
                Solution recombined;
                if (recombine_routes(result.route_pool, result.best, instance, grasp_params, rng,
                                     recombined, verbose_mode) &&
                    recombined.objective > final_solution.objective) {
                    std::cout << "Recombination improved the elite: " << final_solution.objective
                              << " -> " << recombined.objective << "\n";
                    final_solution = recombined;
                }
            }

            std::cout << "\n--- Tests on the best solution found ---\n";
            check_solution(final_solution, instance, grasp_params);
            std::cout << "Final best solution valid\n";

            RunStats stats = compute_run_stats(result, final_solution, instance, grasp_params);
            print_stats(stats, grasp_params, std::cout);
            if (verbose_mode) print_solution(final_solution, std::cout);

            if (!instance_params.output.empty()) {
                std::string path = instance_params.output;
                if (instance_params.nbTests > 1) path += "." + std::to_string(test);
                write_solution(path, final_solution, instance, stats, grasp_params);
                std::cout << "Solution written: " << path << "\n";
            }
            runs.push_back(stats);

            if (g_interrupted) {
                std::cerr << "WARNING: interrupted, remaining runs skipped." << std::endl;
                break;
            }
        }

        print_global_stats(runs, grasp_params, std::cout);
    } catch (const InvalidSolutionError& e) {
        std::cerr << "ERROR: invalid solution (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nDone.\n";
    return 0;
}
