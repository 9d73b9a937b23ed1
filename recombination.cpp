#include "recombination.hpp"
#include "deadline.hpp"
#include "evaluation.hpp"
#include "feasibility.hpp"
#include "insertion.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <string>

using std::vector;

int route_weight(const Route& route, const GRASP_Params& params) {
    int n = route.nRequests();
    if (params.objectiveMode == ObjectiveMode::POOLED && n < 2) return 0;
    return n;
}

static vector<int> request_key(const Route& route) {
    vector<int> key = route.requests();
    std::sort(key.begin(), key.end());
    return key;
}

bool recombine_routes(const vector<Route>& pool, const Solution& start, const DARP& darp,
                      const GRASP_Params& params, std::mt19937& rng, Solution& result, bool verbose) {
    const int n = darp.nRequests();
    if (pool.empty()) return false;

    std::set<vector<int> > start_routes;
    for (const Route& route : start.routes) start_routes.insert(request_key(route));

    vector<int> chosen;
    try {
        GRBEnv env(true);
        env.set("LogToConsole", "0");
        env.set(GRB_IntParam_Threads, 0);
        env.start();
        GRBModel model(env);

        model.set(GRB_DoubleParam_TimeLimit, params.recombineTimeLimit);
        model.set(GRB_IntAttr_ModelSense, GRB_MAXIMIZE);

        // --- STEP 1: one binary per route ---
        vector<GRBVar> x(pool.size());
        vector<GRBLinExpr> cover(n);
        vector<bool> covered(n, false);
        for (size_t k = 0; k < pool.size(); ++k) {
            x[k] = model.addVar(0.0, 1.0, route_weight(pool[k], params), GRB_BINARY, "x_" + std::to_string(k));
            if (start_routes.count(request_key(pool[k]))) x[k].set(GRB_DoubleAttr_Start, 1.0);
            for (int r : pool[k].requests()) {
                cover[r] += x[k];
                covered[r] = true;
            }
        }

        // --- STEP 2: each request in at most one selected route ---
        for (int r = 0; r < n; ++r) {
            if (covered[r]) model.addConstr(cover[r] <= 1.0, "cover_" + std::to_string(r));
        }

        model.optimize();

        if (model.get(GRB_IntAttr_SolCount) == 0) {
            std::cerr << "WARNING: recombination found no solution (status "
                      << model.get(GRB_IntAttr_Status) << ")\n";
            return false;
        }
        for (size_t k = 0; k < pool.size(); ++k) {
            if (x[k].get(GRB_DoubleAttr_X) > 0.5) chosen.push_back((int)k);
        }
        if (verbose) {
            std::cout << "Recombination: " << pool.size() << " routes, " << chosen.size()
                      << " selected, bound " << model.get(GRB_DoubleAttr_ObjBound) << "\n";
        }
    }
    catch (GRBException& e) {
        std::cerr << "WARNING: Gurobi error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return false;
    }

    // --- STEP 3: rebuild the solution and complete it ---
    Solution sol(n);
    for (int k : chosen) sol.setRoute(-1, pool[k].stops, pool[k].cost);

    Deadline budget(params.recombineTimeLimit);
    insert_requests(sol, darp, params, rng, budget);

    evaluate_solution(sol, params);
    check_solution(sol, darp, params);
    result = sol;
    return true;
}
