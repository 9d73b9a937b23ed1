#include <algorithm>
#include <iostream>
#include "evaluation.hpp"
#include "feasibility.hpp"
#include "insertion.hpp"
#include "local_search.hpp"
#include "path_relinking.hpp"
#include "test_helpers.hpp"

static Solution improved_solution(const DARP& darp, const GRASP_Params& params, unsigned int seed) {
    std::mt19937 gen(seed);
    Deadline budget(30.0);
    Solution sol = build_initial_solution(darp, params, gen, budget);
    local_search(sol, darp, params, gen, budget, false);
    return sol;
}

int main() {
    GRASP_Params params = test_params();
    params.insertionMethod = InsertionMethod::RANDOMIZED_RESTRICTED;
    params.beta = 0.5;
    params.limitRCL = 0.5;
    std::mt19937 rng(99);
    Deadline forever(60.0);

    for (unsigned int instance_seed = 1; instance_seed <= 3; ++instance_seed) {
        DARP darp = random_instance(16, instance_seed);
        Solution working = improved_solution(darp, params, 100 + instance_seed);
        Solution elite = improved_solution(darp, params, 200 + instance_seed);

        Solution relinked = path_relinking(working, elite, darp, params, rng, forever);
        std::cout << "Instance " << instance_seed << ": working " << working.objective
                  << ", elite " << elite.objective << ", relinked " << relinked.objective << std::endl;

        ValidationResult v = validate_solution(relinked, darp, params);
        if (!v.ok) std::cout << "    " << to_string(v.kind) << ": " << v.detail << std::endl;
        check(v.ok, "relinked solution valid");
        check(relinked.objective == compute_objective(relinked, params), "relinked solution evaluated");
        check(relinked.objective >= std::min(working.objective, elite.objective), "objective above both inputs' minimum");
    }

    std::cout << "--- Degenerate walks ---" << std::endl;
    DARP darp = random_instance(10, 8);
    Solution a = improved_solution(darp, params, 1);
    Solution self = path_relinking(a, a, darp, params, rng, forever);
    check(self.objective == a.objective && self.routes.size() == a.routes.size(), "walk to itself changes nothing");

    Solution b = improved_solution(darp, params, 2);
    Deadline expired(0.0);
    Solution stopped = path_relinking(a, b, darp, params, rng, expired);
    check(stopped.objective == a.objective && stopped.routes.size() == a.routes.size(),
          "expired deadline returns the working solution");

    GRASP_Params served = params;
    served.objectiveMode = ObjectiveMode::SERVED;
    Solution empty(darp.nRequests());
    Solution toward = path_relinking(empty, a, darp, served, rng, forever);
    check(validate_solution(toward, darp, served).ok, "walk from an empty solution valid");
    check(toward.objective > 0 && toward.nAssigned() == toward.objective, "elite groups rebuilt from scratch");

    return finish("test_path_relinking");
}
