#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "parameters.hpp"
#include "test_helpers.hpp"

static bool rejects(const GRASP_Params& gp, const Instance_Params& ip) {
    try {
        validate_parameters(gp, ip);
    } catch (const std::invalid_argument& e) {
        std::cout << "    rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "--- Parameter file ---" << std::endl;

    const std::string filename = "test_parameters.txt";
    {
        std::ofstream out(filename.c_str());
        out << "# experiment\n"
            << "alpha = 1.8\n"
            << "beta=0.25\n"
            << "capacity = 3\n"
            << "insertionMethod = IB\n"
            << "objectiveMode = served\n"
            << "timeBudget = 12.5\n"
            << "recombine = 0\n"
            << "timeWindow = 10\n"
            << "nbTests = 4\n"
            << "checkpoint = requests.chk\n"
            << "speed = fast\n"
            << "colour = blue\n";
    }

    GRASP_Params gp;
    Instance_Params ip;
    load_parameters_from_file(filename, gp, ip);

    check(gp.alpha == 1.8, "alpha read");
    check(gp.beta == 0.25, "key without spaces read");
    check(gp.capacity == 3, "capacity read");
    check(gp.insertionMethod == InsertionMethod::RANDOMIZED_RESTRICTED, "IB selects the RCL strategy");
    check(gp.objectiveMode == ObjectiveMode::SERVED, "objective mode read");
    check(gp.timeBudget == 12.5, "time budget read");
    check(!gp.recombine, "flag read");
    check(ip.timeWindow == 10 && ip.nbTests == 4, "instance keys read");
    check(ip.checkpoint == "requests.chk", "string value read");
    check(gp.speed == 40.0, "malformed value keeps the default");
    check(gp.swapAttemptBudget == 5 && gp.maxLocalSearchRounds == 10, "untouched keys keep defaults");

    GRASP_Params defaults;
    Instance_Params idefaults;
    load_parameters_from_file("no_such_file.txt", defaults, idefaults);
    check(defaults.alpha == 1.5 && idefaults.timeframe == 1000, "missing file keeps every default");

    std::cout << "--- Validation ---" << std::endl;
    check(!rejects(gp, ip), "loaded values accepted");

    GRASP_Params bad = gp;
    bad.alpha = 1.0;
    check(rejects(bad, ip), "alpha of 1 rejected");
    bad = gp;
    bad.beta = 0.0;
    check(rejects(bad, ip), "empty RCL rejected");
    bad = gp;
    bad.capacity = 0;
    check(rejects(bad, ip), "zero capacity rejected");
    bad = gp;
    bad.swapFraction = 1.5;
    check(rejects(bad, ip), "swap fraction above 1 rejected");
    bad = gp;
    bad.timeBudget = -1.0;
    check(rejects(bad, ip), "negative time budget rejected");
    bad = gp;
    bad.timeBudget = 0.0;
    check(!rejects(bad, ip), "zero time budget accepted");

    Instance_Params ibad = ip;
    ibad.nbTests = 0;
    check(rejects(gp, ibad), "zero runs rejected");

    std::cout << "--- Names ---" << std::endl;
    check(parse_insertion_method("IA") == InsertionMethod::EXHAUSTIVE, "IA");
    check(parse_insertion_method("randomized-restricted") == InsertionMethod::RANDOMIZED_RESTRICTED, "long IB name");
    bool threw = false;
    try {
        parse_objective_mode("cheapest");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "unknown objective mode throws");
    check(to_string(InsertionMethod::RANDOMIZED_RESTRICTED) == "IB", "method name");
    check(to_string(ObjectiveMode::POOLED) == "pooled", "mode name");

    std::remove(filename.c_str());
    return finish("test_parameters");
}
