#ifndef UTILS_HPP
#define UTILS_HPP

#include <random>
#include <string>

// Random helpers on an explicit generator (one per run, seeded from the command line)
inline int randint(std::mt19937& rng, int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(rng);
}

inline double randreal(std::mt19937& rng) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

// Removes leading and trailing whitespace in place
void trim(std::string& s);

#endif // UTILS_HPP
