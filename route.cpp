#include "route.hpp"

bool Route::contains(int request) const {
    for (const Stop& s : stops) {
        if (s.request == request) return true;
    }
    return false;
}

std::vector<int> Route::requests() const {
    std::vector<int> out;
    out.reserve(stops.size() / 2);
    for (const Stop& s : stops) {
        if (s.type == PICKUP) out.push_back(s.request);
    }
    return out;
}
