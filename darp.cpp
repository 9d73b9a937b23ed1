#include "darp.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <numeric>
#include <stdexcept>

using std::vector;

static const double KM_PER_DEG_LAT = 110.574;
static const double KM_PER_DEG_LON_EQUATOR = 111.320;
static const double MAX_DIRECT_TIME = 12 * 3600.0;
static const double PI = 3.14159265358979323846;
static const char* CHECKPOINT_TAG = "DARPM_CHECKPOINT";

DARP::DARP() : speed(40.0), fareBase(2.5), farePerKm(1.56), timeWindow(15) {}

double DARP::distance(const Point& a, const Point& b) const {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

double DARP::travelTime(const Point& a, const Point& b) const {
    return distance(a, b) / speed * 3600.0;
}

Request DARP::makeRequest(double requested_pickup, const Point& pickup, const Point& dropoff) const {
    Request r;
    r.id = -1;
    r.requested_pickup = requested_pickup;
    r.pickup = pickup;
    r.dropoff = dropoff;
    r.direct_distance = distance(pickup, dropoff);
    r.direct_time = travelTime(pickup, dropoff);
    r.direct_fare = fareBase + farePerKm * r.direct_distance;

    double margin = timeWindow * 60.0;
    double arrival = requested_pickup + r.direct_time;
    r.pickup_window.earliest = requested_pickup - margin;
    r.pickup_window.latest = requested_pickup;
    r.dropoff_window.earliest = arrival;
    r.dropoff_window.latest = arrival + margin;
    return r;
}

void DARP::addRequest(const Request& request) {
    requests.push_back(request);
    requests.back().id = (int)requests.size() - 1;
}

void DARP::sortAndReindex() {
    std::stable_sort(requests.begin(), requests.end(), [](const Request& a, const Request& b) {
        return a.requested_pickup < b.requested_pickup;
    });
    for (size_t i = 0; i < requests.size(); ++i) requests[i].id = (int)i;
}

// "2015-01-15 19:05:39" -> seconds since midnight
static bool parse_datetime(const std::string& value, double& seconds) {
    size_t space = value.find(' ');
    if (space == std::string::npos) return false;
    int h = 0, m = 0, s = 0;
    char c1 = 0, c2 = 0;
    std::istringstream iss(value.substr(space + 1));
    if (!(iss >> h >> c1 >> m >> c2 >> s) || c1 != ':' || c2 != ':') return false;
    seconds = h * 3600.0 + m * 60.0 + s;
    return true;
}

struct RawTrip {
    double pickup_time;
    double pu_lon, pu_lat, do_lon, do_lat;
};

void DARP::readDataFromFile(const std::string& filename, const Instance_Params& params) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    requests.clear();
    timeWindow = params.timeWindow;
    fareBase = params.fareBase;
    farePerKm = params.farePerKm;

    // --- STEP 1: read rows, dropping null coordinates and identical endpoints ---
    vector<RawTrip> trips;
    std::string line;
    std::getline(file, line); // header
    int row = 0, malformed = 0;
    while (std::getline(file, line)) {
        if (params.size > 0 && row >= params.size) break;
        ++row;
        if (row % 1000 == 0) std::cerr << row << "\r";

        vector<std::string> cols;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) cols.push_back(cell);
        if (cols.size() < 11) {
            ++malformed;
            continue;
        }

        RawTrip t;
        try {
            if (!parse_datetime(cols[1], t.pickup_time)) {
                ++malformed;
                continue;
            }
            t.pu_lon = std::stod(cols[5]);
            t.pu_lat = std::stod(cols[6]);
            t.do_lon = std::stod(cols[9]);
            t.do_lat = std::stod(cols[10]);
        } catch (const std::exception&) {
            ++malformed;
            continue;
        }

        bool null_coordinates = t.pu_lon == 0.0 || t.pu_lat == 0.0 || t.do_lon == 0.0 || t.do_lat == 0.0;
        bool same_coordinates = t.pu_lon == t.do_lon && t.pu_lat == t.do_lat;
        if (null_coordinates || same_coordinates) continue;
        trips.push_back(t);
    }
    if (malformed > 0) {
        std::cerr << "WARNING: " << malformed << " malformed rows skipped in " << filename << std::endl;
    }
    if (trips.empty()) {
        std::cout << "Dataset size: 0 taxi requests" << std::endl;
        return;
    }

    // --- STEP 2: project longitude/latitude to kilometres around the mean position ---
    double lat0 = 0.0, lon0 = 0.0;
    for (const RawTrip& t : trips) {
        lat0 += t.pu_lat + t.do_lat;
        lon0 += t.pu_lon + t.do_lon;
    }
    lat0 /= 2.0 * trips.size();
    lon0 /= 2.0 * trips.size();
    const double km_per_deg_lon = KM_PER_DEG_LON_EQUATOR * std::cos(lat0 * PI / 180.0);

    vector<Request> dataset;
    for (const RawTrip& t : trips) {
        Point pu = {(t.pu_lon - lon0) * km_per_deg_lon, (t.pu_lat - lat0) * KM_PER_DEG_LAT};
        Point dr = {(t.do_lon - lon0) * km_per_deg_lon, (t.do_lat - lat0) * KM_PER_DEG_LAT};
        Request r = makeRequest(t.pickup_time, pu, dr);
        if (r.direct_time > MAX_DIRECT_TIME) continue;
        dataset.push_back(r);
    }
    std::cout << "Dataset size: " << dataset.size() << " taxi requests" << std::endl;
    if (dataset.empty()) return;

    // --- STEP 3: sort by pickup time and keep the first timeframe ---
    std::stable_sort(dataset.begin(), dataset.end(), [](const Request& a, const Request& b) {
        return a.pickup_window.earliest < b.pickup_window.earliest;
    });
    const double t0 = dataset.front().pickup_window.earliest;
    for (const Request& r : dataset) {
        if (r.pickup_window.earliest >= t0 + params.timeframe) break;
        addRequest(r);
    }
    sortAndReindex();
    std::cout << "Origin time: " << t0 << " s, timeframe: " << params.timeframe << " s" << std::endl;
    std::cout << "Number of taxi requests: " << requests.size() << std::endl;
}

void DARP::saveCheckpoint(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Unable to write checkpoint: " + filename);
    }
    out << std::setprecision(17);
    out << CHECKPOINT_TAG << " " << requests.size() << " " << speed << " " << fareBase << " "
        << farePerKm << " " << timeWindow << "\n";
    for (const Request& r : requests) {
        out << r.requested_pickup << " "
            << r.pickup_window.earliest << " " << r.pickup_window.latest << " "
            << r.dropoff_window.earliest << " " << r.dropoff_window.latest << " "
            << r.pickup.x << " " << r.pickup.y << " " << r.dropoff.x << " " << r.dropoff.y << " "
            << r.direct_distance << " " << r.direct_time << " " << r.direct_fare << "\n";
    }
}

void DARP::loadCheckpoint(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Unable to open checkpoint: " + filename);
    }
    std::string tag;
    size_t n = 0;
    if (!(in >> tag >> n >> speed >> fareBase >> farePerKm >> timeWindow) || tag != CHECKPOINT_TAG) {
        throw std::runtime_error("Malformed checkpoint header in " + filename);
    }
    requests.clear();
    requests.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        Request r;
        if (!(in >> r.requested_pickup
                 >> r.pickup_window.earliest >> r.pickup_window.latest
                 >> r.dropoff_window.earliest >> r.dropoff_window.latest
                 >> r.pickup.x >> r.pickup.y >> r.dropoff.x >> r.dropoff.y
                 >> r.direct_distance >> r.direct_time >> r.direct_fare)) {
            throw std::runtime_error("Truncated checkpoint " + filename);
        }
        addRequest(r);
    }
    sortAndReindex();
}

DARP DARP::sample(int n, std::mt19937& rng) const {
    DARP out = *this;
    if (n <= 0 || n >= nRequests()) return out;
    vector<int> idx(requests.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::shuffle(idx.begin(), idx.end(), rng);
    out.requests.clear();
    for (int i = 0; i < n; ++i) out.addRequest(requests[idx[i]]);
    out.sortAndReindex();
    return out;
}

void DARP::printData() const {
    std::cout << "=== DARP-M Instance Data ===\n";
    std::cout << "Requests: " << requests.size()
              << " Speed: " << speed << " km/h"
              << " Time window: " << timeWindow << " min"
              << " Fare: " << fareBase << " + " << farePerKm << "/km\n";
    if (!requests.empty()) {
        double total = 0.0;
        for (const Request& r : requests) total += r.direct_time;
        std::cout << std::fixed << std::setprecision(2)
                  << "First pickup: " << requests.front().requested_pickup << " s"
                  << " Last pickup: " << requests.back().requested_pickup << " s"
                  << " Mean direct trip: " << total / requests.size() << " s\n";
    }
    std::cout << "============================\n";
}
