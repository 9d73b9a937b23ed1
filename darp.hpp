#ifndef DARP_HPP
#define DARP_HPP

#include "parameters.hpp"
#include <vector>
#include <string>
#include <random>

// Planar position in kilometres
struct Point {
    double x, y;
};

struct TimeWindow {
    double earliest, latest; // seconds since midnight
};

class Request {
public:
    int id;                   // position in DARP::requests, ascending pickup time
    double requested_pickup;
    TimeWindow pickup_window;
    TimeWindow dropoff_window;
    Point pickup, dropoff;
    double direct_distance;   // km
    double direct_time;       // s
    double direct_fare;
};

class DARP {
public:
    std::vector<Request> requests;
    double speed;      // km/h
    double fareBase, farePerKm;
    int timeWindow;    // minutes

    DARP();

    int nRequests() const { return (int)requests.size(); }

    double distance(const Point& a, const Point& b) const;
    double travelTime(const Point& a, const Point& b) const;

    /**
     * @brief Builds a request with the usual windows:
     * pickup [t - margin, t], dropoff [t + direct, t + direct + margin].
     * The id is left at -1 until the request is added to an instance.
     */
    Request makeRequest(double requested_pickup, const Point& pickup, const Point& dropoff) const;

    // Appends the request and gives it the next id
    void addRequest(const Request& request);

    // Sorts by requested pickup time and renumbers ids
    void sortAndReindex();

    void readDataFromFile(const std::string& filename, const Instance_Params& params);
    void saveCheckpoint(const std::string& filename) const;
    void loadCheckpoint(const std::string& filename);

    // Random subset of n requests (all of them when n <= 0 or n >= size), reindexed
    DARP sample(int n, std::mt19937& rng) const;

    void printData() const;
};

#endif // DARP_HPP
