#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "darp.hpp"
#include "test_helpers.hpp"

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) <= eps;
}

int main() {
    std::cout << "--- Request model ---" << std::endl;
    DARP darp = empty_instance();
    Point a = {0.0, 0.0};
    Point b = {6.0, 8.0};
    Request r = darp.makeRequest(5000.0, a, b);
    check(near(r.direct_distance, 10.0), "direct distance");
    check(near(r.direct_time, 900.0), "10 km at 40 km/h take 900 s");
    check(near(r.direct_fare, 2.5 + 1.56 * 10.0), "direct fare");
    check(near(r.pickup_window.earliest, 4100.0) && near(r.pickup_window.latest, 5000.0), "pickup window");
    check(near(r.dropoff_window.earliest, 5900.0) && near(r.dropoff_window.latest, 6800.0), "dropoff window");
    check(r.id == -1, "id unset before insertion");

    add_trip(darp, 300.0, 0, 0, 1, 0);
    add_trip(darp, 100.0, 0, 0, 2, 0);
    add_trip(darp, 200.0, 0, 0, 3, 0);
    darp.sortAndReindex();
    check(darp.requests[0].requested_pickup == 100.0 && darp.requests[2].requested_pickup == 300.0,
          "sorted by pickup time");
    check(darp.requests[1].id == 1, "ids follow the order");

    std::cout << "--- Trip records ---" << std::endl;
    const std::string csv = "test_darp_trips.csv";
    {
        std::ofstream out(csv.c_str());
        out << "VendorID,pickup_datetime,dropoff_datetime,passenger_count,trip_distance,"
               "pickup_longitude,pickup_latitude,RateCodeID,store_and_fwd_flag,"
               "dropoff_longitude,dropoff_latitude,payment_type\n";
        out << "2,2015-01-15 19:05:39,2015-01-15 19:23:42,1,1.59,-73.993896,40.750111,1,N,-73.974785,40.750618,1\n";
        out << "1,2015-01-15 19:06:00,2015-01-15 19:20:00,1,2.00,0,0,1,N,-73.974785,40.750618,1\n";
        out << "1,2015-01-15 19:07:00,2015-01-15 19:20:00,1,0.00,-73.98,40.76,1,N,-73.98,40.76,1\n";
        out << "1,not a date,2015-01-15 19:20:00,1,2.00,-73.98,40.76,1,N,-73.97,40.77,1\n";
        out << "2,2015-01-15 19:10:00,2015-01-15 19:30:00,1,3.10,-73.980000,40.740000,1,N,-73.950000,40.780000,2\n";
        out << "2,2015-01-15 19:40:00,2015-01-15 19:50:00,1,1.00,-73.990000,40.730000,1,N,-73.970000,40.760000,2\n";
        out << "2,2015-01-15 19:08:00,short row\n";
        out << "2,2015-01-15 19:09:00,2015-01-15 23:50:00,1,900,-73.990000,40.730000,1,N,-60.000000,40.760000,2\n";
    }

    Instance_Params ip;
    ip.timeWindow = 15;
    ip.timeframe = 1000;
    DARP loaded;
    loaded.speed = 40.0;
    loaded.readDataFromFile(csv, ip);
    check(loaded.nRequests() == 2, "filters keep two trips");
    if (loaded.nRequests() == 2) {
        check(near(loaded.requests[0].requested_pickup, 19 * 3600.0 + 5 * 60.0 + 39.0), "pickup time parsed");
        check(near(loaded.requests[1].requested_pickup, 19 * 3600.0 + 10 * 60.0), "second trip kept");
        check(loaded.requests[0].direct_time > 0.0 && loaded.requests[0].direct_distance > 1.0,
              "projected distance in kilometres");
        check(near(loaded.requests[0].pickup_window.latest - loaded.requests[0].pickup_window.earliest, 900.0),
              "window margin from timeWindow");
    }

    Instance_Params sized = ip;
    sized.size = 1;
    DARP first_row;
    first_row.readDataFromFile(csv, sized);
    check(first_row.nRequests() == 1, "size limits the rows read");

    const std::string long_csv = "test_darp_long_trip.csv";
    {
        std::ofstream out(long_csv.c_str());
        out << "VendorID,pickup_datetime,dropoff_datetime,passenger_count,trip_distance,"
               "pickup_longitude,pickup_latitude,RateCodeID,store_and_fwd_flag,"
               "dropoff_longitude,dropoff_latitude,payment_type\n";
        out << "2,2015-01-15 19:05:00,2015-01-16 08:00:00,1,300,-74.000000,40.000000,1,N,-68.000000,40.000000,1\n";
    }
    DARP too_long;
    too_long.speed = 40.0;
    too_long.readDataFromFile(long_csv, ip);
    check(too_long.nRequests() == 0, "only trip longer than 12 hours: empty instance");
    std::remove(long_csv.c_str());

    bool threw = false;
    try {
        DARP missing;
        missing.readDataFromFile("no_such_trips.csv", ip);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "missing file throws");

    std::cout << "--- Checkpoint ---" << std::endl;
    const std::string chk = "test_darp.chk";
    DARP original = random_instance(8, 11);
    original.saveCheckpoint(chk);
    DARP restored;
    restored.loadCheckpoint(chk);
    bool same = restored.nRequests() == original.nRequests() && restored.speed == original.speed;
    for (int i = 0; same && i < original.nRequests(); ++i) {
        const Request& x = original.requests[i];
        const Request& y = restored.requests[i];
        same = x.requested_pickup == y.requested_pickup && x.pickup.x == y.pickup.x &&
               x.dropoff.y == y.dropoff.y && x.dropoff_window.latest == y.dropoff_window.latest &&
               y.id == i;
    }
    check(same, "save then load gives the same requests");

    {
        std::ofstream out(chk.c_str());
        out << "DARPM_CHECKPOINT 3 40 2.5 1.56 15\n1 2 3\n";
    }
    threw = false;
    try {
        DARP broken;
        broken.loadCheckpoint(chk);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "truncated checkpoint throws");

    std::cout << "--- Sampling ---" << std::endl;
    std::mt19937 rng(3);
    DARP small = original.sample(4, rng);
    bool sorted = small.nRequests() == 4;
    for (int i = 1; sorted && i < small.nRequests(); ++i) {
        sorted = small.requests[i - 1].requested_pickup <= small.requests[i].requested_pickup &&
                 small.requests[i].id == i;
    }
    check(sorted, "sample keeps pickup order and renumbers");
    check(original.sample(0, rng).nRequests() == 8, "testSize 0 keeps everything");

    std::remove(csv.c_str());
    std::remove(chk.c_str());
    return finish("test_darp");
}
