#ifndef DEADLINE_HPP
#define DEADLINE_HPP

#include <chrono>
#include <csignal>

/**
 * @class Deadline
 * @brief Wall-clock budget plus cancellation flag, polled by the engines
 * between moves. A budget of 0 is expired from the start.
 */
class Deadline {
public:
    explicit Deadline(double seconds);

    bool expired() const;
    double elapsed() const;   // seconds since construction
    double budget() const { return budget_; }

    void cancel() { cancelled_ = true; }

    // Flag set asynchronously (e.g. by a SIGINT handler); only ever read here
    void watch(const volatile std::sig_atomic_t* flag) { external_ = flag; }

private:
    std::chrono::steady_clock::time_point start_;
    double budget_;
    bool cancelled_;
    const volatile std::sig_atomic_t* external_;
};

#endif // DEADLINE_HPP
