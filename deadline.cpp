#include "deadline.hpp"

Deadline::Deadline(double seconds)
    : start_(std::chrono::steady_clock::now()),
      budget_(seconds),
      cancelled_(false),
      external_(nullptr)
{
}

double Deadline::elapsed() const {
    return std::chrono::duration_cast<std::chrono::duration<double> >(
        std::chrono::steady_clock::now() - start_).count();
}

bool Deadline::expired() const {
    if (cancelled_) return true;
    if (external_ != nullptr && *external_ != 0) return true;
    return elapsed() >= budget_;
}
