#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include "core/metrics_manager.hpp"

#include <chrono>

// Observes the lifetime of the enclosing scope, in seconds, into a histogram
class ScopedTimer {
public:
  explicit ScopedTimer(Histogram &histogram_metric)
      : metric_(histogram_metric),
        start_time_(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() {
    auto duration = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time_);
    metric_.observe(duration.count());
  }

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
  Histogram &metric_;
  std::chrono::steady_clock::time_point start_time_;
};

#endif // SCOPED_TIMER_HPP
