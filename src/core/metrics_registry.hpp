#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include "utils/circuit_breaker.hpp"

#include <memory>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>

// Runtime state sampled periodically by the web server and kept in a
// prometheus-cpp registry: process memory, circuit breaker state per
// endpoint and the number of user windows held in memory.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  // Reads /proc/self/statm; leaves the gauge unchanged if it is unavailable
  void sample_process_memory();

  void set_circuit_state(const std::string &endpoint,
                         circuit_breaker::State state);

  void set_active_windows(size_t active_windows);

  // Prometheus text exposition of everything in the registry
  std::string serialize() const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
  prometheus::Gauge &resident_memory_;
  prometheus::Family<prometheus::Gauge> &circuit_state_;
  prometheus::Gauge &active_windows_;
};

#endif // METRICS_REGISTRY_HPP
