#include "metrics_registry.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>
#include <unistd.h>

namespace {

double circuit_state_value(circuit_breaker::State state) {
  switch (state) {
  case circuit_breaker::State::CLOSED:
    return 0.0;
  case circuit_breaker::State::HALF_OPEN:
    return 1.0;
  case circuit_breaker::State::OPEN:
    return 2.0;
  }
  return 0.0;
}

prometheus::Family<prometheus::Gauge> &
gauge_family(prometheus::Registry &registry, const std::string &name,
             const std::string &help) {
  return prometheus::BuildGauge().Name(name).Help(help).Register(registry);
}

} // namespace

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()),
      resident_memory_(gauge_family(*registry_,
                                    "gw_process_resident_memory_bytes",
                                    "Resident set size of the guild_warden "
                                    "process.")
                           .Add({})),
      circuit_state_(gauge_family(*registry_, "gw_circuit_state",
                                  "Circuit breaker state per endpoint: 0 "
                                  "closed, 1 half open, 2 open.")),
      active_windows_(gauge_family(*registry_, "gw_active_user_windows",
                                   "User windows currently held in memory.")
                          .Add({})) {}

void MetricsRegistry::sample_process_memory() {
  std::ifstream statm("/proc/self/statm");
  long long size = 0, resident = 0;
  if (statm >> size >> resident)
    resident_memory_.Set(static_cast<double>(resident * ::getpagesize()));
}

void MetricsRegistry::set_circuit_state(const std::string &endpoint,
                                        circuit_breaker::State state) {
  circuit_state_.Add({{"endpoint", endpoint}}).Set(circuit_state_value(state));
}

void MetricsRegistry::set_active_windows(size_t active_windows) {
  active_windows_.Set(static_cast<double>(active_windows));
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}
