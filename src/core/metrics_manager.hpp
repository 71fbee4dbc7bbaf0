#ifndef METRICS_MANAGER_HPP
#define METRICS_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Forward declaration
class MetricsManager;

using MetricLabels = std::map<std::string, std::string>;

struct LabeledCounter {
  friend class MetricsManager;
  void increment(const MetricLabels &labels = {}, uint64_t value = 1);

  // Zero for a label set never incremented
  uint64_t get_value(const MetricLabels &labels = {}) const;
  uint64_t get_total() const;

private:
  LabeledCounter(std::string name, std::string help)
      : name(std::move(name)), help(std::move(help)) {}

  struct Series {
    std::atomic<uint64_t> val{0};
  };

  std::string name;
  std::string help;
  std::map<MetricLabels, std::unique_ptr<Series>> series_;
  mutable std::mutex series_mutex_;
};

struct Gauge {
  friend class MetricsManager;
  void set(double value) { val.store(value, std::memory_order_relaxed); }
  double get_value() const { return val.load(std::memory_order_relaxed); }

private:
  Gauge(std::string name, std::string help)
      : name(std::move(name)), help(std::move(help)), val(0.0) {}
  std::string name;
  std::string help;
  std::atomic<double> val;
};

// Cumulative latency histogram in seconds. Bucket bounds are fixed at
// registration; an observation lands in every bucket whose bound it does not
// exceed, plus the implicit +Inf bucket.
struct Histogram {
  friend class MetricsManager;
  void observe(double value);

  // One count per bound, cumulative, in bound order
  std::vector<uint64_t> get_bucket_counts() const;
  const std::vector<double> &get_bounds() const { return bounds_; }
  double get_cumulative_sum() const;
  uint64_t get_cumulative_count() const;

  static const std::vector<double> &default_latency_bounds();

private:
  Histogram(std::string name, std::string help, std::vector<double> bounds);
  std::string name;
  std::string help;

  std::vector<double> bounds_;
  std::unique_ptr<std::atomic<uint64_t>[]> bucket_counts_;
  std::atomic<double> cumulative_sum_{0.0};
  std::atomic<uint64_t> cumulative_count_{0};
};

// Event rate over the trailing 10 seconds, 1 minute and 10 minutes, kept as
// one counter per second in a ring covering the longest window.
class RateMeter {
public:
  friend class MetricsManager;
  void mark(uint64_t count = 1);
  std::map<std::string, uint64_t> get_counts_in_windows() const;

private:
  static constexpr int64_t RING_SECONDS = 600;

  RateMeter(std::string name, std::string help)
      : name_(std::move(name)), help_(std::move(help)),
        bucket_second_(RING_SECONDS, -1), bucket_count_(RING_SECONDS, 0) {}

  static int64_t now_seconds();

  std::string name_;
  std::string help_;
  std::vector<int64_t> bucket_second_;
  std::vector<uint64_t> bucket_count_;
  mutable std::mutex mtx_;
};

// Process-wide metric registry. Registration is idempotent: registering an
// existing name returns the metric already held under it, so components can
// be constructed more than once per process.
class MetricsManager {
public:
  static MetricsManager &instance();

  // Deleted copy and move constructors to prevent copies of the singleton
  MetricsManager(const MetricsManager &) = delete;
  void operator=(const MetricsManager &) = delete;

  LabeledCounter *register_labeled_counter(const std::string &name,
                                           const std::string &help_text);
  Gauge *register_gauge(const std::string &name, const std::string &help_text);
  Histogram *register_histogram(
      const std::string &name, const std::string &help_text,
      const std::vector<double> &bounds = Histogram::default_latency_bounds());

  RateMeter *register_rate_meter(const std::string &name,
                                 const std::string &help_text);

  std::string expose_as_prometheus_text();
  std::string expose_as_json();

private:
  MetricsManager() : start_time_(std::chrono::steady_clock::now()) {}
  ~MetricsManager() = default;

  std::map<std::string, std::unique_ptr<LabeledCounter>> labeled_counters_;
  std::map<std::string, std::unique_ptr<Gauge>> gauges_;
  std::map<std::string, std::unique_ptr<Histogram>> histograms_;
  std::mutex registry_mutex_;

  std::map<std::string, std::unique_ptr<RateMeter>> rate_meters_;
  const std::chrono::time_point<std::chrono::steady_clock> start_time_;
};

#endif // METRICS_MANAGER_HPP
