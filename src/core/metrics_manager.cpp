#include "metrics_manager.hpp"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string labels_to_key(const MetricLabels &labels, const char *separator,
                          bool quote_values) {
  std::string key;
  bool first = true;
  for (const auto &[label, val] : labels) {
    if (!first)
      key += separator;
    key += label + "=";
    key += quote_values ? "\"" + val + "\"" : val;
    first = false;
  }
  return key;
}

} // namespace

Histogram::Histogram(std::string name, std::string help,
                     std::vector<double> bounds)
    : name(std::move(name)), help(std::move(help)), bounds_(std::move(bounds)),
      bucket_counts_(new std::atomic<uint64_t>[bounds_.size()]) {
  std::sort(bounds_.begin(), bounds_.end());
  for (size_t i = 0; i < bounds_.size(); ++i)
    bucket_counts_[i].store(0, std::memory_order_relaxed);
}

const std::vector<double> &Histogram::default_latency_bounds() {
  static const std::vector<double> bounds = {0.0005, 0.001, 0.0025, 0.005,
                                             0.01,   0.025, 0.05,   0.1,
                                             0.25,   0.5,   1.0,    2.5,
                                             5.0,    10.0,  30.0};
  return bounds;
}

void Histogram::observe(double value) {
  double current_sum = cumulative_sum_.load(std::memory_order_relaxed);
  while (!cumulative_sum_.compare_exchange_weak(
      current_sum, current_sum + value, std::memory_order_release,
      std::memory_order_relaxed))
    ;
  cumulative_count_.fetch_add(1, std::memory_order_relaxed);

  auto first = std::lower_bound(bounds_.begin(), bounds_.end(), value);
  for (auto i = static_cast<size_t>(first - bounds_.begin()); i < bounds_.size();
       ++i)
    bucket_counts_[i].fetch_add(1, std::memory_order_relaxed);
}

std::vector<uint64_t> Histogram::get_bucket_counts() const {
  std::vector<uint64_t> counts(bounds_.size());
  for (size_t i = 0; i < bounds_.size(); ++i)
    counts[i] = bucket_counts_[i].load(std::memory_order_relaxed);
  return counts;
}

double Histogram::get_cumulative_sum() const {
  return cumulative_sum_.load(std::memory_order_relaxed);
}

uint64_t Histogram::get_cumulative_count() const {
  return cumulative_count_.load(std::memory_order_relaxed);
}

void LabeledCounter::increment(const MetricLabels &labels, uint64_t value) {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto &series = series_[labels];
  if (!series)
    series = std::make_unique<Series>();
  series->val.fetch_add(value, std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_value(const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto it = series_.find(labels);
  return it == series_.end() ? 0
                             : it->second->val.load(std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_total() const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  uint64_t total = 0;
  for (const auto &[labels, series_ptr] : series_)
    total += series_ptr->val.load(std::memory_order_relaxed);
  return total;
}

int64_t RateMeter::now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

void RateMeter::mark(uint64_t count) {
  const int64_t second = now_seconds();
  const size_t slot = static_cast<size_t>(second % RING_SECONDS);
  std::lock_guard<std::mutex> lock(mtx_);
  if (bucket_second_[slot] != second) {
    bucket_second_[slot] = second;
    bucket_count_[slot] = 0;
  }
  bucket_count_[slot] += count;
}

std::map<std::string, uint64_t> RateMeter::get_counts_in_windows() const {
  const std::pair<const char *, int64_t> windows[] = {
      {"10s", 10}, {"1m", 60}, {"10m", RING_SECONDS}};
  const int64_t now = now_seconds();

  std::map<std::string, uint64_t> results;
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto &[name, length] : windows) {
    uint64_t total = 0;
    for (size_t slot = 0; slot < bucket_second_.size(); ++slot) {
      const int64_t age = now - bucket_second_[slot];
      if (bucket_second_[slot] >= 0 && age >= 0 && age < length)
        total += bucket_count_[slot];
    }
    results[name] = total;
  }
  return results;
}

MetricsManager &MetricsManager::instance() {
  static MetricsManager instance;
  return instance;
}

LabeledCounter *
MetricsManager::register_labeled_counter(const std::string &name,
                                         const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = labeled_counters_[name];
  if (!slot)
    slot.reset(new LabeledCounter(name, help_text));
  return slot.get();
}

Gauge *MetricsManager::register_gauge(const std::string &name,
                                      const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = gauges_[name];
  if (!slot)
    slot.reset(new Gauge(name, help_text));
  return slot.get();
}

Histogram *MetricsManager::register_histogram(const std::string &name,
                                              const std::string &help_text,
                                              const std::vector<double> &bounds) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = histograms_[name];
  if (!slot)
    slot.reset(new Histogram(name, help_text, bounds));
  return slot.get();
}

RateMeter *MetricsManager::register_rate_meter(const std::string &name,
                                              const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = rate_meters_[name];
  if (!slot)
    slot.reset(new RateMeter(name, help_text));
  return slot.get();
}

std::string MetricsManager::expose_as_prometheus_text() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::stringstream ss;

  for (const auto &[name, counter_ptr] : labeled_counters_) {
    ss << "# HELP " << name << " " << counter_ptr->help << "\n";
    ss << "# TYPE " << name << " counter\n";

    std::lock_guard<std::mutex> series_lock(counter_ptr->series_mutex_);
    for (const auto &[labels, series_ptr] : counter_ptr->series_) {
      ss << name;
      if (!labels.empty())
        ss << "{" << labels_to_key(labels, ",", true) << "}";
      ss << " " << series_ptr->val.load(std::memory_order_relaxed) << "\n";
    }
  }

  for (const auto &[name, gauge_ptr] : gauges_) {
    ss << "# HELP " << name << " " << gauge_ptr->help << "\n";
    ss << "# TYPE " << name << " gauge\n";
    ss << name << " " << gauge_ptr->get_value() << "\n";
  }

  for (const auto &[name, histo_ptr] : histograms_) {
    ss << "# HELP " << name << " " << histo_ptr->help << "\n";
    ss << "# TYPE " << name << " histogram\n";

    double sum = histo_ptr->get_cumulative_sum();
    uint64_t count = histo_ptr->get_cumulative_count();

    const auto &bounds = histo_ptr->get_bounds();
    const auto buckets = histo_ptr->get_bucket_counts();
    for (size_t i = 0; i < bounds.size(); ++i)
      ss << name << "_bucket{le=\"" << bounds[i] << "\"} " << buckets[i]
         << "\n";
    ss << name << "_bucket{le=\"+Inf\"} " << count << "\n";
    ss << name << "_sum " << sum << "\n";
    ss << name << "_count " << count << "\n";
  }

  return ss.str();
}

std::string MetricsManager::expose_as_json() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  json j;

  auto now = std::chrono::steady_clock::now();
  j["server_timestamp_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();
  j["app_runtime_seconds"] =
      std::chrono::duration_cast<std::chrono::seconds>(now - start_time_)
          .count();

  json j_counters = json::object();
  for (const auto &[name, counter_ptr] : labeled_counters_) {
    json j_series = json::object();
    std::lock_guard<std::mutex> series_lock(counter_ptr->series_mutex_);
    uint64_t total = 0;

    for (const auto &[labels, series_ptr] : counter_ptr->series_) {
      // e.g. "action=mute,outcome=success"
      std::string label_key = labels_to_key(labels, ",", false);
      uint64_t val = series_ptr->val.load(std::memory_order_relaxed);
      if (!label_key.empty())
        j_series[label_key] = val;
      total += val;
    }

    j_series["total"] = total;
    j_counters[name] = j_series;
  }
  j["counters"] = j_counters;

  json j_gauges = json::object();
  for (const auto &[name, gauge_ptr] : gauges_) {
    j_gauges[name] = gauge_ptr->get_value();
  }
  j["gauges"] = j_gauges;

  json j_rates = json::object();
  for (const auto &[name, meter_ptr] : rate_meters_)
    j_rates[name] = meter_ptr->get_counts_in_windows();
  j["rates"] = j_rates;

  json j_histograms = json::object();
  for (const auto &[name, histo_ptr] : histograms_) {
    json j_histo_details;
    json j_buckets = json::object();
    const auto &bounds = histo_ptr->get_bounds();
    const auto buckets = histo_ptr->get_bucket_counts();
    for (size_t i = 0; i < bounds.size(); ++i) {
      std::ostringstream bound;
      bound << bounds[i];
      j_buckets[bound.str()] = buckets[i];
    }
    j_histo_details["buckets"] = j_buckets;
    j_histo_details["count"] = histo_ptr->get_cumulative_count();
    j_histo_details["sum"] = histo_ptr->get_cumulative_sum();
    j_histograms[name] = j_histo_details;
  }
  j["histograms"] = j_histograms;

  return j.dump();
}
