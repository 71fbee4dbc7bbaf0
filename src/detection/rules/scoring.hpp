#ifndef SCORING_HPP
#define SCORING_HPP

#include <algorithm>
#include <cstddef>

namespace Scoring {

inline double clamp_confidence(double value) {
  if (!(value > 0.0))
    return 0.0;
  return std::min(value, 1.0);
}

// 0.8 at the threshold, reaching 1.0 once the count is double the threshold
inline double from_rate(size_t count, size_t threshold) {
  if (threshold == 0 || count < threshold)
    return 0.0;
  double excess = static_cast<double>(count - threshold) /
                  static_cast<double>(threshold);
  return clamp_confidence(0.8 + 0.2 * excess);
}

// Best pair similarity, boosted by 10% for every message in the run beyond
// the required minimum
inline double from_duplicate_run(double best_similarity, size_t run_length,
                                 size_t required_run) {
  if (run_length < required_run)
    return 0.0;
  double extra = static_cast<double>(run_length - required_run);
  return clamp_confidence(best_similarity * (1.0 + 0.1 * extra));
}

inline double weighted(double confidence, double weight) {
  return clamp_confidence(confidence) * std::max(weight, 0.0);
}

} // namespace Scoring

#endif // SCORING_HPP
