#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace layoutprep {

// Maps a value to its fractional rank in a reference distribution. The result
// for v is the mean of the cumulative share of values < v and the cumulative
// share of values <= v, so a dominant value lands in the middle of its band
// instead of at 1.0.
class PercentileFunction {
 public:
  PercentileFunction() = default;

  // values must be sorted ascending; counts are parallel to values.
  PercentileFunction(std::vector<float> values, const std::vector<double>& counts);

  static PercentileFunction FromCounts(std::vector<std::pair<float, double>> value_counts);
  static PercentileFunction FromValues(std::span<const float> values);

  [[nodiscard]] float operator()(float value) const;
  void Apply(std::span<const float> values, std::span<float> out) const;
  [[nodiscard]] std::vector<float> Apply(std::span<const float> values) const;

  [[nodiscard]] bool empty() const { return values_.empty(); }

 private:
  std::vector<float> values_;
  // cumulative_[0] == 0, cumulative_[i + 1] is the share of values <= values_[i]
  std::vector<float> cumulative_;
};

}  // namespace layoutprep
