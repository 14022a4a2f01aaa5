#include "layoutprep/percentile.hpp"

#include <algorithm>
#include <stdexcept>

namespace layoutprep {

PercentileFunction::PercentileFunction(std::vector<float> values, const std::vector<double>& counts)
    : values_(std::move(values)) {
  if (values_.size() != counts.size()) {
    throw std::invalid_argument("percentile values and counts differ in length");
  }
  if (!std::is_sorted(values_.begin(), values_.end())) {
    throw std::invalid_argument("percentile values must be sorted");
  }

  double total = 0.0;
  for (double c : counts) {
    total += c;
  }
  cumulative_.reserve(values_.size() + 1);
  cumulative_.push_back(0.0f);
  double running = 0.0;
  for (double c : counts) {
    running += c;
    cumulative_.push_back(total > 0.0 ? static_cast<float>(running / total) : 0.0f);
  }
}

PercentileFunction PercentileFunction::FromCounts(std::vector<std::pair<float, double>> value_counts) {
  std::sort(value_counts.begin(), value_counts.end());
  std::vector<float> values;
  std::vector<double> counts;
  values.reserve(value_counts.size());
  counts.reserve(value_counts.size());
  for (const auto& [value, count] : value_counts) {
    if (!values.empty() && values.back() == value) {
      counts.back() += count;
      continue;
    }
    values.push_back(value);
    counts.push_back(count);
  }
  return PercentileFunction(std::move(values), counts);
}

PercentileFunction PercentileFunction::FromValues(std::span<const float> values) {
  std::vector<float> sorted(values.begin(), values.end());
  std::sort(sorted.begin(), sorted.end());
  std::vector<float> unique;
  std::vector<double> counts;
  for (float v : sorted) {
    if (!unique.empty() && unique.back() == v) {
      counts.back() += 1.0;
    } else {
      unique.push_back(v);
      counts.push_back(1.0);
    }
  }
  return PercentileFunction(std::move(unique), counts);
}

float PercentileFunction::operator()(float value) const {
  if (values_.empty()) {
    return 0.0f;
  }
  // Position in [-inf, values_...] of the first entry >= value, clipped to [1, n].
  auto it = std::lower_bound(values_.begin(), values_.end(), value);
  std::size_t index = static_cast<std::size_t>(it - values_.begin()) + 1;
  index = std::clamp<std::size_t>(index, 1, values_.size());
  return (cumulative_[index] + cumulative_[index - 1]) / 2.0f;
}

void PercentileFunction::Apply(std::span<const float> values, std::span<float> out) const {
  if (values.size() != out.size()) {
    throw std::invalid_argument("percentile output size mismatch");
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    out[i] = (*this)(values[i]);
  }
}

std::vector<float> PercentileFunction::Apply(std::span<const float> values) const {
  std::vector<float> out(values.size());
  Apply(values, out);
  return out;
}

}  // namespace layoutprep
