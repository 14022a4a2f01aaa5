#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "layoutprep/percentile.hpp"

namespace layoutprep {

// Corpus-wide token frequencies and font-size / space-width histograms, read
// from a gzip TSV file on first use. Not safe for concurrent first use.
class TokenStatistics {
 public:
  explicit TokenStatistics(std::string path);

  [[nodiscard]] const std::string& path() const { return path_; }

  [[nodiscard]] float FontSizePercentile(float font_size) const;
  [[nodiscard]] std::vector<float> FontSizePercentiles(std::span<const float> font_sizes) const;
  [[nodiscard]] float SpaceWidthPercentile(float space_width) const;
  [[nodiscard]] std::vector<float> SpaceWidthPercentiles(std::span<const float> space_widths) const;

  // Normalized tokens with count >= min_freq, most frequent first.
  [[nodiscard]] std::vector<std::string> TokensWithMinimumFrequency(std::uint64_t min_freq) const;

  // All normalized tokens with their summed counts, most frequent first.
  [[nodiscard]] const std::vector<std::pair<std::string, std::uint64_t>>& Tokens() const;

 private:
  void EnsureLoaded() const;

  std::string path_;
  mutable bool loaded_ = false;
  mutable std::vector<std::pair<std::string, std::uint64_t>> tokens_;
  mutable PercentileFunction font_size_percentile_;
  mutable PercentileFunction space_width_percentile_;
};

}  // namespace layoutprep
