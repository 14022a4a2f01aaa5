#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace layoutprep {

// Normal variates bit-compatible with the legacy Mersenne Twister + polar
// Box-Muller generator of the common numerical Python stack, so synthetic
// vectors are identical across implementations.
class LegacyNormalGenerator {
 public:
  explicit LegacyNormalGenerator(std::uint32_t seed) : engine_(seed) {}

  double NextDouble();
  double NextGaussian();
  double Normal(double mean, double stddev) { return mean + stddev * NextGaussian(); }

 private:
  std::mt19937 engine_;
  bool has_cached_ = false;
  double cached_ = 0.0;
};

// Pretrained word vectors from a gzip text file ("word v1 ... vN"). The width
// is read eagerly from the first line; the vectors themselves on first lookup.
class GloveVectors {
 public:
  explicit GloveVectors(std::string path);

  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::size_t Dimensions() const { return dimensions_; }
  // Dimensions() plus the leading found/synthesized marker.
  [[nodiscard]] std::size_t DimensionsWithMarker() const { return dimensions_ + 1; }
  [[nodiscard]] std::size_t VocabSize() const;
  [[nodiscard]] float StdDev() const;

  [[nodiscard]] std::optional<std::span<const float>> GetVector(std::string_view word) const;

  // The stored vector behind a +0.5 marker, or a vector drawn deterministically
  // from the normalized word behind a -0.5 marker.
  [[nodiscard]] std::vector<float> GetVectorOrRandom(std::string_view word) const;

 private:
  void EnsureLoaded() const;

  std::string path_;
  std::size_t dimensions_ = 0;
  mutable bool loaded_ = false;
  mutable std::vector<float> vectors_;
  mutable std::unordered_map<std::string, std::size_t> word2index_;
  mutable float stddev_ = 0.0f;
};

// Seed for the synthetic vector of a word: its signed MurmurHash3 taken
// modulo 2^31 - 1 into the non-negative range.
[[nodiscard]] std::uint32_t OovSeed(std::string_view normalized_word);

}  // namespace layoutprep
