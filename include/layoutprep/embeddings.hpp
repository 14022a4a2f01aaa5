#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "layoutprep/glove.hpp"
#include "layoutprep/token_stats.hpp"

namespace layoutprep {

// Bounded vocabulary (corpus tokens at or above a minimum frequency) paired
// with pretrained or synthesized vectors. Index 0 is padding, index 1 the
// out-of-vocabulary sentinel, real tokens start at 2 in descending frequency.
class CombinedEmbeddings {
 public:
  // Must be something the tokenizer never produces.
  static constexpr std::string_view kOov = " ⚠ OOV ⚠ ";
  static constexpr std::uint32_t kOovIndex = 1;

  CombinedEmbeddings(const TokenStatistics& token_stats, const GloveVectors& glove,
                     std::uint64_t min_token_freq);

  // Never 0. Unknown tokens map to kOovIndex.
  [[nodiscard]] std::uint32_t IndexForToken(std::string_view token) const;

  // Width of each matrix row, including the marker column.
  [[nodiscard]] std::size_t Dimensions() const;
  // Number of rows excluding the padding row.
  [[nodiscard]] std::size_t VocabSize() const;
  // Vocabulary tokens (OOV sentinel excluded) that had a pretrained vector.
  [[nodiscard]] std::size_t PretrainedCount() const;

  // Row-major (VocabSize() + 1) x Dimensions(); row 0 is all zeros.
  [[nodiscard]] const std::vector<float>& Matrix() const;

  [[nodiscard]] std::uint64_t min_token_freq() const { return min_token_freq_; }

 private:
  void EnsureLoaded() const;

  const TokenStatistics& token_stats_;
  const GloveVectors& glove_;
  std::uint64_t min_token_freq_;

  mutable bool loaded_ = false;
  mutable std::unordered_map<std::string, std::uint32_t> token2index_;
  mutable std::vector<float> matrix_;
  mutable std::size_t rows_ = 0;
  mutable std::size_t pretrained_count_ = 0;
};

}  // namespace layoutprep
