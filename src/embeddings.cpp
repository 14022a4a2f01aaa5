#include "layoutprep/embeddings.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <unordered_set>

#include "layoutprep/log.hpp"
#include "layoutprep/text.hpp"

namespace layoutprep {

CombinedEmbeddings::CombinedEmbeddings(const TokenStatistics& token_stats, const GloveVectors& glove,
                                       std::uint64_t min_token_freq)
    : token_stats_(token_stats), glove_(glove), min_token_freq_(min_token_freq) {}

void CombinedEmbeddings::EnsureLoaded() const {
  if (loaded_) {
    return;
  }

  std::unordered_map<std::string, std::uint32_t> token2index;
  std::uint32_t next_index = 2;
  for (auto& token : token_stats_.TokensWithMinimumFrequency(min_token_freq_)) {
    if (!token2index.emplace(std::move(token), next_index).second) {
      throw std::runtime_error("duplicate vocabulary token in " + token_stats_.path());
    }
    ++next_index;
  }
  if (!token2index.emplace(std::string(kOov), kOovIndex).second) {
    throw std::runtime_error("vocabulary collides with the OOV token");
  }

  std::unordered_set<std::uint32_t> indices;
  for (const auto& kv : token2index) {
    if (kv.second == 0 || !indices.insert(kv.second).second) {
      throw std::logic_error("vocabulary index assignment is not unique");
    }
  }

  const std::size_t dims = glove_.DimensionsWithMarker();
  const std::size_t rows = token2index.size() + 1;
  std::vector<float> matrix(rows * dims, 0.0f);
  std::size_t pretrained = 0;
  for (const auto& [token, index] : token2index) {
    auto vector = glove_.GetVectorOrRandom(token);
    std::copy(vector.begin(), vector.end(), matrix.begin() + static_cast<std::ptrdiff_t>(index * dims));
    if (index >= 2 && vector[0] > 0.0f) {
      ++pretrained;
    }
  }

  token2index_ = std::move(token2index);
  matrix_ = std::move(matrix);
  rows_ = rows;
  pretrained_count_ = pretrained;
  loaded_ = true;

  const std::size_t vocab = rows_ - 2;
  char pct[32];
  std::snprintf(pct, sizeof(pct), "%.2f", vocab == 0 ? 0.0 : 100.0 * pretrained / vocab);
  LogInfo(std::to_string(vocab) + " words in vocab, " + std::to_string(pretrained) + " of them from " +
          glove_.path() + " (" + pct + "%)");
}

std::uint32_t CombinedEmbeddings::IndexForToken(std::string_view token) const {
  EnsureLoaded();
  auto it = token2index_.find(Normalize(token));
  return it == token2index_.end() ? kOovIndex : it->second;
}

std::size_t CombinedEmbeddings::Dimensions() const { return glove_.DimensionsWithMarker(); }

std::size_t CombinedEmbeddings::VocabSize() const {
  EnsureLoaded();
  return rows_ - 1;
}

std::size_t CombinedEmbeddings::PretrainedCount() const {
  EnsureLoaded();
  return pretrained_count_;
}

const std::vector<float>& CombinedEmbeddings::Matrix() const {
  EnsureLoaded();
  return matrix_;
}

}  // namespace layoutprep
