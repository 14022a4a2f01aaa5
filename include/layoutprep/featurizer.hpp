#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "layoutprep/artifact.hpp"
#include "layoutprep/embeddings.hpp"
#include "layoutprep/settings.hpp"
#include "layoutprep/token_stats.hpp"

namespace layoutprep {

constexpr std::string_view kFeaturizedTokensVersion = "12";

inline const std::string kTokenHashedTextFeaturesDataset = "token_hashed_text_features";        // uint32 x 2
inline const std::string kTokenScaledNumericFeaturesDataset = "token_scaled_numeric_features";  // float32 x 17

constexpr std::size_t kHashedTextFeatureCount = 2;  // vocabulary index, font hash + 1
constexpr std::size_t kScaledNumericFeatureCount = 17;

// Column offsets inside token_scaled_numeric_features.
constexpr std::size_t kScaledBoxOffset = 0;                 // left, right, top, bottom
constexpr std::size_t kScaledCorpusPercentileOffset = 4;    // font size, space width
constexpr std::size_t kScaledDocumentPercentileOffset = 6;  // font size, space width
constexpr std::size_t kScaledCapitalizationOffset = 8;      // 7 values
constexpr std::size_t kScaledVisionTitleOffset = 15;
constexpr std::size_t kScaledVisionAuthorOffset = 16;

// Stable across processes: folds every setting that influences featurization,
// including the base name of the pretrained vector file.
[[nodiscard]] std::uint32_t FeaturizingKey(const ModelSettings& settings);
[[nodiscard]] std::string FeaturizingKeyHex(const ModelSettings& settings);

[[nodiscard]] std::filesystem::path FeaturizedTokensPath(const std::filesystem::path& bucket_dir,
                                                         const ModelSettings& settings);

// Hash of the normalized font name in [1, font_hash_size]; 0 is left for padding.
[[nodiscard]] std::uint32_t FontHash(std::string_view font, std::size_t font_hash_size);

// Builds (or opens) the featurized artifact of a bucket. Unchanged columns are
// links into the labeled artifact.
std::shared_ptr<const Artifact> FeaturizedTokensFile(const std::filesystem::path& bucket_dir,
                                                     const CorpusLayout& layout, const TokenStatistics& token_stats,
                                                     const CombinedEmbeddings& embeddings,
                                                     const ModelSettings& settings);

}  // namespace layoutprep
