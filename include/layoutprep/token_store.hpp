#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "layoutprep/artifact.hpp"
#include "layoutprep/settings.hpp"

namespace layoutprep {

constexpr std::string_view kUnlabeledTokensVersion = "3";

// Dataset names shared by all stage artifacts.
inline const std::string kDocMetadataDataset = "doc_metadata";
inline const std::string kTokenTextFeaturesDataset = "token_text_features";        // string x 2
inline const std::string kTokenNumericFeaturesDataset = "token_numeric_features";  // float32 x 6

constexpr std::size_t kTokenTextFeatureCount = 2;     // text, font name
constexpr std::size_t kTokenNumericFeatureCount = 6;  // left, right, top, bottom, font size, space width

struct DocIdentity {
  std::string doc_id;
  std::string doc_sha;
};

[[nodiscard]] bool IsSha1Hex(std::string_view s);

// Keeps the '/'-separated suffix of `raw_doc_id` that starts at the first
// 40-hex segment. std::nullopt if there is no such segment.
[[nodiscard]] std::optional<DocIdentity> ExtractDocIdentity(std::string_view raw_doc_id);

[[nodiscard]] std::filesystem::path UnlabeledTokensPath(const std::filesystem::path& bucket_dir);

// Builds the unlabeled token artifact of a bucket from its corpus dump, or
// opens it if it already exists.
std::shared_ptr<const Artifact> UnlabeledTokensFile(const std::filesystem::path& bucket_dir,
                                                    const CorpusLayout& layout);

}  // namespace layoutprep
