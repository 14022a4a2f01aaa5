#include "layoutprep/featurizer.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <vector>

#include "layoutprep/hash.hpp"
#include "layoutprep/labeler.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/metadata.hpp"
#include "layoutprep/percentile.hpp"
#include "layoutprep/text.hpp"
#include "layoutprep/token_store.hpp"
#include "layoutprep/vision.hpp"

namespace layoutprep {

namespace {

float ScaleToUnit(float value, float extent) {
  if (extent <= 0.0f) {
    return 0.0f;
  }
  return std::clamp(value / extent, 0.0f, 1.0f);
}

void ScaleDocument(const DocMetadata& doc, std::span<const float> numeric, const TokenStatistics& token_stats,
                   const VisionOutput& vision, std::vector<float>& scaled) {
  const auto doc_first = static_cast<std::size_t>(doc.FirstTokenIndex());
  const auto doc_count = static_cast<std::size_t>(doc.TokenCount());

  std::vector<float> doc_font_sizes;
  std::vector<float> doc_space_widths;
  doc_font_sizes.reserve(doc_count);
  doc_space_widths.reserve(doc_count);
  for (std::size_t t = doc_first; t < doc_first + doc_count; ++t) {
    doc_font_sizes.push_back(numeric[t * kTokenNumericFeatureCount + 4]);
    doc_space_widths.push_back(numeric[t * kTokenNumericFeatureCount + 5]);
  }
  const auto doc_font_percentile = PercentileFunction::FromValues(doc_font_sizes);
  const auto doc_space_percentile = PercentileFunction::FromValues(doc_space_widths);

  for (std::size_t page_number = 0; page_number < doc.pages.size(); ++page_number) {
    const auto& page = doc.pages[page_number];
    std::span<const BoundingBox> detections;
    if (vision.size() > 0) {
      detections = vision.BoxesForShaAndPage(doc.doc_sha, page_number);
    }

    const auto first = static_cast<std::size_t>(page.first_token_index);
    const auto count = static_cast<std::size_t>(page.token_count);
    for (std::size_t t = first; t < first + count; ++t) {
      const float* in = numeric.data() + t * kTokenNumericFeatureCount;
      float* out = scaled.data() + t * kScaledNumericFeatureCount;

      out[kScaledBoxOffset + 0] = ScaleToUnit(in[0], page.width);
      out[kScaledBoxOffset + 1] = ScaleToUnit(in[1], page.width);
      out[kScaledBoxOffset + 2] = ScaleToUnit(in[2], page.height);
      out[kScaledBoxOffset + 3] = ScaleToUnit(in[3], page.height);

      out[kScaledCorpusPercentileOffset + 0] = token_stats.FontSizePercentile(in[4]);
      out[kScaledCorpusPercentileOffset + 1] = token_stats.SpaceWidthPercentile(in[5]);
      out[kScaledDocumentPercentileOffset + 0] = doc_font_percentile(in[4]);
      out[kScaledDocumentPercentileOffset + 1] = doc_space_percentile(in[5]);

      if (!detections.empty()) {
        BoundingBox token_box;
        token_box.left = in[0];
        token_box.right = in[1];
        token_box.top = in[2];
        token_box.bottom = in[3];
        auto flags = VisionOverlapFlags(token_box, detections);
        out[kScaledVisionTitleOffset] = flags.title ? 1.0f : 0.0f;
        out[kScaledVisionAuthorOffset] = flags.author ? 1.0f : 0.0f;
      }
    }
  }
}

}  // namespace

std::uint32_t FeaturizingKey(const ModelSettings& settings) {
  const auto glove_name = std::filesystem::path(settings.glove_vectors).filename().string();
  std::string components = "max_page_number=" + std::to_string(settings.max_page_number) +
                           ";font_hash_size=" + std::to_string(settings.font_hash_size) +
                           ";minimum_token_frequency=" + std::to_string(settings.minimum_token_frequency) +
                           ";glove_vectors=" + std::to_string(Murmur3Hash32(glove_name));
  return Murmur3Hash32(components);
}

std::string FeaturizingKeyHex(const ModelSettings& settings) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(FeaturizingKey(settings)));
  return buf;
}

std::filesystem::path FeaturizedTokensPath(const std::filesystem::path& bucket_dir, const ModelSettings& settings) {
  return bucket_dir /
         ("featurized-tokens-" + FeaturizingKeyHex(settings) + "-" + std::string(kFeaturizedTokensVersion) + ".lpa");
}

std::uint32_t FontHash(std::string_view font, std::size_t font_hash_size) {
  if (font_hash_size == 0) {
    throw std::invalid_argument("font hash size must be positive");
  }
  return static_cast<std::uint32_t>(Murmur3Hash32(Normalize(font)) % font_hash_size) + 1;
}

std::shared_ptr<const Artifact> FeaturizedTokensFile(const std::filesystem::path& bucket_dir,
                                                     const CorpusLayout& layout, const TokenStatistics& token_stats,
                                                     const CombinedEmbeddings& embeddings,
                                                     const ModelSettings& settings) {
  const auto path = FeaturizedTokensPath(bucket_dir, settings);
  if (std::filesystem::exists(path)) {
    return Artifact::Open(path);
  }

  auto labeled = LabeledTokensFile(bucket_dir, layout);
  const auto vision = VisionOutput::Load(bucket_dir / layout.vision_output);
  return OpenOrBuildArtifact(path, [&](ArtifactWriter& writer) {
    writer.SetAttribute("stage", "featurized-tokens");
    writer.SetAttribute("version", std::string(kFeaturizedTokensVersion));
    writer.SetAttribute("featurizing_key", FeaturizingKeyHex(settings));
    writer.SetAttribute("max_page_number", std::to_string(settings.max_page_number));
    writer.SetAttribute("font_hash_size", std::to_string(settings.font_hash_size));
    writer.SetAttribute("minimum_token_frequency", std::to_string(settings.minimum_token_frequency));
    writer.SetAttribute("glove_vectors", std::filesystem::path(settings.glove_vectors).filename().string());

    // No pages are added or removed, so these stay in the labeled artifact.
    for (const auto& name : {kDocMetadataDataset, kTokenLabelsDataset, kTokenTextFeaturesDataset,
                             kTokenNumericFeaturesDataset}) {
      writer.LinkDataset(name, labeled->path());
    }
    writer.CreateDataset(kTokenHashedTextFeaturesDataset, DType::kUInt32, kHashedTextFeatureCount);
    writer.CreateDataset(kTokenScaledNumericFeaturesDataset, DType::kFloat32, kScaledNumericFeatureCount);

    auto metadata = labeled->Strings(kDocMetadataDataset);
    auto text = labeled->Strings(kTokenTextFeaturesDataset);
    auto numeric = labeled->Values<float>(kTokenNumericFeaturesDataset);
    const std::size_t token_count = labeled->Rows(kTokenTextFeaturesDataset);

    // Vocabulary index and font hash per token.
    std::vector<std::uint32_t> hashed;
    hashed.reserve(token_count * kHashedTextFeatureCount);
    for (std::size_t t = 0; t < token_count; ++t) {
      hashed.push_back(embeddings.IndexForToken(text[t * kTokenTextFeatureCount]));
      hashed.push_back(FontHash(text[t * kTokenTextFeatureCount + 1], settings.font_hash_size));
    }
    writer.Append<std::uint32_t>(kTokenHashedTextFeaturesDataset, hashed);

    std::vector<float> scaled(token_count * kScaledNumericFeatureCount, 0.0f);
    for (std::size_t t = 0; t < token_count; ++t) {
      auto caps = CapitalizationFeatures(text[t * kTokenTextFeatureCount]);
      std::copy(caps.begin(), caps.end(),
                scaled.begin() + static_cast<std::ptrdiff_t>(t * kScaledNumericFeatureCount +
                                                             kScaledCapitalizationOffset));
    }
    for (const auto& raw_metadata : metadata) {
      ScaleDocument(ParseDocMetadata(raw_metadata), numeric, token_stats, vision, scaled);
    }

    // Center everything on zero.
    for (float& v : scaled) {
      v -= 0.5f;
    }
    writer.Append<float>(kTokenScaledNumericFeaturesDataset, scaled);
    LogInfo("featurized " + std::to_string(metadata.size()) + " documents, " + std::to_string(token_count) +
            " tokens in " + bucket_dir.string());
  });
}

}  // namespace layoutprep
