#include "layoutprep/token_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "layoutprep/corpus_reader.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/metadata.hpp"
#include "layoutprep/text.hpp"

namespace layoutprep {

namespace {

float NumberField(const nlohmann::json& j, const char* key) {
  const auto& v = j.at(key);
  if (v.is_string()) {
    return std::stof(v.get<std::string>());
  }
  return v.get<float>();
}

void AppendDocument(ArtifactWriter& writer, const nlohmann::json& record) {
  auto raw_doc_id = record.at("docId").get<std::string>();
  auto identity = ExtractDocIdentity(raw_doc_id);
  if (!identity) {
    throw std::runtime_error("document id without a content hash: " + raw_doc_id);
  }

  DocMetadata doc;
  doc.doc_id = std::move(identity->doc_id);
  doc.doc_sha = std::move(identity->doc_sha);

  const auto& json_pages = record.at("pages");
  const std::size_t page_count = std::min(kMaxPageCount, json_pages.size());
  std::vector<std::string> text_features;
  std::vector<float> numeric_features;
  for (std::size_t p = 0; p < page_count; ++p) {
    const auto& json_page = json_pages.at(p);
    PageMetadata page;
    page.width = NumberField(json_page, "width");
    page.height = NumberField(json_page, "height");
    page.first_token_index = writer.Rows(kTokenTextFeaturesDataset);

    text_features.clear();
    numeric_features.clear();
    auto tokens = json_page.find("tokens");
    if (tokens != json_page.end()) {
      for (const auto& token : *tokens) {
        text_features.push_back(SanitizeNul(token.at("text").get<std::string>()));
        text_features.push_back(SanitizeNul(token.at("font").get<std::string>()));
        numeric_features.push_back(NumberField(token, "left"));
        numeric_features.push_back(NumberField(token, "right"));
        numeric_features.push_back(NumberField(token, "top"));
        numeric_features.push_back(NumberField(token, "bottom"));
        numeric_features.push_back(NumberField(token, "fontSize"));
        numeric_features.push_back(NumberField(token, "fontSpaceWidth"));
      }
    }
    page.token_count = text_features.size() / kTokenTextFeatureCount;

    writer.AppendStrings(kTokenTextFeaturesDataset, text_features);
    writer.Append<float>(kTokenNumericFeaturesDataset, numeric_features);
    doc.pages.push_back(page);
  }

  std::vector<std::string> metadata{SerializeDocMetadata(doc)};
  writer.AppendStrings(kDocMetadataDataset, metadata);
}

}  // namespace

bool IsSha1Hex(std::string_view s) {
  if (s.size() != 40) {
    return false;
  }
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

std::optional<DocIdentity> ExtractDocIdentity(std::string_view raw_doc_id) {
  std::size_t start = 0;
  while (start <= raw_doc_id.size()) {
    auto slash = raw_doc_id.find('/', start);
    auto end = slash == std::string_view::npos ? raw_doc_id.size() : slash;
    auto segment = raw_doc_id.substr(start, end - start);
    if (IsSha1Hex(segment)) {
      return DocIdentity{std::string(raw_doc_id.substr(start)), std::string(segment)};
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return std::nullopt;
}

std::filesystem::path UnlabeledTokensPath(const std::filesystem::path& bucket_dir) {
  return bucket_dir / ("unlabeled-tokens-" + std::string(kUnlabeledTokensVersion) + ".lpa");
}

std::shared_ptr<const Artifact> UnlabeledTokensFile(const std::filesystem::path& bucket_dir,
                                                    const CorpusLayout& layout) {
  return OpenOrBuildArtifact(UnlabeledTokensPath(bucket_dir), [&](ArtifactWriter& writer) {
    writer.SetAttribute("stage", "unlabeled-tokens");
    writer.SetAttribute("version", std::string(kUnlabeledTokensVersion));
    writer.CreateDataset(kDocMetadataDataset, DType::kString, 1);
    writer.CreateDataset(kTokenTextFeaturesDataset, DType::kString, kTokenTextFeatureCount);
    writer.CreateDataset(kTokenNumericFeaturesDataset, DType::kFloat32, kTokenNumericFeatureCount);

    const auto dump_path = (bucket_dir / layout.token_dump).string();
    CorpusReadStats stats;
    CorpusReader reader;
    bool ok = reader.ForEachJsonRecord(
        dump_path,
        [&](const nlohmann::json& record) {
          try {
            AppendDocument(writer, record);
          } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("unexpected record schema in " + dump_path + ": " + e.what());
          }
        },
        &stats);
    if (!ok) {
      throw std::runtime_error("failed to read corpus dump: " + dump_path);
    }
    LogInfo("read " + std::to_string(stats.records) + " documents from " + dump_path + " (" +
            std::to_string(stats.skipped) + " unparseable lines skipped)");
  });
}

}  // namespace layoutprep
