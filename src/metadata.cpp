#include "layoutprep/metadata.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

namespace layoutprep {

std::uint64_t DocMetadata::FirstTokenIndex() const { return pages.empty() ? 0 : pages.front().first_token_index; }

std::uint64_t DocMetadata::TokenCount() const {
  std::uint64_t total = 0;
  for (const auto& page : pages) {
    total += page.token_count;
  }
  return total;
}

std::string SerializeDocMetadata(const DocMetadata& doc) {
  nlohmann::json j;
  j["schema_version"] = kDocMetadataSchemaVersion;
  j["doc_id"] = doc.doc_id;
  j["doc_sha"] = doc.doc_sha;
  if (doc.gold_title) {
    j["gold_title"] = *doc.gold_title;
    nlohmann::json authors = nlohmann::json::array();
    for (const auto& author : doc.gold_authors) {
      authors.push_back({author.given_names, author.surname});
    }
    j["gold_authors"] = std::move(authors);
  }

  nlohmann::json pages = nlohmann::json::array();
  for (const auto& page : doc.pages) {
    pages.push_back({
        {"width", page.width},
        {"height", page.height},
        {"first_token_index", page.first_token_index},
        {"token_count", page.token_count},
    });
  }
  j["pages"] = std::move(pages);
  return j.dump();
}

DocMetadata ParseDocMetadata(const std::string& text) {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw std::runtime_error("document metadata is not a JSON object");
  }

  DocMetadata doc;
  try {
    int version = j.at("schema_version").get<int>();
    if (version != kDocMetadataSchemaVersion) {
      throw std::runtime_error("unsupported document metadata schema version " + std::to_string(version));
    }
    doc.doc_id = j.at("doc_id").get<std::string>();
    doc.doc_sha = j.at("doc_sha").get<std::string>();
    if (j.contains("gold_title")) {
      doc.gold_title = j.at("gold_title").get<std::string>();
    }
    if (j.contains("gold_authors")) {
      for (const auto& a : j.at("gold_authors")) {
        doc.gold_authors.push_back({a.at(0).get<std::string>(), a.at(1).get<std::string>()});
      }
    }
    for (const auto& p : j.at("pages")) {
      PageMetadata page;
      page.width = p.at("width").get<float>();
      page.height = p.at("height").get<float>();
      page.first_token_index = p.at("first_token_index").get<std::uint64_t>();
      page.token_count = p.at("token_count").get<std::uint64_t>();
      doc.pages.push_back(page);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("unexpected document metadata schema: ") + e.what());
  }
  return doc;
}

}  // namespace layoutprep
