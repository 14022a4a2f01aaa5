#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace layoutprep {

constexpr int kDocMetadataSchemaVersion = 1;

struct Author {
  std::string given_names;
  std::string surname;

  bool operator==(const Author& other) const = default;
};

struct PageMetadata {
  float width = 0.0f;
  float height = 0.0f;
  std::uint64_t first_token_index = 0;
  std::uint64_t token_count = 0;
};

// Per-document record stored as one JSON string in the `doc_metadata` dataset
// of every stage artifact.
struct DocMetadata {
  std::string doc_id;
  std::string doc_sha;
  std::optional<std::string> gold_title;
  std::vector<Author> gold_authors;
  std::vector<PageMetadata> pages;

  [[nodiscard]] std::uint64_t FirstTokenIndex() const;
  [[nodiscard]] std::uint64_t TokenCount() const;
};

[[nodiscard]] std::string SerializeDocMetadata(const DocMetadata& doc);

// Throws std::runtime_error on malformed JSON or an unknown schema version.
[[nodiscard]] DocMetadata ParseDocMetadata(const std::string& text);

}  // namespace layoutprep
