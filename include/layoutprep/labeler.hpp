#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "layoutprep/artifact.hpp"
#include "layoutprep/metadata.hpp"
#include "layoutprep/settings.hpp"

namespace layoutprep {

constexpr std::string_view kLabeledTokensVersion = "12";

inline const std::string kTokenLabelsDataset = "token_labels";  // int8 x 1

enum class TokenLabel : std::int8_t {
  kNone = 0,
  kTitle = 1,
  kAuthor = 2
};

// Ground truth for one document, taken from its JATS reference metadata.
struct GoldMetadata {
  std::string title;
  std::vector<Author> authors;
};

// std::nullopt (with a warning naming doc_id) when the metadata cannot be
// trusted: no unique title, a title of four characters or less, no authors,
// or an author without a surname.
[[nodiscard]] std::optional<GoldMetadata> ParseGoldMetadata(const std::string& xml, const std::string& doc_id);

// Reads and parses `nxml_path`. A missing or unparseable file yields std::nullopt.
[[nodiscard]] std::optional<GoldMetadata> ReadGoldMetadata(const std::filesystem::path& nxml_path,
                                                           const std::string& doc_id);

// "<bucket>/<docs_dir>/<doc_id>" with a trailing ".pdf" replaced by ".nxml".
[[nodiscard]] std::filesystem::path ReferenceMetadataPath(const std::filesystem::path& bucket_dir,
                                                          const CorpusLayout& layout, const std::string& doc_id);

// Surface forms under which an author may be printed: full name, initials with
// and without periods or spaces, surname first, single initial.
[[nodiscard]] std::vector<std::string> AuthorVariants(const Author& author);

struct FuzzyMatch {
  std::size_t page_number = 0;
  std::size_t first_token_index = 0;
  std::size_t one_past_last_token_index = 0;
  std::size_t cost = 0;
  std::string matched_string;
  float average_font_size = 0.0f;
};

// Normalized text of one page, tokens joined by single spaces, with enough
// bookkeeping to map character spans back to token spans.
class PageText {
 public:
  PageText(std::size_t page_number, std::vector<std::string> tokens, std::vector<float> font_sizes);

  // All matches of `query` whose cost stays within (length - spaces) / 5,
  // scanning left to right. Each match resumes the scan where the previous one ended.
  [[nodiscard]] std::vector<FuzzyMatch> FindAll(std::string_view query) const;

  [[nodiscard]] std::size_t page_number() const { return page_number_; }
  [[nodiscard]] std::size_t token_count() const { return tokens_.size(); }
  [[nodiscard]] const std::u32string& text() const { return text_; }

 private:
  FuzzyMatch MakeMatch(std::size_t start, std::size_t end, std::size_t cost) const;

  std::size_t page_number_;
  std::vector<std::string> tokens_;
  std::vector<float> font_sizes_;
  std::u32string text_;
  std::vector<std::size_t> token_starts_;
};

struct DocumentMatches {
  FuzzyMatch title;
  std::vector<FuzzyMatch> authors;  // parallel to GoldMetadata::authors
};

// Resolves the title across all pages and every author on the smallest page
// where all of them occur. std::nullopt (with a warning) when anything is missing.
[[nodiscard]] std::optional<DocumentMatches> LocateGoldMetadata(const GoldMetadata& gold,
                                                                const std::vector<PageText>& pages,
                                                                const std::string& doc_id);

// Labels for one page: the title span first, then author spans, so authors
// take precedence where they overlap.
[[nodiscard]] std::vector<std::int8_t> PageLabels(const DocumentMatches& matches, std::size_t page_number,
                                                  std::size_t token_count, const std::string& doc_id);

[[nodiscard]] std::filesystem::path LabeledTokensPath(const std::filesystem::path& bucket_dir);

// Builds (or opens) the labeled artifact: only documents whose gold title and
// authors were all located, with one label per token.
std::shared_ptr<const Artifact> LabeledTokensFile(const std::filesystem::path& bucket_dir,
                                                  const CorpusLayout& layout);

}  // namespace layoutprep
