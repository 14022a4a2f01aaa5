#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "layoutprep/log.hpp"

namespace layoutprep {

// Upper bound on the pages any stage keeps per document.
constexpr std::size_t kMaxPageCount = 3;

// Everything that influences the featurized artifact. Changing any field moves
// the featurized cache to a new file name.
struct ModelSettings {
  std::size_t max_page_number = 3;
  std::size_t font_hash_size = 1024;
  std::size_t minimum_token_frequency = 10;
  std::string glove_vectors = "glove.6B.100d.txt.gz";

  [[nodiscard]] std::size_t EffectivePageCount() const {
    return max_page_number < kMaxPageCount ? max_page_number : kMaxPageCount;
  }
};

// File names inside one bucket directory.
struct CorpusLayout {
  std::string token_dump = "tokens.jsonl.gz";
  std::string docs_dir = "docs";
  std::string vision_output = "vision_output.json";
};

struct Config {
  std::string env_path = ".env";
  std::string corpus_dir = ".";
  std::string token_stats = "tokenstats.tsv.gz";
  ModelSettings model;
  CorpusLayout layout;
  LogLevel log_level = LogLevel::kInfo;
};

// KEY=value lines; '#' comments, surrounding quotes and a UTF-8 BOM are
// tolerated. A missing file yields an empty map.
[[nodiscard]] std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path);

void ApplyEnvOverrides(Config& cfg, const std::unordered_map<std::string, std::string>& env);

}  // namespace layoutprep
