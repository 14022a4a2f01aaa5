#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "layoutprep/artifact.hpp"
#include "layoutprep/documents.hpp"
#include "layoutprep/embeddings.hpp"
#include "layoutprep/glove.hpp"
#include "layoutprep/settings.hpp"
#include "layoutprep/token_stats.hpp"

namespace layoutprep {

struct BucketRange {
  unsigned first = 0;
  unsigned one_past_last = 0;
};

constexpr BucketRange kTrainBuckets{0x00, 0xf0};
constexpr BucketRange kTestBuckets{0xf0, 0x100};

// Two lowercase hex digits.
[[nodiscard]] std::string BucketName(unsigned bucket);

// Owns the read-only services shared by every bucket of one corpus and drives
// the stages. Lazy loading inside the services is not synchronized; warm them
// up before sharing a pipeline between threads.
class Pipeline {
 public:
  explicit Pipeline(Config config);

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  [[nodiscard]] const Config& config() const { return config_; }
  [[nodiscard]] const TokenStatistics& token_stats() const { return token_stats_; }
  [[nodiscard]] const GloveVectors& glove() const { return glove_; }
  [[nodiscard]] const CombinedEmbeddings& embeddings() const { return embeddings_; }

  [[nodiscard]] std::filesystem::path BucketPath(const std::string& bucket) const;

  // Builds whatever artifacts of the bucket are missing and returns the featurized one.
  std::shared_ptr<const Artifact> PrepareBucket(const std::string& bucket) const;

  [[nodiscard]] DocumentView DocumentsForBucket(const std::string& bucket) const;

  // Buckets whose directory does not exist are skipped with a warning.
  void ForEachDocument(BucketRange range, const std::function<void(const Document&)>& fn) const;

 private:
  Config config_;
  TokenStatistics token_stats_;
  GloveVectors glove_;
  CombinedEmbeddings embeddings_;
};

}  // namespace layoutprep
