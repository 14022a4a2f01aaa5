#include "layoutprep/pipeline.hpp"

#include <cstdio>

#include "layoutprep/featurizer.hpp"
#include "layoutprep/log.hpp"

namespace layoutprep {

namespace {

std::string ResolveInCorpus(const Config& config, const std::string& path) {
  std::filesystem::path p(path);
  if (p.is_absolute()) {
    return p.string();
  }
  return (std::filesystem::path(config.corpus_dir) / p).string();
}

}  // namespace

std::string BucketName(unsigned bucket) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02x", bucket & 0xffu);
  return buf;
}

Pipeline::Pipeline(Config config)
    : config_(std::move(config)),
      token_stats_(ResolveInCorpus(config_, config_.token_stats)),
      glove_(config_.model.glove_vectors),
      embeddings_(token_stats_, glove_, config_.model.minimum_token_frequency) {}

std::filesystem::path Pipeline::BucketPath(const std::string& bucket) const {
  return std::filesystem::path(config_.corpus_dir) / bucket;
}

std::shared_ptr<const Artifact> Pipeline::PrepareBucket(const std::string& bucket) const {
  return FeaturizedTokensFile(BucketPath(bucket), config_.layout, token_stats_, embeddings_, config_.model);
}

DocumentView Pipeline::DocumentsForBucket(const std::string& bucket) const {
  return DocumentView(PrepareBucket(bucket), config_.model.EffectivePageCount());
}

void Pipeline::ForEachDocument(BucketRange range, const std::function<void(const Document&)>& fn) const {
  for (unsigned b = range.first; b < range.one_past_last; ++b) {
    const auto bucket = BucketName(b);
    if (!std::filesystem::is_directory(BucketPath(bucket))) {
      LogWarning("bucket " + BucketPath(bucket).string() + " does not exist; skipping");
      continue;
    }
    DocumentsForBucket(bucket).ForEach(fn);
  }
}

}  // namespace layoutprep
