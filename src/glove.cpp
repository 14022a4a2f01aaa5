#include "layoutprep/glove.hpp"

#include <charconv>
#include <cmath>
#include <memory>
#include <stdexcept>

#include <zlib.h>

#include "layoutprep/corpus_reader.hpp"
#include "layoutprep/hash.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/text.hpp"

namespace layoutprep {

namespace {

std::vector<std::string_view> SplitFields(std::string_view line, char sep) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    auto pos = line.find(sep, start);
    if (pos == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

std::size_t CountWhitespaceFields(std::string_view line) {
  std::size_t count = 0;
  bool in_field = false;
  for (char c : line) {
    bool space = c == ' ' || c == '\t' || c == '\r' || c == '\n';
    if (!space && !in_field) {
      ++count;
    }
    in_field = !space;
  }
  return count;
}

}  // namespace

double LegacyNormalGenerator::NextDouble() {
  std::uint32_t a = static_cast<std::uint32_t>(engine_()) >> 5;
  std::uint32_t b = static_cast<std::uint32_t>(engine_()) >> 6;
  return (a * 67108864.0 + b) / 9007199254740992.0;
}

double LegacyNormalGenerator::NextGaussian() {
  if (has_cached_) {
    has_cached_ = false;
    return cached_;
  }
  double x1 = 0.0;
  double x2 = 0.0;
  double r2 = 0.0;
  do {
    x1 = 2.0 * NextDouble() - 1.0;
    x2 = 2.0 * NextDouble() - 1.0;
    r2 = x1 * x1 + x2 * x2;
  } while (r2 >= 1.0 || r2 == 0.0);
  double f = std::sqrt(-2.0 * std::log(r2) / r2);
  cached_ = f * x1;
  has_cached_ = true;
  return f * x2;
}

std::uint32_t OovSeed(std::string_view normalized_word) {
  constexpr std::int64_t kModulus = 2147483647;  // 2^31 - 1
  std::int64_t h = Murmur3Hash32Signed(normalized_word);
  std::int64_t seed = h % kModulus;
  if (seed < 0) {
    seed += kModulus;
  }
  return static_cast<std::uint32_t>(seed);
}

GloveVectors::GloveVectors(std::string path) : path_(std::move(path)) {
  // gzread passes uncompressed files through unchanged.
  std::unique_ptr<gzFile_s, decltype(&gzclose)> handle(gzopen(path_.c_str(), "rb"), &gzclose);
  if (!handle) {
    throw std::runtime_error("failed to open vectors: " + path_);
  }
  std::string first_line;
  char buf[1 << 12];
  while (first_line.empty() || first_line.back() != '\n') {
    char* res = gzgets(handle.get(), buf, sizeof(buf));
    if (!res) {
      break;
    }
    first_line.append(res);
  }
  std::size_t fields = CountWhitespaceFields(first_line);
  if (fields < 2) {
    throw std::runtime_error("failed to read vector dimensions from " + path_);
  }
  dimensions_ = fields - 1;
}

void GloveVectors::EnsureLoaded() const {
  if (loaded_) {
    return;
  }

  std::vector<float> vectors;
  std::unordered_map<std::string, std::size_t> word2index;
  std::uint64_t line_number = 0;
  CorpusReader reader;
  bool ok = reader.ForEachLine(path_, [&](const std::string& raw) {
    std::string_view line = raw;
    auto fields = SplitFields(line, ' ');
    auto word = Normalize(fields[0]);
    if (fields.size() != dimensions_ + 1) {
      throw std::runtime_error("Error while loading line for '" + word + "' at " + path_ + ":" +
                               std::to_string(line_number) + ": expected " + std::to_string(dimensions_) +
                               " values, got " + std::to_string(fields.size() - 1));
    }
    std::size_t row = vectors.size() / dimensions_;
    for (std::size_t i = 1; i < fields.size(); ++i) {
      float value = 0.0f;
      auto [ptr, ec] = std::from_chars(fields[i].data(), fields[i].data() + fields[i].size(), value);
      if (ec != std::errc() || ptr != fields[i].data() + fields[i].size()) {
        throw std::runtime_error("Error while loading line for '" + word + "' at " + path_ + ":" +
                                 std::to_string(line_number) + ": bad value '" + std::string(fields[i]) + "'");
      }
      vectors.push_back(value);
    }
    word2index[std::move(word)] = row;
    ++line_number;
  });
  if (!ok) {
    throw std::runtime_error("failed to read vectors: " + path_);
  }

  double sum = 0.0;
  for (float v : vectors) {
    sum += v;
  }
  double mean = vectors.empty() ? 0.0 : sum / static_cast<double>(vectors.size());
  double sq = 0.0;
  for (float v : vectors) {
    double d = v - mean;
    sq += d * d;
  }

  stddev_ = vectors.empty() ? 0.0f : static_cast<float>(std::sqrt(sq / static_cast<double>(vectors.size())));
  vectors_ = std::move(vectors);
  word2index_ = std::move(word2index);
  loaded_ = true;
  LogInfo("loaded " + std::to_string(VocabSize()) + " vectors of width " + std::to_string(dimensions_) + " from " +
          path_);
}

std::size_t GloveVectors::VocabSize() const {
  EnsureLoaded();
  return vectors_.size() / dimensions_;
}

float GloveVectors::StdDev() const {
  EnsureLoaded();
  return stddev_;
}

std::optional<std::span<const float>> GloveVectors::GetVector(std::string_view word) const {
  EnsureLoaded();
  auto it = word2index_.find(Normalize(word));
  if (it == word2index_.end()) {
    return std::nullopt;
  }
  return std::span<const float>(vectors_.data() + it->second * dimensions_, dimensions_);
}

std::vector<float> GloveVectors::GetVectorOrRandom(std::string_view word) const {
  std::vector<float> out;
  out.reserve(DimensionsWithMarker());
  if (auto vector = GetVector(word)) {
    out.push_back(0.5f);
    out.insert(out.end(), vector->begin(), vector->end());
    return out;
  }

  LegacyNormalGenerator rng(OovSeed(Normalize(word)));
  for (std::size_t i = 0; i < DimensionsWithMarker(); ++i) {
    out.push_back(static_cast<float>(rng.Normal(0.0, stddev_)));
  }
  out[0] = -0.5f;
  return out;
}

}  // namespace layoutprep
