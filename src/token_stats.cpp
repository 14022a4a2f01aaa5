#include "layoutprep/token_stats.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <unordered_map>

#include "layoutprep/corpus_reader.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/text.hpp"

namespace layoutprep {

namespace {

std::vector<std::string_view> SplitTabs(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    auto tab = line.find('\t', start);
    if (tab == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return fields;
}

bool ParseCount(std::string_view s, double& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

}  // namespace

TokenStatistics::TokenStatistics(std::string path) : path_(std::move(path)) {}

void TokenStatistics::EnsureLoaded() const {
  if (loaded_) {
    return;
  }

  std::unordered_map<std::string, std::size_t> token_index;
  std::vector<std::pair<std::string, std::uint64_t>> tokens;
  std::vector<std::pair<float, double>> font_sizes;
  std::vector<std::pair<float, double>> space_widths;

  std::uint64_t line_number = 0;
  CorpusReader reader;
  bool ok = reader.ForEachLine(path_, [&](const std::string& raw) {
    ++line_number;
    std::string_view line = raw;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      return;
    }
    auto fields = SplitTabs(line);
    double count = 0.0;
    if (fields.size() != 3 || !ParseCount(fields[2], count)) {
      throw std::runtime_error("malformed statistics line at " + path_ + ":" + std::to_string(line_number));
    }

    if (fields[0] == "token") {
      auto token = Normalize(fields[1]);
      auto it = token_index.find(token);
      if (it == token_index.end()) {
        token_index.emplace(token, tokens.size());
        tokens.emplace_back(std::move(token), static_cast<std::uint64_t>(count));
      } else {
        tokens[it->second].second += static_cast<std::uint64_t>(count);
      }
      return;
    }

    double value = 0.0;
    if (!ParseCount(fields[1], value)) {
      throw std::runtime_error("malformed statistics value at " + path_ + ":" + std::to_string(line_number));
    }
    if (fields[0] == "font_size") {
      font_sizes.emplace_back(static_cast<float>(value), count);
    } else if (fields[0] == "space_width") {
      space_widths.emplace_back(static_cast<float>(value), count);
    } else {
      LogWarning("unknown statistics record '" + std::string(fields[0]) + "' at " + path_ + ":" +
                 std::to_string(line_number));
    }
  });
  if (!ok) {
    throw std::runtime_error("failed to read token statistics: " + path_);
  }

  std::stable_sort(tokens.begin(), tokens.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });

  tokens_ = std::move(tokens);
  font_size_percentile_ = PercentileFunction::FromCounts(std::move(font_sizes));
  space_width_percentile_ = PercentileFunction::FromCounts(std::move(space_widths));
  loaded_ = true;
  LogInfo("loaded " + std::to_string(tokens_.size()) + " token counts from " + path_);
}

float TokenStatistics::FontSizePercentile(float font_size) const {
  EnsureLoaded();
  return font_size_percentile_(font_size);
}

std::vector<float> TokenStatistics::FontSizePercentiles(std::span<const float> font_sizes) const {
  EnsureLoaded();
  return font_size_percentile_.Apply(font_sizes);
}

float TokenStatistics::SpaceWidthPercentile(float space_width) const {
  EnsureLoaded();
  return space_width_percentile_(space_width);
}

std::vector<float> TokenStatistics::SpaceWidthPercentiles(std::span<const float> space_widths) const {
  EnsureLoaded();
  return space_width_percentile_.Apply(space_widths);
}

std::vector<std::string> TokenStatistics::TokensWithMinimumFrequency(std::uint64_t min_freq) const {
  EnsureLoaded();
  std::vector<std::string> out;
  for (const auto& [token, count] : tokens_) {
    if (count < min_freq) {
      break;
    }
    out.push_back(token);
  }
  return out;
}

const std::vector<std::pair<std::string, std::uint64_t>>& TokenStatistics::Tokens() const {
  EnsureLoaded();
  return tokens_;
}

}  // namespace layoutprep
