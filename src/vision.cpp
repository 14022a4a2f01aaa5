#include "layoutprep/vision.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "layoutprep/corpus_reader.hpp"
#include "layoutprep/log.hpp"

namespace layoutprep {

VisionOutput VisionOutput::Load(const std::filesystem::path& path) {
  VisionOutput out;
  out.source_ = path.string();
  if (!std::filesystem::exists(path)) {
    LogInfo("no vision output at " + out.source_);
    return out;
  }

  CorpusReader reader;
  bool ok = reader.ForEachJsonRecord(out.source_, [&](const nlohmann::json& line) {
    try {
      auto sha = line.at("docSha").get<std::string>();
      std::vector<std::vector<BoundingBox>> pages;
      for (const auto& json_page : line.at("pages")) {
        std::vector<BoundingBox> boxes;
        for (const auto& b : json_page) {
          BoundingBox box;
          box.label = b.at(0).get<std::string>();
          box.left = b.at(1).get<float>();
          box.top = b.at(2).get<float>();
          box.right = b.at(3).get<float>();
          box.bottom = b.at(4).get<float>();
          box.confidence = b.at(5).get<float>();
          boxes.push_back(std::move(box));
        }
        pages.push_back(std::move(boxes));
      }
      out.Add(sha, std::move(pages));
    } catch (const nlohmann::json::exception& e) {
      LogWarning("skipping malformed vision output line in " + out.source_ + ": " + e.what());
    }
  });
  if (!ok) {
    throw std::runtime_error("failed to read vision output: " + out.source_);
  }
  return out;
}

void VisionOutput::Add(const std::string& sha, std::vector<std::vector<BoundingBox>> pages) {
  if (boxes_.count(sha) != 0) {
    LogWarning("Duplicate sha " + sha + " in " + source_);
  }
  boxes_[sha] = std::move(pages);
}

std::span<const BoundingBox> VisionOutput::BoxesForShaAndPage(const std::string& sha, std::size_t page) const {
  auto it = boxes_.find(sha);
  if (it == boxes_.end()) {
    LogWarning("Missing vision output for " + sha);
    return {};
  }
  if (page >= it->second.size()) {
    return {};
  }
  return it->second[page];
}

std::size_t VisionOutput::PagesForSha(const std::string& sha) const {
  auto it = boxes_.find(sha);
  return it == boxes_.end() ? 0 : it->second.size();
}

float IntersectionOverTokenArea(const BoundingBox& token, const BoundingBox& detection) {
  const float area = (token.right - token.left) * (token.bottom - token.top);
  if (area == 0.0f) {
    return 0.0f;
  }
  const float top = std::max(token.top, detection.top);
  const float bottom = std::min(token.bottom, detection.bottom);
  const float left = std::max(token.left, detection.left);
  const float right = std::min(token.right, detection.right);
  const float tb = bottom - top;
  const float lr = right - left;
  const float intersection = (tb < 0.0f || lr < 0.0f) ? 0.0f : tb * lr;
  return intersection / area;
}

OverlapFlags VisionOverlapFlags(const BoundingBox& token, std::span<const BoundingBox> detections) {
  float best_title = 0.0f;
  float best_author = 0.0f;
  for (const auto& detection : detections) {
    if (detection.label == "title") {
      best_title = std::max(best_title, IntersectionOverTokenArea(token, detection));
    } else if (detection.label == "author") {
      best_author = std::max(best_author, IntersectionOverTokenArea(token, detection));
    }
  }

  OverlapFlags flags;
  flags.title = best_title > 0.1f && best_title >= best_author;
  flags.author = best_author > 0.1f && best_author > best_title;
  return flags;
}

}  // namespace layoutprep
