#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace layoutprep {

struct BoundingBox {
  std::string label;
  float left = 0.0f;
  float right = 0.0f;
  float top = 0.0f;
  float bottom = 0.0f;
  float confidence = 0.0f;
};

// Title/author boxes produced by an external layout detector, keyed by
// document hash and page.
class VisionOutput {
 public:
  VisionOutput() = default;

  // A missing file yields an empty result. Unparseable lines are skipped.
  static VisionOutput Load(const std::filesystem::path& path);

  void Add(const std::string& sha, std::vector<std::vector<BoundingBox>> pages);

  // Empty for an unknown page; also empty, with a warning, for an unknown sha.
  [[nodiscard]] std::span<const BoundingBox> BoxesForShaAndPage(const std::string& sha, std::size_t page) const;
  [[nodiscard]] std::size_t PagesForSha(const std::string& sha) const;
  [[nodiscard]] std::size_t size() const { return boxes_.size(); }

 private:
  std::string source_;
  std::unordered_map<std::string, std::vector<std::vector<BoundingBox>>> boxes_;
};

// Intersection of the two boxes divided by the area of `token`; 0 when the
// token box has no area.
[[nodiscard]] float IntersectionOverTokenArea(const BoundingBox& token, const BoundingBox& detection);

struct OverlapFlags {
  bool title = false;
  bool author = false;
};

// Flags a token whose best title or author overlap exceeds 10%; title wins ties.
[[nodiscard]] OverlapFlags VisionOverlapFlags(const BoundingBox& token, std::span<const BoundingBox> detections);

}  // namespace layoutprep
