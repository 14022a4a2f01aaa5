#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace layoutprep {

enum class InputFormat {
  kPlain = 0,
  kGzip,
  kXz
};

[[nodiscard]] InputFormat DetectInputFormat(const std::string& path);

struct CorpusReadStats {
  std::uint64_t lines = 0;
  std::uint64_t records = 0;
  std::uint64_t skipped = 0;
};

// Streams line-oriented files, transparently decompressing .gz and .xz.
class CorpusReader {
 public:
  using LineFn = std::function<void(const std::string&)>;
  using RecordFn = std::function<void(const nlohmann::json&)>;

  // Returns false if the file cannot be opened or the compressed stream is corrupt.
  bool ForEachLine(const std::string& path, const LineFn& fn) const;

  // One JSON value per line. Lines that fail to parse are logged and skipped.
  bool ForEachJsonRecord(const std::string& path, const RecordFn& fn, CorpusReadStats* stats = nullptr) const;

 private:
  bool ReadTextLines(const std::string& path, const LineFn& fn) const;
  bool ReadGzLines(const std::string& path, const LineFn& fn) const;
  bool ReadXzLines(const std::string& path, const LineFn& fn) const;
};

}  // namespace layoutprep
