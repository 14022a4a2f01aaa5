#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace layoutprep {

// Columnar container used for every cached pipeline stage. A file holds named
// datasets, each a row-major table of `width` values per row, appended
// independently and stored as zlib-compressed blocks. The JSON directory at
// the end of the file makes it self-describing.

enum class DType : std::uint8_t {
  kInt8 = 0,
  kUInt32,
  kFloat32,
  kString
};

template <typename T>
struct DTypeOf;
template <>
struct DTypeOf<std::int8_t> {
  static constexpr DType value = DType::kInt8;
};
template <>
struct DTypeOf<std::uint32_t> {
  static constexpr DType value = DType::kUInt32;
};
template <>
struct DTypeOf<float> {
  static constexpr DType value = DType::kFloat32;
};
template <>
struct DTypeOf<std::string> {
  static constexpr DType value = DType::kString;
};

[[nodiscard]] std::string_view DTypeName(DType dtype);
[[nodiscard]] DType ParseDType(std::string_view name);

using Attributes = std::map<std::string, std::string>;

constexpr std::uint32_t kArtifactMagic = 0x3141504C;  // "LPA1"
constexpr std::uint32_t kArtifactFormatVersion = 1;
constexpr std::size_t kDefaultBlockRows = 1 << 16;

struct ArtifactHeader {
  std::uint32_t magic = kArtifactMagic;
  std::uint32_t version = kArtifactFormatVersion;
};

struct ArtifactFooter {
  std::uint64_t directory_offset = 0;
  std::uint64_t directory_bytes = 0;
  std::uint32_t magic = kArtifactMagic;
  std::uint32_t version = kArtifactFormatVersion;
};

class ArtifactWriter {
 public:
  explicit ArtifactWriter(std::filesystem::path path, std::size_t block_rows = kDefaultBlockRows);
  ~ArtifactWriter();

  ArtifactWriter(const ArtifactWriter&) = delete;
  ArtifactWriter& operator=(const ArtifactWriter&) = delete;

  void CreateDataset(const std::string& name, DType dtype, std::size_t width);

  // Re-exposes the same-named dataset of `target`, which must live in the same
  // directory as this artifact.
  void LinkDataset(const std::string& name, const std::filesystem::path& target);

  void SetAttribute(const std::string& key, const std::string& value);

  template <typename T>
  void Append(const std::string& name, std::span<const T> values) {
    AppendNumeric(name, DTypeOf<T>::value, values.data(), values.size(), sizeof(T));
  }
  void AppendStrings(const std::string& name, std::span<const std::string> values);

  [[nodiscard]] std::size_t Rows(const std::string& name) const;

  // Flushes pending blocks and writes the directory. The writer is unusable afterwards.
  void Finish();

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  struct BlockInfo {
    std::uint64_t offset = 0;
    std::uint64_t compressed_bytes = 0;
    std::uint64_t raw_bytes = 0;
    std::uint64_t rows = 0;
  };

  struct PendingDataset {
    DType dtype = DType::kFloat32;
    std::size_t width = 1;
    std::string link;
    std::vector<char> pending;
    std::size_t pending_values = 0;
    std::size_t rows = 0;
    std::vector<BlockInfo> blocks;
  };

  PendingDataset& FindWritable(const std::string& name, DType dtype);
  void AppendNumeric(const std::string& name, DType dtype, const void* data, std::size_t count,
                     std::size_t elem_size);
  void CommitValues(PendingDataset& ds, std::size_t count);
  void FlushBlock(PendingDataset& ds);
  void WriteBytes(const void* data, std::size_t n);

  std::filesystem::path path_;
  std::ofstream out_;
  std::size_t block_rows_;
  std::uint64_t offset_ = 0;
  std::vector<std::string> order_;
  std::map<std::string, PendingDataset> datasets_;
  Attributes attributes_;
  bool finished_ = false;
};

class Artifact {
 public:
  static std::shared_ptr<const Artifact> Open(const std::filesystem::path& path);

  Artifact(const Artifact&) = delete;
  Artifact& operator=(const Artifact&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] const Attributes& attributes() const { return attributes_; }
  [[nodiscard]] std::string Attribute(const std::string& key) const;

  [[nodiscard]] bool HasDataset(const std::string& name) const;
  [[nodiscard]] std::vector<std::string> DatasetNames() const;
  [[nodiscard]] DType GetDType(const std::string& name) const;
  [[nodiscard]] std::size_t Width(const std::string& name) const;
  [[nodiscard]] std::size_t Rows(const std::string& name) const;

  // Decoded values stay owned by this handle; the span is valid for its lifetime.
  template <typename T>
  [[nodiscard]] std::span<const T> Values(const std::string& name) const {
    return std::get<std::vector<T>>(Decode(name, DTypeOf<T>::value));
  }
  [[nodiscard]] std::span<const std::string> Strings(const std::string& name) const {
    return Values<std::string>(name);
  }

 private:
  using Decoded = std::variant<std::vector<std::int8_t>, std::vector<std::uint32_t>, std::vector<float>,
                               std::vector<std::string>>;

  struct BlockInfo {
    std::uint64_t offset = 0;
    std::uint64_t compressed_bytes = 0;
    std::uint64_t raw_bytes = 0;
    std::uint64_t rows = 0;
  };

  struct Dataset {
    DType dtype = DType::kFloat32;
    std::size_t width = 1;
    std::size_t rows = 0;
    std::string link;
    std::vector<BlockInfo> blocks;
  };

  explicit Artifact(std::filesystem::path path);

  const Dataset& Find(const std::string& name) const;
  const Artifact& LinkTarget(const Dataset& ds) const;
  const Decoded& Decode(const std::string& name, DType expected) const;
  Decoded ReadDataset(const std::string& name, const Dataset& ds) const;

  std::filesystem::path path_;
  Attributes attributes_;
  std::map<std::string, Dataset> datasets_;

  mutable std::mutex mu_;
  mutable std::map<std::string, Decoded> decoded_;
  mutable std::map<std::string, std::shared_ptr<const Artifact>> linked_;
};

// "<path>.<pid>.temp", unique per process.
[[nodiscard]] std::filesystem::path TemporaryPathFor(const std::filesystem::path& path);

// Opens `path` when it already exists. Otherwise runs `build` against a writer
// on a temporary file, finishes it and renames it into place; on any failure
// the temporary file is removed and the exception propagates.
std::shared_ptr<const Artifact> OpenOrBuildArtifact(const std::filesystem::path& path,
                                                    const std::function<void(ArtifactWriter&)>& build);

}  // namespace layoutprep
