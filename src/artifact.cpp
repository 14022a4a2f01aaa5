#include "layoutprep/artifact.hpp"

#include <cstring>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>
#include <unistd.h>
#include <zlib.h>

#include "layoutprep/log.hpp"

namespace layoutprep {

namespace {

std::size_t ElementSize(DType dtype) {
  switch (dtype) {
    case DType::kInt8:
      return 1;
    case DType::kUInt32:
    case DType::kFloat32:
      return 4;
    case DType::kString:
      return 0;
  }
  return 0;
}

template <typename T>
std::vector<T> DecodeNumeric(const std::vector<char>& payload, std::size_t count) {
  if (payload.size() != count * sizeof(T)) {
    throw std::runtime_error("artifact block size does not match its row count");
  }
  std::vector<T> out(count);
  if (count > 0) {
    std::memcpy(out.data(), payload.data(), payload.size());
  }
  return out;
}

}  // namespace

std::string_view DTypeName(DType dtype) {
  switch (dtype) {
    case DType::kInt8:
      return "int8";
    case DType::kUInt32:
      return "uint32";
    case DType::kFloat32:
      return "float32";
    case DType::kString:
      return "string";
  }
  return "unknown";
}

DType ParseDType(std::string_view name) {
  if (name == "int8") return DType::kInt8;
  if (name == "uint32") return DType::kUInt32;
  if (name == "float32") return DType::kFloat32;
  if (name == "string") return DType::kString;
  throw std::runtime_error("unknown artifact dtype: " + std::string(name));
}

//
// ArtifactWriter
//

ArtifactWriter::ArtifactWriter(std::filesystem::path path, std::size_t block_rows)
    : path_(std::move(path)), block_rows_(block_rows == 0 ? kDefaultBlockRows : block_rows) {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw std::runtime_error("failed to create artifact: " + path_.string());
  }
  ArtifactHeader header;
  WriteBytes(&header, sizeof(header));
}

ArtifactWriter::~ArtifactWriter() {
  if (out_.is_open()) {
    out_.close();
  }
}

void ArtifactWriter::CreateDataset(const std::string& name, DType dtype, std::size_t width) {
  if (finished_) {
    throw std::logic_error("artifact already finished: " + path_.string());
  }
  if (width == 0) {
    throw std::invalid_argument("dataset width must be positive: " + name);
  }
  if (datasets_.count(name) != 0) {
    throw std::invalid_argument("duplicate dataset: " + name);
  }
  PendingDataset ds;
  ds.dtype = dtype;
  ds.width = width;
  datasets_.emplace(name, std::move(ds));
  order_.push_back(name);
}

void ArtifactWriter::LinkDataset(const std::string& name, const std::filesystem::path& target) {
  if (finished_) {
    throw std::logic_error("artifact already finished: " + path_.string());
  }
  if (datasets_.count(name) != 0) {
    throw std::invalid_argument("duplicate dataset: " + name);
  }
  PendingDataset ds;
  ds.link = target.filename().string();
  datasets_.emplace(name, std::move(ds));
  order_.push_back(name);
}

void ArtifactWriter::SetAttribute(const std::string& key, const std::string& value) { attributes_[key] = value; }

ArtifactWriter::PendingDataset& ArtifactWriter::FindWritable(const std::string& name, DType dtype) {
  if (finished_) {
    throw std::logic_error("artifact already finished: " + path_.string());
  }
  auto it = datasets_.find(name);
  if (it == datasets_.end()) {
    throw std::invalid_argument("no such dataset: " + name);
  }
  if (!it->second.link.empty()) {
    throw std::invalid_argument("cannot append to linked dataset: " + name);
  }
  if (it->second.dtype != dtype) {
    throw std::invalid_argument("dataset " + name + " holds " + std::string(DTypeName(it->second.dtype)) +
                                ", not " + std::string(DTypeName(dtype)));
  }
  return it->second;
}

void ArtifactWriter::AppendNumeric(const std::string& name, DType dtype, const void* data, std::size_t count,
                                   std::size_t elem_size) {
  PendingDataset& ds = FindWritable(name, dtype);
  if (elem_size != ElementSize(dtype)) {
    throw std::invalid_argument("element size mismatch for dataset " + name);
  }
  if (count % ds.width != 0) {
    throw std::invalid_argument("partial row appended to dataset " + name);
  }
  const char* p = static_cast<const char*>(data);
  ds.pending.insert(ds.pending.end(), p, p + count * elem_size);
  CommitValues(ds, count);
}

void ArtifactWriter::AppendStrings(const std::string& name, std::span<const std::string> values) {
  PendingDataset& ds = FindWritable(name, DType::kString);
  if (values.size() % ds.width != 0) {
    throw std::invalid_argument("partial row appended to dataset " + name);
  }
  for (const auto& v : values) {
    auto len = static_cast<std::uint32_t>(v.size());
    const char* lp = reinterpret_cast<const char*>(&len);
    ds.pending.insert(ds.pending.end(), lp, lp + sizeof(len));
    ds.pending.insert(ds.pending.end(), v.begin(), v.end());
  }
  CommitValues(ds, values.size());
}

void ArtifactWriter::CommitValues(PendingDataset& ds, std::size_t count) {
  ds.pending_values += count;
  ds.rows += count / ds.width;
  if (ds.pending_values / ds.width >= block_rows_) {
    FlushBlock(ds);
  }
}

void ArtifactWriter::FlushBlock(PendingDataset& ds) {
  if (ds.pending_values == 0) {
    return;
  }

  uLongf dst_bound = compressBound(static_cast<uLong>(ds.pending.size()));
  std::vector<Bytef> compressed(dst_bound);
  uLongf compressed_size = dst_bound;
  int zret = compress2(compressed.data(), &compressed_size, reinterpret_cast<const Bytef*>(ds.pending.data()),
                       static_cast<uLong>(ds.pending.size()), Z_BEST_SPEED);
  if (zret != Z_OK) {
    throw std::runtime_error("zlib compression failed for " + path_.string());
  }

  BlockInfo block;
  block.offset = offset_;
  block.compressed_bytes = compressed_size;
  block.raw_bytes = ds.pending.size();
  block.rows = ds.pending_values / ds.width;
  WriteBytes(compressed.data(), compressed_size);
  ds.blocks.push_back(block);

  ds.pending.clear();
  ds.pending_values = 0;
}

void ArtifactWriter::WriteBytes(const void* data, std::size_t n) {
  out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(n));
  if (!out_) {
    throw std::runtime_error("failed to write artifact: " + path_.string());
  }
  offset_ += n;
}

std::size_t ArtifactWriter::Rows(const std::string& name) const {
  auto it = datasets_.find(name);
  if (it == datasets_.end()) {
    throw std::invalid_argument("no such dataset: " + name);
  }
  return it->second.rows;
}

void ArtifactWriter::Finish() {
  if (finished_) {
    return;
  }

  nlohmann::json directory;
  directory["format_version"] = kArtifactFormatVersion;
  directory["attributes"] = attributes_;
  directory["datasets"] = nlohmann::json::array();
  for (const auto& name : order_) {
    auto& ds = datasets_.at(name);
    nlohmann::json entry;
    entry["name"] = name;
    if (!ds.link.empty()) {
      entry["link"] = ds.link;
    } else {
      FlushBlock(ds);
      entry["dtype"] = DTypeName(ds.dtype);
      entry["width"] = ds.width;
      entry["rows"] = ds.rows;
      nlohmann::json blocks = nlohmann::json::array();
      for (const auto& b : ds.blocks) {
        blocks.push_back({b.offset, b.compressed_bytes, b.raw_bytes, b.rows});
      }
      entry["blocks"] = std::move(blocks);
    }
    directory["datasets"].push_back(std::move(entry));
  }

  std::string payload = directory.dump();
  ArtifactFooter footer;
  footer.directory_offset = offset_;
  footer.directory_bytes = payload.size();
  WriteBytes(payload.data(), payload.size());
  WriteBytes(&footer, sizeof(footer));

  out_.flush();
  if (!out_) {
    throw std::runtime_error("failed to flush artifact: " + path_.string());
  }
  out_.close();
  finished_ = true;
}

//
// Artifact
//

Artifact::Artifact(std::filesystem::path path) : path_(std::move(path)) {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open artifact: " + path_.string());
  }

  ArtifactHeader header;
  in.read(reinterpret_cast<char*>(&header), sizeof(header));
  if (!in || header.magic != kArtifactMagic || header.version != kArtifactFormatVersion) {
    throw std::runtime_error("not a layoutprep artifact: " + path_.string());
  }

  ArtifactFooter footer;
  in.seekg(-static_cast<std::streamoff>(sizeof(footer)), std::ios::end);
  in.read(reinterpret_cast<char*>(&footer), sizeof(footer));
  if (!in || footer.magic != kArtifactMagic || footer.version != kArtifactFormatVersion) {
    throw std::runtime_error("artifact is incomplete: " + path_.string());
  }

  std::string payload(static_cast<std::size_t>(footer.directory_bytes), '\0');
  in.seekg(static_cast<std::streamoff>(footer.directory_offset));
  in.read(payload.data(), static_cast<std::streamsize>(payload.size()));
  if (!in) {
    throw std::runtime_error("failed to read artifact directory: " + path_.string());
  }

  auto directory = nlohmann::json::parse(payload, nullptr, false);
  if (directory.is_discarded() || !directory.is_object()) {
    throw std::runtime_error("corrupt artifact directory: " + path_.string());
  }
  try {
    if (directory.at("format_version").get<std::uint32_t>() != kArtifactFormatVersion) {
      throw std::runtime_error("unsupported artifact format version: " + path_.string());
    }
    attributes_ = directory.at("attributes").get<Attributes>();
    for (const auto& entry : directory.at("datasets")) {
      Dataset ds;
      auto name = entry.at("name").get<std::string>();
      if (entry.contains("link")) {
        ds.link = entry.at("link").get<std::string>();
      } else {
        ds.dtype = ParseDType(entry.at("dtype").get<std::string>());
        ds.width = entry.at("width").get<std::size_t>();
        ds.rows = entry.at("rows").get<std::size_t>();
        for (const auto& b : entry.at("blocks")) {
          BlockInfo block;
          block.offset = b.at(0).get<std::uint64_t>();
          block.compressed_bytes = b.at(1).get<std::uint64_t>();
          block.raw_bytes = b.at(2).get<std::uint64_t>();
          block.rows = b.at(3).get<std::uint64_t>();
          ds.blocks.push_back(block);
        }
      }
      datasets_.emplace(std::move(name), std::move(ds));
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("unexpected artifact schema in " + path_.string() + ": " + e.what());
  }
}

std::shared_ptr<const Artifact> Artifact::Open(const std::filesystem::path& path) {
  return std::shared_ptr<const Artifact>(new Artifact(path));
}

std::string Artifact::Attribute(const std::string& key) const {
  auto it = attributes_.find(key);
  return it == attributes_.end() ? std::string() : it->second;
}

bool Artifact::HasDataset(const std::string& name) const { return datasets_.count(name) != 0; }

std::vector<std::string> Artifact::DatasetNames() const {
  std::vector<std::string> names;
  names.reserve(datasets_.size());
  for (const auto& kv : datasets_) {
    names.push_back(kv.first);
  }
  return names;
}

const Artifact::Dataset& Artifact::Find(const std::string& name) const {
  auto it = datasets_.find(name);
  if (it == datasets_.end()) {
    throw std::runtime_error("dataset " + name + " missing from " + path_.string());
  }
  return it->second;
}

const Artifact& Artifact::LinkTarget(const Dataset& ds) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = linked_.find(ds.link);
  if (it == linked_.end()) {
    auto target = Open(path_.parent_path() / ds.link);
    it = linked_.emplace(ds.link, std::move(target)).first;
  }
  return *it->second;
}

DType Artifact::GetDType(const std::string& name) const {
  const Dataset& ds = Find(name);
  return ds.link.empty() ? ds.dtype : LinkTarget(ds).GetDType(name);
}

std::size_t Artifact::Width(const std::string& name) const {
  const Dataset& ds = Find(name);
  return ds.link.empty() ? ds.width : LinkTarget(ds).Width(name);
}

std::size_t Artifact::Rows(const std::string& name) const {
  const Dataset& ds = Find(name);
  return ds.link.empty() ? ds.rows : LinkTarget(ds).Rows(name);
}

const Artifact::Decoded& Artifact::Decode(const std::string& name, DType expected) const {
  const Dataset& ds = Find(name);
  if (!ds.link.empty()) {
    return LinkTarget(ds).Decode(name, expected);
  }
  if (ds.dtype != expected) {
    throw std::runtime_error("dataset " + name + " in " + path_.string() + " holds " +
                             std::string(DTypeName(ds.dtype)) + ", not " + std::string(DTypeName(expected)));
  }

  std::lock_guard<std::mutex> lock(mu_);
  auto it = decoded_.find(name);
  if (it == decoded_.end()) {
    it = decoded_.emplace(name, ReadDataset(name, ds)).first;
  }
  return it->second;
}

Artifact::Decoded Artifact::ReadDataset(const std::string& name, const Dataset& ds) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open artifact: " + path_.string());
  }

  const std::size_t total_values = ds.rows * ds.width;
  std::vector<std::int8_t> i8;
  std::vector<std::uint32_t> u32;
  std::vector<float> f32;
  std::vector<std::string> strings;
  switch (ds.dtype) {
    case DType::kInt8:
      i8.reserve(total_values);
      break;
    case DType::kUInt32:
      u32.reserve(total_values);
      break;
    case DType::kFloat32:
      f32.reserve(total_values);
      break;
    case DType::kString:
      strings.reserve(total_values);
      break;
  }

  std::vector<Bytef> compressed;
  std::vector<char> payload;
  for (const auto& block : ds.blocks) {
    compressed.resize(static_cast<std::size_t>(block.compressed_bytes));
    in.seekg(static_cast<std::streamoff>(block.offset));
    in.read(reinterpret_cast<char*>(compressed.data()), static_cast<std::streamsize>(compressed.size()));
    if (!in) {
      throw std::runtime_error("failed to read block of " + name + " in " + path_.string());
    }

    payload.resize(static_cast<std::size_t>(block.raw_bytes));
    if (!payload.empty()) {
      uLongf out_size = static_cast<uLongf>(block.raw_bytes);
      int zret = uncompress(reinterpret_cast<Bytef*>(payload.data()), &out_size, compressed.data(),
                            static_cast<uLong>(compressed.size()));
      if (zret != Z_OK || out_size != block.raw_bytes) {
        throw std::runtime_error("corrupt block of " + name + " in " + path_.string());
      }
    }

    const std::size_t values = static_cast<std::size_t>(block.rows) * ds.width;
    switch (ds.dtype) {
      case DType::kInt8: {
        auto part = DecodeNumeric<std::int8_t>(payload, values);
        i8.insert(i8.end(), part.begin(), part.end());
        break;
      }
      case DType::kUInt32: {
        auto part = DecodeNumeric<std::uint32_t>(payload, values);
        u32.insert(u32.end(), part.begin(), part.end());
        break;
      }
      case DType::kFloat32: {
        auto part = DecodeNumeric<float>(payload, values);
        f32.insert(f32.end(), part.begin(), part.end());
        break;
      }
      case DType::kString: {
        std::size_t pos = 0;
        for (std::size_t i = 0; i < values; ++i) {
          std::uint32_t len = 0;
          if (pos + sizeof(len) > payload.size()) {
            throw std::runtime_error("truncated string block of " + name + " in " + path_.string());
          }
          std::memcpy(&len, payload.data() + pos, sizeof(len));
          pos += sizeof(len);
          if (pos + len > payload.size()) {
            throw std::runtime_error("truncated string block of " + name + " in " + path_.string());
          }
          strings.emplace_back(payload.data() + pos, len);
          pos += len;
        }
        if (pos != payload.size()) {
          throw std::runtime_error("trailing bytes in string block of " + name + " in " + path_.string());
        }
        break;
      }
    }
  }

  switch (ds.dtype) {
    case DType::kInt8:
      return std::move(i8);
    case DType::kUInt32:
      return std::move(u32);
    case DType::kFloat32:
      return std::move(f32);
    case DType::kString:
      break;
  }
  return std::move(strings);
}

//
// Build discipline
//

std::filesystem::path TemporaryPathFor(const std::filesystem::path& path) {
  auto tmp = path;
  tmp += "." + std::to_string(static_cast<long long>(::getpid())) + ".temp";
  return tmp;
}

std::shared_ptr<const Artifact> OpenOrBuildArtifact(const std::filesystem::path& path,
                                                    const std::function<void(ArtifactWriter&)>& build) {
  if (std::filesystem::exists(path)) {
    return Artifact::Open(path);
  }

  LogInfo(path.string() + " does not exist, will recreate");
  const auto tmp = TemporaryPathFor(path);
  try {
    ArtifactWriter writer(tmp);
    build(writer);
    writer.Finish();
    std::filesystem::rename(tmp, path);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    throw;
  }
  return Artifact::Open(path);
}

}  // namespace layoutprep
