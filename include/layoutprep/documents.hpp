#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "layoutprep/artifact.hpp"
#include "layoutprep/metadata.hpp"
#include "layoutprep/settings.hpp"

namespace layoutprep {

// One column of a row-major table.
template <typename T>
class StridedSpan {
 public:
  StridedSpan() = default;
  StridedSpan(const T* data, std::size_t size, std::size_t stride) : data_(data), size_(size), stride_(stride) {}

  [[nodiscard]] std::size_t size() const { return size_; }
  [[nodiscard]] bool empty() const { return size_ == 0; }
  const T& operator[](std::size_t i) const { return data_[i * stride_]; }

  [[nodiscard]] std::vector<T> ToVector() const {
    std::vector<T> out;
    out.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
      out.push_back((*this)[i]);
    }
    return out;
  }

 private:
  const T* data_ = nullptr;
  std::size_t size_ = 0;
  std::size_t stride_ = 1;
};

// A contiguous block of rows of a row-major table.
template <typename T>
class MatrixView {
 public:
  MatrixView() = default;
  MatrixView(std::span<const T> data, std::size_t cols) : data_(data), cols_(cols) {}

  [[nodiscard]] std::size_t rows() const { return cols_ == 0 ? 0 : data_.size() / cols_; }
  [[nodiscard]] std::size_t cols() const { return cols_; }
  [[nodiscard]] std::span<const T> row(std::size_t r) const { return data_.subspan(r * cols_, cols_); }
  const T& operator()(std::size_t r, std::size_t c) const { return data_[r * cols_ + c]; }
  [[nodiscard]] std::span<const T> data() const { return data_; }

 private:
  std::span<const T> data_;
  std::size_t cols_ = 0;
};

struct Page {
  std::size_t page_number = 0;
  float width = 0.0f;
  float height = 0.0f;
  StridedSpan<std::string> tokens;
  StridedSpan<std::uint32_t> token_hashes;
  StridedSpan<std::uint32_t> font_hashes;
  MatrixView<float> numeric_features;
  MatrixView<float> scaled_numeric_features;
  std::span<const std::int8_t> labels;

  [[nodiscard]] std::size_t token_count() const { return tokens.size(); }
};

// Views into a featurized artifact. `artifact` keeps them valid.
struct Document {
  std::string doc_id;
  std::string doc_sha;
  std::string gold_title;
  std::vector<Author> gold_authors;
  std::vector<Page> pages;
  std::shared_ptr<const Artifact> artifact;
};

// Lazily reconstructs documents from a featurized artifact.
class DocumentView {
 public:
  DocumentView(std::shared_ptr<const Artifact> featurized, std::size_t page_limit = kMaxPageCount);

  [[nodiscard]] std::size_t size() const { return metadata_.size(); }
  [[nodiscard]] Document Get(std::size_t index) const;
  void ForEach(const std::function<void(const Document&)>& fn) const;

  [[nodiscard]] const std::shared_ptr<const Artifact>& artifact() const { return artifact_; }

 private:
  std::shared_ptr<const Artifact> artifact_;
  std::size_t page_limit_;
  std::span<const std::string> metadata_;
  std::span<const std::string> text_;
  std::span<const std::uint32_t> hashed_;
  std::span<const float> numeric_;
  std::span<const float> scaled_;
  std::span<const std::int8_t> labels_;
};

}  // namespace layoutprep
