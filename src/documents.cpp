#include "layoutprep/documents.hpp"

#include <algorithm>
#include <stdexcept>

#include "layoutprep/featurizer.hpp"
#include "layoutprep/labeler.hpp"
#include "layoutprep/text.hpp"
#include "layoutprep/token_store.hpp"

namespace layoutprep {

DocumentView::DocumentView(std::shared_ptr<const Artifact> featurized, std::size_t page_limit)
    : artifact_(std::move(featurized)), page_limit_(page_limit) {
  if (!artifact_) {
    throw std::invalid_argument("document view needs an artifact");
  }
  metadata_ = artifact_->Strings(kDocMetadataDataset);
  text_ = artifact_->Strings(kTokenTextFeaturesDataset);
  hashed_ = artifact_->Values<std::uint32_t>(kTokenHashedTextFeaturesDataset);
  numeric_ = artifact_->Values<float>(kTokenNumericFeaturesDataset);
  scaled_ = artifact_->Values<float>(kTokenScaledNumericFeaturesDataset);
  labels_ = artifact_->Values<std::int8_t>(kTokenLabelsDataset);

  const std::size_t rows = text_.size() / kTokenTextFeatureCount;
  if (hashed_.size() != rows * kHashedTextFeatureCount || numeric_.size() != rows * kTokenNumericFeatureCount ||
      scaled_.size() != rows * kScaledNumericFeatureCount || labels_.size() != rows) {
    throw std::runtime_error("token columns disagree in length in " + artifact_->path().string());
  }
}

Document DocumentView::Get(std::size_t index) const {
  DocMetadata meta = ParseDocMetadata(metadata_[index]);

  Document doc;
  doc.doc_id = std::move(meta.doc_id);
  doc.doc_sha = std::move(meta.doc_sha);
  doc.gold_title = meta.gold_title ? TrimPunctuation(*meta.gold_title) : std::string();
  doc.gold_authors = std::move(meta.gold_authors);
  doc.artifact = artifact_;

  const std::size_t rows = text_.size() / kTokenTextFeatureCount;
  const std::size_t page_count = std::min(page_limit_, meta.pages.size());
  for (std::size_t p = 0; p < page_count; ++p) {
    const auto& pm = meta.pages[p];
    const auto first = static_cast<std::size_t>(pm.first_token_index);
    const auto count = static_cast<std::size_t>(pm.token_count);
    if (first + count > rows) {
      throw std::runtime_error("page of " + doc.doc_id + " runs past the token columns");
    }

    Page page;
    page.page_number = p;
    page.width = pm.width;
    page.height = pm.height;
    page.tokens = StridedSpan<std::string>(text_.data() + first * kTokenTextFeatureCount, count,
                                           kTokenTextFeatureCount);
    page.token_hashes = StridedSpan<std::uint32_t>(hashed_.data() + first * kHashedTextFeatureCount, count,
                                                   kHashedTextFeatureCount);
    page.font_hashes = StridedSpan<std::uint32_t>(hashed_.data() + first * kHashedTextFeatureCount + 1, count,
                                                  kHashedTextFeatureCount);
    page.numeric_features = MatrixView<float>(
        numeric_.subspan(first * kTokenNumericFeatureCount, count * kTokenNumericFeatureCount),
        kTokenNumericFeatureCount);
    page.scaled_numeric_features = MatrixView<float>(
        scaled_.subspan(first * kScaledNumericFeatureCount, count * kScaledNumericFeatureCount),
        kScaledNumericFeatureCount);
    page.labels = labels_.subspan(first, count);
    doc.pages.push_back(page);
  }
  return doc;
}

void DocumentView::ForEach(const std::function<void(const Document&)>& fn) const {
  for (std::size_t i = 0; i < size(); ++i) {
    fn(Get(i));
  }
}

}  // namespace layoutprep
