#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "corpus_fixture.hpp"
#include "layoutprep/documents.hpp"
#include "layoutprep/featurizer.hpp"
#include "layoutprep/labeler.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/metadata.hpp"
#include "layoutprep/pipeline.hpp"
#include "layoutprep/token_store.hpp"
#include "layoutprep/vision.hpp"
#include "test_support.hpp"

namespace {

using namespace layoutprep;
namespace fx = layoutprep::testing;

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestTokenStore(const std::filesystem::path& root) {
  CorpusLayout layout;

  // A document without a content hash aborts the whole bucket.
  const auto bad = root / "bad";
  fx::WriteTokenDump(bad, {fx::MakeRecord(fx::DocId('1'), {fx::MakePage(fx::Line({"ok"}, 10, 10))}),
                           fx::MakeRecord("no/hash/here.pdf", {fx::MakePage(fx::Line({"x"}, 10, 10))})});
  assert(Throws([&] { (void)UnlabeledTokensFile(bad, layout); }));
  assert(!std::filesystem::exists(UnlabeledTokensPath(bad)));
  assert(!std::filesystem::exists(TemporaryPathFor(UnlabeledTokensPath(bad))));

  const auto empty = root / "empty";
  std::filesystem::create_directories(empty);
  assert(Throws([&] { (void)UnlabeledTokensFile(empty, layout); }));

  const auto odd = root / "odd";
  std::vector<nlohmann::json> many_pages;
  for (int i = 0; i < 5; ++i) {
    many_pages.push_back(fx::MakePage(fx::Line({"page", std::to_string(i)}, 10, 10)));
  }
  nlohmann::json no_tokens;
  no_tokens["width"] = "612";
  no_tokens["height"] = 792;
  fx::WriteTokenDump(odd, {fx::MakeRecord(fx::DocId('5'), many_pages),
                           fx::MakeRecord(fx::DocId('6'), {no_tokens, fx::MakePage(fx::Line({std::string("a\0b", 3)}, 10, 10))})});
  auto unlabeled = UnlabeledTokensFile(odd, layout);
  auto metadata = unlabeled->Strings(kDocMetadataDataset);
  assert(metadata.size() == 2);

  auto truncated = ParseDocMetadata(metadata[0]);
  assert(truncated.pages.size() == kMaxPageCount);
  assert(truncated.TokenCount() == 6);
  assert(truncated.doc_sha == fx::FakeSha('5'));

  auto sparse = ParseDocMetadata(metadata[1]);
  assert(sparse.pages.size() == 2);
  assert(sparse.pages[0].token_count == 0);
  assert(sparse.pages[0].width == 612.0f);
  assert(sparse.pages[1].first_token_index == 6);
  auto text = unlabeled->Strings(kTokenTextFeaturesDataset);
  assert(text[6 * kTokenTextFeatureCount] == "a\xEF\xBF\xBD" "b");

  auto identity = ExtractDocIdentity("s3://bucket/" + fx::FakeSha('7') + "/x.pdf");
  assert(identity && identity->doc_id == fx::FakeSha('7') + "/x.pdf");
  assert(!ExtractDocIdentity("nothing/to/see.pdf"));
  assert(!IsSha1Hex(std::string(40, 'A')));
}

void TestVision() {
  BoundingBox token{"", 0, 10, 0, 10, 0};
  BoundingBox half{"title", 5, 20, 0, 10, 1};
  assert(fx::Near(IntersectionOverTokenArea(token, half), 0.5));
  BoundingBox outside{"author", 50, 60, 50, 60, 1};
  assert(IntersectionOverTokenArea(token, outside) == 0.0f);
  BoundingBox flat{"", 0, 10, 5, 5, 0};
  assert(IntersectionOverTokenArea(flat, half) == 0.0f);

  std::vector<BoundingBox> tie = {half, BoundingBox{"author", 0, 5, 0, 10, 1}};
  auto flags = VisionOverlapFlags(token, tie);
  assert(flags.title && !flags.author);
  std::vector<BoundingBox> author_wins = {BoundingBox{"title", 0, 1, 0, 10, 1}, BoundingBox{"author", 0, 10, 0, 10, 1}};
  flags = VisionOverlapFlags(token, author_wins);
  assert(!flags.title && flags.author);

  VisionOutput vision;
  vision.Add("sha", {{half}, {}});
  assert(vision.PagesForSha("sha") == 2);
  assert(vision.BoxesForShaAndPage("sha", 0).size() == 1);
  assert(vision.BoxesForShaAndPage("sha", 5).empty());
  assert(vision.BoxesForShaAndPage("other", 0).empty());
  assert(VisionOutput::Load("/nonexistent/vision_output.json").size() == 0);
}

void WriteCorpus(const std::filesystem::path& corpus) {
  fx::WriteGzFile(corpus / "tokenstats.tsv.gz",
                  "token\tdeep\t20\n"
                  "token\tlearning\t15\n"
                  "token\tfor\t30\n"
                  "token\tNLP\t12\n"
                  "token\tjohn\t11\n"
                  "token\tsmith\t11\n"
                  "token\tintroduction\t3\n"
                  "font_size\t10\t50\n"
                  "font_size\t11\t20\n"
                  "font_size\t18\t5\n"
                  "space_width\t2.5\t50\n"
                  "space_width\t2.75\t20\n"
                  "space_width\t4.5\t5\n");
  fx::WriteGzFile(corpus / "glove.txt.gz",
                  "deep 0.25 -0.5\n"
                  "for 0.1 0.2\n"
                  "text 1 2\n");
  fx::WriteLabelingBucket(corpus / "00");
  fx::WriteLabelingBucket(corpus / "f3");
  fx::WriteTextFile(corpus / "00" / "vision_output.json",
                    "{\"docSha\": \"" + fx::FakeSha('1') +
                        "\", \"pages\": [[[\"title\", 40, 90, 200, 130, 0.9]], []]}\n"
                        "not json\n");
}

Config MakeConfig(const std::filesystem::path& corpus) {
  Config cfg;
  cfg.corpus_dir = corpus.string();
  cfg.model.glove_vectors = (corpus / "glove.txt.gz").string();
  cfg.log_level = LogLevel::kError;
  return cfg;
}

void TestPipeline(const std::filesystem::path& corpus) {
  WriteCorpus(corpus);
  const auto cfg = MakeConfig(corpus);

  Document kept;
  {
    Pipeline pipeline(cfg);
    assert(pipeline.BucketPath("00") == corpus / "00");

    auto featurized = pipeline.PrepareBucket("00");
    assert(featurized->path() == FeaturizedTokensPath(corpus / "00", cfg.model));
    assert(featurized->Attribute("featurizing_key") == FeaturizingKeyHex(cfg.model));
    assert(featurized->Attribute("glove_vectors") == "glove.txt.gz");

    auto scaled = featurized->Values<float>(kTokenScaledNumericFeaturesDataset);
    assert(scaled.size() == 8 * kScaledNumericFeatureCount);
    assert(std::all_of(scaled.begin(), scaled.end(), [](float v) { return v >= -0.5f && v <= 0.5f; }));

    auto view = pipeline.DocumentsForBucket("00");
    assert(view.size() == 1);
    auto doc = view.Get(0);
    assert(doc.doc_sha == fx::FakeSha('1'));
    assert(doc.gold_title == "Deep Learning for NLP");
    assert(doc.gold_authors.size() == 1);
    assert(doc.pages.size() == 2);

    const auto& first = doc.pages[0];
    assert(first.token_count() == 6);
    assert((first.tokens.ToVector() == std::vector<std::string>{"Deep", "Learning", "for", "NLP", "John", "Smith"}));
    assert((std::vector<std::int8_t>(first.labels.begin(), first.labels.end()) ==
            std::vector<std::int8_t>{1, 1, 1, 1, 2, 2}));
    assert(first.token_hashes[0] == pipeline.embeddings().IndexForToken("deep"));
    assert(first.token_hashes[0] >= 2);
    assert(doc.pages[1].token_hashes[0] == CombinedEmbeddings::kOovIndex);
    const auto font_hash = FontHash("Times-Roman", cfg.model.font_hash_size);
    assert(font_hash >= 1 && font_hash <= cfg.model.font_hash_size);
    for (std::size_t t = 0; t < first.token_count(); ++t) {
      assert(first.font_hashes[t] == font_hash);
    }

    const auto& features = first.scaled_numeric_features;
    assert(features.rows() == 6 && features.cols() == kScaledNumericFeatureCount);
    assert(fx::Near(features(0, kScaledBoxOffset), 50.0 / 600.0 - 0.5));
    assert(fx::Near(features(0, kScaledBoxOffset + 3), 110.0 / 800.0 - 0.5));
    assert(features(0, kScaledCapitalizationOffset) == 0.5f);
    assert(features(2, kScaledCapitalizationOffset) == -0.5f);
    // Title tokens sit inside the detected title box, author tokens below it.
    assert(features(0, kScaledVisionTitleOffset) == 0.5f);
    assert(features(3, kScaledVisionTitleOffset) == 0.5f);
    assert(features(4, kScaledVisionTitleOffset) == -0.5f);
    assert(features(4, kScaledVisionAuthorOffset) == -0.5f);
    assert(first.numeric_features(0, 4) == 18.0f);
    // The title font is the largest in the document.
    assert(features(0, kScaledDocumentPercentileOffset) > features(4, kScaledDocumentPercentileOffset));
    assert(features(0, kScaledCorpusPercentileOffset) > features(4, kScaledCorpusPercentileOffset));

    // Without vision output no token is flagged.
    auto test_doc = pipeline.DocumentsForBucket("f3").Get(0);
    assert(test_doc.pages[0].scaled_numeric_features(0, kScaledVisionTitleOffset) == -0.5f);

    std::size_t train_docs = 0;
    pipeline.ForEachDocument(kTrainBuckets, [&](const Document& d) {
      ++train_docs;
      assert(d.doc_sha == fx::FakeSha('1'));
    });
    assert(train_docs == 1);
    std::size_t test_docs = 0;
    pipeline.ForEachDocument(kTestBuckets, [&](const Document&) { ++test_docs; });
    assert(test_docs == 1);

    kept = doc;
  }
  // The document keeps its artifact alive after the pipeline is gone.
  assert(kept.pages[0].tokens[1] == "Learning");
  assert(kept.pages[1].tokens[0] == "Introduction");

  // Rebuilding is a no-op once the artifacts exist.
  const auto featurized_path = FeaturizedTokensPath(corpus / "00", cfg.model);
  const auto labeled_path = LabeledTokensPath(corpus / "00");
  const auto featurized_time = std::filesystem::last_write_time(featurized_path);
  const auto labeled_time = std::filesystem::last_write_time(labeled_path);
  {
    Pipeline pipeline(cfg);
    auto again = pipeline.PrepareBucket("00");
    assert(again->path() == featurized_path);
  }
  assert(std::filesystem::last_write_time(featurized_path) == featurized_time);

  // New model settings get a new featurized file on top of the same labeled one.
  auto rare = cfg;
  rare.model.minimum_token_frequency = 1;
  assert(FeaturizedTokensPath(corpus / "00", rare.model) != featurized_path);
  {
    Pipeline pipeline(rare);
    auto doc = pipeline.DocumentsForBucket("00").Get(0);
    assert(doc.pages[1].token_hashes[0] != CombinedEmbeddings::kOovIndex);
  }
  assert(std::filesystem::exists(featurized_path));
  assert(std::filesystem::exists(FeaturizedTokensPath(corpus / "00", rare.model)));
  assert(std::filesystem::last_write_time(labeled_path) == labeled_time);

  auto one_page = cfg;
  one_page.model.max_page_number = 1;
  {
    Pipeline pipeline(one_page);
    auto doc = pipeline.DocumentsForBucket("00").Get(0);
    assert(doc.pages.size() == 1);
  }
}

// Every dataset a bucket build produces, copied out of the artifact.
struct BucketContents {
  std::vector<std::string> metadata;
  std::vector<std::string> text;
  std::vector<float> numeric;
  std::vector<std::int8_t> labels;
  std::vector<std::uint32_t> hashes;
  std::vector<float> scaled;
};

BucketContents CopyBucket(const Artifact& artifact) {
  auto copy = [](auto span) { return std::vector<typename decltype(span)::value_type>(span.begin(), span.end()); };
  BucketContents out;
  out.metadata = copy(artifact.Strings(kDocMetadataDataset));
  out.text = copy(artifact.Strings(kTokenTextFeaturesDataset));
  out.numeric = copy(artifact.Values<float>(kTokenNumericFeaturesDataset));
  out.labels = copy(artifact.Values<std::int8_t>(kTokenLabelsDataset));
  out.hashes = copy(artifact.Values<std::uint32_t>(kTokenHashedTextFeaturesDataset));
  out.scaled = copy(artifact.Values<float>(kTokenScaledNumericFeaturesDataset));
  return out;
}

bool SameBytes(const std::vector<float>& a, const std::vector<float>& b) {
  return a.size() == b.size() && (a.empty() || std::memcmp(a.data(), b.data(), a.size() * sizeof(float)) == 0);
}

void TestRebuildIsDeterministic(const std::filesystem::path& corpus) {
  WriteCorpus(corpus);
  const auto cfg = MakeConfig(corpus);
  const auto bucket = corpus / "00";

  BucketContents first;
  {
    Pipeline pipeline(cfg);
    first = CopyBucket(*pipeline.PrepareBucket("00"));
  }
  assert(!first.labels.empty());
  assert(first.hashes.size() == first.labels.size() * kHashedTextFeatureCount);
  assert(first.scaled.size() == first.labels.size() * kScaledNumericFeatureCount);

  for (const auto& path :
       {UnlabeledTokensPath(bucket), LabeledTokensPath(bucket), FeaturizedTokensPath(bucket, cfg.model)}) {
    assert(std::filesystem::remove(path));
  }

  BucketContents second;
  {
    Pipeline pipeline(cfg);
    second = CopyBucket(*pipeline.PrepareBucket("00"));
  }
  assert(std::filesystem::exists(FeaturizedTokensPath(bucket, cfg.model)));
  assert(second.metadata == first.metadata);
  assert(second.text == first.text);
  assert(SameBytes(second.numeric, first.numeric));
  assert(second.labels == first.labels);
  assert(second.hashes == first.hashes);
  assert(SameBytes(second.scaled, first.scaled));
}

void TestNaming() {
  assert(BucketName(0) == "00");
  assert(BucketName(0xf0) == "f0");
  assert(BucketName(0x0b) == "0b");

  ModelSettings settings;
  const auto key = FeaturizingKeyHex(settings);
  assert(key.size() == 8);
  assert(key == FeaturizingKeyHex(ModelSettings{}));
  auto other = settings;
  other.font_hash_size = 2048;
  assert(FeaturizingKeyHex(other) != key);
  auto moved = settings;
  moved.glove_vectors = "/elsewhere/" + settings.glove_vectors;
  assert(FeaturizingKeyHex(moved) == key);
  assert(FeaturizedTokensPath("/c/00", settings).filename() ==
         "featurized-tokens-" + key + "-" + std::string(kFeaturizedTokensVersion) + ".lpa");

  bool threw = false;
  try {
    (void)FontHash("Times", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(FontHash("TIMES", 64) == FontHash("times", 64));
}

}  // namespace

int main() {
  SetLogLevel(LogLevel::kError);
  fx::TempDir dir("pipeline");
  TestTokenStore(dir.path() / "store");
  TestVision();
  TestPipeline(dir.path() / "corpus");
  TestRebuildIsDeterministic(dir.path() / "rebuild");
  TestNaming();
  return 0;
}
