#include <algorithm>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "corpus_fixture.hpp"
#include "layoutprep/labeler.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/metadata.hpp"
#include "layoutprep/token_store.hpp"
#include "test_support.hpp"

namespace {

using namespace layoutprep;
using layoutprep::testing::JatsXml;

void TestParseGoldMetadata() {
  auto gold = ParseGoldMetadata(JatsXml("Deep  Learning for NLP.", {{"John", "Smith"}, {"Mary Ann", "Lee"}}), "doc");
  assert(gold);
  assert(gold->title == "Deep Learning for NLP");
  assert(gold->authors.size() == 2);
  assert((gold->authors[0] == Author{"John", "Smith"}));
  assert(gold->authors[1].given_names == "Mary Ann");

  assert(!ParseGoldMetadata(JatsXml("NLP", {{"John", "Smith"}}), "short"));
  assert(!ParseGoldMetadata(JatsXml("A Long Enough Title", {}), "no authors"));
  assert(!ParseGoldMetadata(JatsXml("A Long Enough Title", {{"John", ""}}), "no surname"));
  assert(!ParseGoldMetadata("<article><front>", "broken"));

  std::string two_titles =
      "<article><front><article-meta><title-group><article-title>First title</article-title>"
      "<article-title>Second title</article-title></title-group></article-meta></front></article>";
  assert(!ParseGoldMetadata(two_titles, "two titles"));

  // Editors are not authors.
  std::string with_editor =
      "<article><front><article-meta><title-group><article-title>Editing Matters</article-title></title-group>"
      "<contrib-group><contrib contrib-type=\"editor\"><name><surname>Ed</surname></name></contrib>"
      "<contrib contrib-type=\"author\"><name><surname>Writer</surname></name></contrib>"
      "</contrib-group></article-meta></front></article>";
  auto edited = ParseGoldMetadata(with_editor, "editor");
  assert(edited && edited->authors.size() == 1 && edited->authors[0].surname == "Writer");
  assert(edited->authors[0].given_names.empty());
}

void TestAuthorVariants() {
  auto john = AuthorVariants(Author{"John", "Smith"});
  std::vector<std::string> expected = {"J . Smith", "J Smith", "John Smith", "Smith , John"};
  assert(john == expected);

  auto mary = AuthorVariants(Author{"Mary Ann", "Lee"});
  auto has = [&](const std::string& v) { return std::find(mary.begin(), mary.end(), v) != mary.end(); };
  assert(has("Mary Ann Lee"));
  assert(has("M A Lee"));
  assert(has("M . A . Lee"));
  assert(has("MA Lee"));
  assert(has("Lee , Mary Ann"));
  assert(has("M Lee"));
  assert(has("M . Lee"));
  assert(mary.size() == 7);

  auto mononym = AuthorVariants(Author{"", "Plato"});
  assert(mononym.size() == 1 && mononym[0] == "Plato");
}

PageText FirstPage() {
  return PageText(0, {"Deep", "Learning", "for", "NLP", "John", "Smith"}, {18, 18, 18, 18, 11, 11});
}

void TestPageText() {
  auto page = FirstPage();
  assert(page.token_count() == 6);
  assert(page.text() == U"deep learning for nlp john smith");

  auto title = page.FindAll("Deep Learning for NLP");
  assert(title.size() == 1);
  assert(title[0].cost == 0);
  assert(title[0].first_token_index == 0);
  assert(title[0].one_past_last_token_index == 4);
  assert(title[0].matched_string == "Deep Learning for NLP");
  assert(title[0].average_font_size == 18.0f);

  // One typo is within budget for a 9 letter query; the match snaps to whole tokens.
  auto typo = page.FindAll("Learnnig for");
  assert(typo.size() == 1);
  assert(typo[0].first_token_index == 1 && typo[0].one_past_last_token_index == 3);

  assert(page.FindAll("Completely unrelated words").empty());

  PageText repeated(1, {"ab", "cd", "ab", "cd"}, {1, 1, 1, 1});
  auto both = repeated.FindAll("ab cd");
  assert(both.size() == 2);
  assert(both[0].first_token_index == 0 && both[0].one_past_last_token_index == 2);
  assert(both[1].first_token_index == 2 && both[1].one_past_last_token_index == 4);
  assert(both[1].page_number == 1);
}

void TestLocateAndLabel() {
  GoldMetadata gold{"Deep Learning for NLP", {Author{"John", "Smith"}}};
  std::vector<PageText> pages;
  pages.push_back(FirstPage());
  pages.emplace_back(1, std::vector<std::string>{"Introduction", "text"}, std::vector<float>{10, 10});

  auto matches = LocateGoldMetadata(gold, pages, "doc");
  assert(matches);
  assert(matches->title.page_number == 0);
  assert(matches->authors.size() == 1);
  assert(matches->authors[0].cost == 0);
  assert(matches->authors[0].matched_string == "John Smith");

  auto labels = PageLabels(*matches, 0, 6, "doc");
  std::vector<std::int8_t> expected = {1, 1, 1, 1, 2, 2};
  assert(labels == expected);
  auto second = PageLabels(*matches, 1, 2, "doc");
  assert((second == std::vector<std::int8_t>{0, 0}));

  GoldMetadata missing_title{"Quantum Chromodynamics Today", {Author{"John", "Smith"}}};
  assert(!LocateGoldMetadata(missing_title, pages, "doc"));

  GoldMetadata missing_author{"Deep Learning for NLP", {Author{"John", "Smith"}, Author{"Zed", "Zimmerman"}}};
  assert(!LocateGoldMetadata(missing_author, pages, "doc"));

  // Authors overlapping the title keep the author label.
  DocumentMatches overlap;
  overlap.title.page_number = 0;
  overlap.title.first_token_index = 0;
  overlap.title.one_past_last_token_index = 4;
  FuzzyMatch author;
  author.page_number = 0;
  author.first_token_index = 3;
  author.one_past_last_token_index = 5;
  overlap.authors.push_back(author);
  assert((PageLabels(overlap, 0, 6, "doc") == std::vector<std::int8_t>{1, 1, 1, 2, 2, 0}));
}

void TestReferenceMetadataPath() {
  CorpusLayout layout;
  auto path = ReferenceMetadataPath("/corpus/00", layout, "abc/paper.pdf");
  assert(path == std::filesystem::path("/corpus/00/docs/abc/paper.nxml"));
  auto other = ReferenceMetadataPath("/corpus/00", layout, "abc/paper.txt");
  assert(other.filename() == "paper.txt");
}

void TestLabeledTokensFile() {
  layoutprep::testing::TempDir dir("labeler");
  const auto bucket = dir.path() / "00";
  layoutprep::testing::WriteLabelingBucket(bucket);

  CorpusLayout layout;
  auto labeled = LabeledTokensFile(bucket, layout);
  assert(std::filesystem::exists(UnlabeledTokensPath(bucket)));
  assert(labeled->path() == LabeledTokensPath(bucket));
  assert(labeled->Attribute("version") == std::string(kLabeledTokensVersion));

  auto unlabeled = UnlabeledTokensFile(bucket, layout);
  assert(unlabeled->Rows(kDocMetadataDataset) == 4);

  auto metadata = labeled->Strings(kDocMetadataDataset);
  assert(metadata.size() == 1);
  auto doc = ParseDocMetadata(metadata[0]);
  assert(doc.doc_id == layoutprep::testing::DocId('1'));
  assert(doc.doc_sha == layoutprep::testing::FakeSha('1'));
  assert(doc.gold_title && *doc.gold_title == "Deep Learning for NLP");
  assert(doc.gold_authors.size() == 1 && doc.gold_authors[0].surname == "Smith");
  assert(doc.pages.size() == 2);
  assert(doc.pages[0].first_token_index == 0 && doc.pages[0].token_count == 6);
  assert(doc.pages[1].first_token_index == 6 && doc.pages[1].token_count == 2);

  auto labels = labeled->Values<std::int8_t>(kTokenLabelsDataset);
  std::vector<std::int8_t> expected = {1, 1, 1, 1, 2, 2, 0, 0};
  assert(std::equal(labels.begin(), labels.end(), expected.begin(), expected.end()));

  auto text = labeled->Strings(kTokenTextFeaturesDataset);
  assert(text.size() == 8 * kTokenTextFeatureCount);
  assert(text[6 * kTokenTextFeatureCount] == "Introduction");
  auto numeric = labeled->Values<float>(kTokenNumericFeaturesDataset);
  assert(numeric[4] == 18.0f);

  // A second call opens the cached file.
  auto again = LabeledTokensFile(bucket, layout);
  assert(again->Rows(kTokenLabelsDataset) == 8);
}

}  // namespace

int main() {
  SetLogLevel(LogLevel::kError);
  TestParseGoldMetadata();
  TestAuthorVariants();
  TestPageText();
  TestLocateAndLabel();
  TestReferenceMetadataPath();
  TestLabeledTokensFile();
  return 0;
}
