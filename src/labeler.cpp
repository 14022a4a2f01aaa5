#include "layoutprep/labeler.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>

#include "layoutprep/fuzzy_match.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/text.hpp"
#include "layoutprep/token_store.hpp"

namespace layoutprep {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XPathContextPtr = std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;

const char* kTitleXPath = "/*/front/article-meta/title-group/article-title";
const char* kAuthorXPath = "/*/front/article-meta/contrib-group/contrib[@contrib-type='author']/name";

std::string InnerText(xmlNode* node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (content == nullptr) {
    return {};
  }
  std::string out(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return out;
}

// Inner texts of the children of `node` named `name`, joined by spaces, then
// retokenized.
std::string ChildText(xmlNode* node, const char* name) {
  std::string joined;
  bool first = true;
  for (xmlNode* child = node->children; child != nullptr; child = child->next) {
    if (child->type != XML_ELEMENT_NODE || !xmlStrEqual(child->name, BAD_CAST name)) {
      continue;
    }
    if (!first) {
      joined.push_back(' ');
    }
    joined += InnerText(child);
    first = false;
  }
  return RetokenizeText(joined);
}

XPathObjectPtr Evaluate(xmlXPathContext* ctx, const char* expr) {
  XPathObjectPtr result(xmlXPathEvalExpression(BAD_CAST expr, ctx), &xmlXPathFreeObject);
  if (!result) {
    throw std::runtime_error(std::string("libxml2: failed to evaluate ") + expr);
  }
  return result;
}

std::size_t NodeCount(const xmlXPathObject* result) {
  return result->nodesetval == nullptr ? 0 : static_cast<std::size_t>(result->nodesetval->nodeNr);
}

std::string Initials(const std::string& names, const std::string& space) {
  std::string out;
  bool first = true;
  for (const auto& piece : SplitWords(names)) {
    std::u32string cps = ToCodepoints(piece);
    if (!std::all_of(cps.begin(), cps.end(), [](char32_t c) { return IsWordChar(c); })) {
      continue;
    }
    if (!first) {
      out += space;
    }
    AppendUtf8(cps.front(), out);
    first = false;
  }
  return out;
}

std::size_t CodepointCount(std::string_view s) { return ToCodepoints(s).size(); }

bool TitleBetter(const FuzzyMatch& a, const FuzzyMatch& b) {
  return std::make_tuple(a.cost, -a.average_font_size, a.first_token_index) <
         std::make_tuple(b.cost, -b.average_font_size, b.first_token_index);
}

bool AuthorBetter(const FuzzyMatch& a, const FuzzyMatch& b) {
  auto key = [](const FuzzyMatch& m) {
    return std::make_tuple(m.cost, -static_cast<std::int64_t>(CodepointCount(m.matched_string)),
                           -m.average_font_size, m.first_token_index);
  };
  return key(a) < key(b);
}

}  // namespace

std::optional<GoldMetadata> ParseGoldMetadata(const std::string& xml, const std::string& doc_id) {
  XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                &xmlFreeDoc);
  if (!doc) {
    LogWarning("Could not parse reference metadata for " + doc_id + "; skipping doc");
    return std::nullopt;
  }
  XPathContextPtr ctx(xmlXPathNewContext(doc.get()), &xmlXPathFreeContext);
  if (!ctx) {
    throw std::runtime_error("libxml2: failed to create XPath context");
  }

  GoldMetadata gold;

  auto titles = Evaluate(ctx.get(), kTitleXPath);
  if (NodeCount(titles.get()) != 1) {
    LogWarning("Found " + std::to_string(NodeCount(titles.get())) + " gold titles for " + doc_id +
               "; skipping doc");
    return std::nullopt;
  }
  gold.title = TrimPunctuation(RetokenizeText(InnerText(titles->nodesetval->nodeTab[0])));
  if (CodepointCount(gold.title) <= 4) {
    LogWarning("Title '" + gold.title + "' is too short; skipping doc");
    return std::nullopt;
  }

  auto authors = Evaluate(ctx.get(), kAuthorXPath);
  const std::size_t author_node_count = NodeCount(authors.get());
  for (std::size_t i = 0; i < author_node_count; ++i) {
    xmlNode* name = authors->nodesetval->nodeTab[i];
    Author author{ChildText(name, "given-names"), ChildText(name, "surname")};
    if (author.surname.empty()) {
      LogWarning("No surnames for one of the authors; skipping author");
      continue;
    }
    gold.authors.push_back(std::move(author));
  }

  if (gold.authors.empty()) {
    LogWarning("Found no gold authors for " + doc_id + "; skipping doc");
    return std::nullopt;
  }
  if (gold.authors.size() != author_node_count) {
    LogWarning("Didn't find the expected " + std::to_string(author_node_count) + " authors in " + doc_id +
               "; skipping doc");
    return std::nullopt;
  }
  return gold;
}

std::optional<GoldMetadata> ReadGoldMetadata(const std::filesystem::path& nxml_path, const std::string& doc_id) {
  std::ifstream in(nxml_path, std::ios::binary);
  if (!in) {
    LogWarning("Could not find " + nxml_path.string() + "; skipping doc");
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseGoldMetadata(buffer.str(), doc_id);
}

std::filesystem::path ReferenceMetadataPath(const std::filesystem::path& bucket_dir, const CorpusLayout& layout,
                                            const std::string& doc_id) {
  std::string relative = doc_id;
  const std::string pdf = ".pdf";
  if (relative.size() >= pdf.size() && relative.compare(relative.size() - pdf.size(), pdf.size(), pdf) == 0) {
    relative.replace(relative.size() - pdf.size(), pdf.size(), ".nxml");
  }
  return bucket_dir / layout.docs_dir / relative;
}

std::vector<std::string> AuthorVariants(const Author& author) {
  const auto& given = author.given_names;
  const auto& sur = author.surname;
  std::set<std::string> variants;
  if (given.empty()) {
    variants.insert(sur);
  } else {
    std::string first_initial;
    AppendUtf8(ToCodepoints(given).front(), first_initial);
    variants.insert(given + " " + sur);
    variants.insert(Initials(given, " ") + " " + sur);
    variants.insert(Initials(given, " . ") + " . " + sur);
    variants.insert(Initials(given, "") + " " + sur);
    variants.insert(sur + " , " + given);
    variants.insert(first_initial + " " + sur);
    variants.insert(first_initial + " . " + sur);
  }
  return {variants.begin(), variants.end()};
}

//
// PageText
//

PageText::PageText(std::size_t page_number, std::vector<std::string> tokens, std::vector<float> font_sizes)
    : page_number_(page_number), tokens_(std::move(tokens)), font_sizes_(std::move(font_sizes)) {
  if (tokens_.size() != font_sizes_.size()) {
    throw std::invalid_argument("page tokens and font sizes differ in length");
  }
  token_starts_.reserve(tokens_.size());
  for (const auto& token : tokens_) {
    if (!token_starts_.empty()) {
      text_.push_back(U' ');
    }
    token_starts_.push_back(text_.size());
    text_ += ToCodepoints(Normalize(token));
  }
}

FuzzyMatch PageText::MakeMatch(std::size_t start, std::size_t end, std::size_t cost) const {
  FuzzyMatch match;
  match.page_number = page_number_;
  match.cost = cost;

  // Snap the start back to the token it falls in, the end forward to the next token start.
  auto first = std::upper_bound(token_starts_.begin(), token_starts_.end(), start);
  match.first_token_index =
      first == token_starts_.begin() ? 0 : static_cast<std::size_t>(first - token_starts_.begin()) - 1;
  auto last = std::lower_bound(token_starts_.begin(), token_starts_.end(), end);
  match.one_past_last_token_index = last != token_starts_.end() && *last < text_.size()
                                        ? static_cast<std::size_t>(last - token_starts_.begin())
                                        : tokens_.size();

  double font_sum = 0.0;
  for (std::size_t i = match.first_token_index; i < match.one_past_last_token_index; ++i) {
    if (i > match.first_token_index) {
      match.matched_string.push_back(' ');
    }
    match.matched_string += tokens_[i];
    font_sum += font_sizes_[i];
  }
  const std::size_t span = match.one_past_last_token_index - match.first_token_index;
  match.average_font_size = span == 0 ? 0.0f : static_cast<float>(font_sum / static_cast<double>(span));
  return match;
}

std::vector<FuzzyMatch> PageText::FindAll(std::string_view query) const {
  const std::u32string q = ToCodepoints(Normalize(query));
  const auto spaces = static_cast<std::size_t>(std::count(q.begin(), q.end(), U' '));
  const std::size_t budget = (q.size() - spaces) / 5;

  std::vector<FuzzyMatch> out;
  const std::u32string_view text(text_);
  std::size_t offset = 0;
  while (offset < text.size()) {
    auto found = FindApproximateMatch(q, text.substr(offset));
    // Costs only grow as the scan advances, so the first miss ends it.
    if (!found || found->cost > budget) {
      break;
    }
    out.push_back(MakeMatch(found->start_pos + offset, found->end_pos + offset, found->cost));
    offset += found->end_pos;
  }
  return out;
}

//
// Resolution
//

std::optional<DocumentMatches> LocateGoldMetadata(const GoldMetadata& gold, const std::vector<PageText>& pages,
                                                  const std::string& doc_id) {
  std::optional<FuzzyMatch> title;
  std::vector<std::vector<FuzzyMatch>> author_matches(gold.authors.size());
  std::vector<std::vector<std::string>> author_variants;
  author_variants.reserve(gold.authors.size());
  for (const auto& author : gold.authors) {
    author_variants.push_back(AuthorVariants(author));
  }

  for (const auto& page : pages) {
    auto title_matches = page.FindAll(gold.title);
    if (!title_matches.empty()) {
      auto best = std::min_element(title_matches.begin(), title_matches.end(), TitleBetter);
      if (!title || best->cost < title->cost) {
        title = *best;
      }
    }

    for (std::size_t a = 0; a < gold.authors.size(); ++a) {
      for (const auto& variant : author_variants[a]) {
        auto found = page.FindAll(variant);
        std::move(found.begin(), found.end(), std::back_inserter(author_matches[a]));
      }
    }
  }

  // All authors have to be on the same page.
  std::set<std::size_t> common_pages;
  for (std::size_t a = 0; a < author_matches.size(); ++a) {
    std::set<std::size_t> author_pages;
    for (const auto& m : author_matches[a]) {
      author_pages.insert(m.page_number);
    }
    if (a == 0) {
      common_pages = std::move(author_pages);
      continue;
    }
    std::set<std::size_t> both;
    std::set_intersection(common_pages.begin(), common_pages.end(), author_pages.begin(), author_pages.end(),
                          std::inserter(both, both.begin()));
    common_pages = std::move(both);
  }
  if (common_pages.empty()) {
    LogWarning("Could not find all authors on one page in " + doc_id + "; skipping doc");
    return std::nullopt;
  }
  const std::size_t author_page = *common_pages.begin();

  if (!title) {
    LogWarning("Could not find title '" + gold.title + "' in " + doc_id + "; skipping doc");
    return std::nullopt;
  }

  DocumentMatches result;
  result.title = std::move(*title);
  for (auto& matches : author_matches) {
    const FuzzyMatch* best = nullptr;
    for (const auto& m : matches) {
      if (m.page_number != author_page) {
        continue;
      }
      if (best == nullptr || AuthorBetter(m, *best)) {
        best = &m;
      }
    }
    if (best == nullptr) {
      LogWarning("Could not find all authors in " + doc_id + "; skipping doc");
      return std::nullopt;
    }
    result.authors.push_back(*best);
  }
  return result;
}

std::vector<std::int8_t> PageLabels(const DocumentMatches& matches, std::size_t page_number,
                                    std::size_t token_count, const std::string& doc_id) {
  std::vector<std::int8_t> labels(token_count, static_cast<std::int8_t>(TokenLabel::kNone));
  auto assign = [&](const FuzzyMatch& m, TokenLabel label) {
    std::size_t overwritten = 0;
    const auto value = static_cast<std::int8_t>(label);
    const std::size_t end = std::min(m.one_past_last_token_index, token_count);
    for (std::size_t i = m.first_token_index; i < end; ++i) {
      if (labels[i] != static_cast<std::int8_t>(TokenLabel::kNone) && labels[i] != value) {
        ++overwritten;
      }
      labels[i] = value;
    }
    return overwritten;
  };

  if (matches.title.page_number == page_number) {
    assign(matches.title, TokenLabel::kTitle);
  }
  std::size_t overwritten = 0;
  for (const auto& author : matches.authors) {
    if (author.page_number == page_number) {
      overwritten += assign(author, TokenLabel::kAuthor);
    }
  }
  if (overwritten > 0) {
    LogWarning("Author labels overwrote " + std::to_string(overwritten) + " title tokens on page " +
               std::to_string(page_number) + " of " + doc_id);
  }
  return labels;
}

//
// Stage artifact
//

std::filesystem::path LabeledTokensPath(const std::filesystem::path& bucket_dir) {
  return bucket_dir / ("labeled-tokens-" + std::string(kLabeledTokensVersion) + ".lpa");
}

std::shared_ptr<const Artifact> LabeledTokensFile(const std::filesystem::path& bucket_dir,
                                                  const CorpusLayout& layout) {
  const auto path = LabeledTokensPath(bucket_dir);
  if (std::filesystem::exists(path)) {
    return Artifact::Open(path);
  }

  auto unlabeled = UnlabeledTokensFile(bucket_dir, layout);
  return OpenOrBuildArtifact(path, [&](ArtifactWriter& writer) {
    writer.SetAttribute("stage", "labeled-tokens");
    writer.SetAttribute("version", std::string(kLabeledTokensVersion));
    writer.CreateDataset(kDocMetadataDataset, DType::kString, 1);
    writer.CreateDataset(kTokenTextFeaturesDataset, DType::kString, kTokenTextFeatureCount);
    writer.CreateDataset(kTokenNumericFeaturesDataset, DType::kFloat32, kTokenNumericFeatureCount);
    writer.CreateDataset(kTokenLabelsDataset, DType::kInt8, 1);

    auto unlab_metadata = unlabeled->Strings(kDocMetadataDataset);
    auto unlab_text = unlabeled->Strings(kTokenTextFeaturesDataset);
    auto unlab_numeric = unlabeled->Values<float>(kTokenNumericFeaturesDataset);

    std::size_t labeled = 0;
    for (const auto& raw_metadata : unlab_metadata) {
      DocMetadata doc = ParseDocMetadata(raw_metadata);
      LogInfo("Labeling " + doc.doc_id);

      auto gold = ReadGoldMetadata(ReferenceMetadataPath(bucket_dir, layout, doc.doc_id), doc.doc_id);
      if (!gold) {
        continue;
      }

      const std::size_t page_count = std::min(kMaxPageCount, doc.pages.size());
      std::vector<PageText> pages;
      pages.reserve(page_count);
      for (std::size_t p = 0; p < page_count; ++p) {
        const auto& page = doc.pages[p];
        std::vector<std::string> tokens;
        std::vector<float> font_sizes;
        tokens.reserve(page.token_count);
        font_sizes.reserve(page.token_count);
        for (std::uint64_t t = page.first_token_index; t < page.first_token_index + page.token_count; ++t) {
          tokens.push_back(unlab_text[t * kTokenTextFeatureCount]);
          font_sizes.push_back(unlab_numeric[t * kTokenNumericFeatureCount + 4]);
        }
        pages.emplace_back(p, std::move(tokens), std::move(font_sizes));
      }

      auto matches = LocateGoldMetadata(*gold, pages, doc.doc_id);
      if (!matches) {
        continue;
      }

      // Point of no return: the document goes into the labeled artifact.
      DocMetadata out;
      out.doc_id = doc.doc_id;
      out.doc_sha = doc.doc_sha;
      out.gold_title = gold->title;
      out.gold_authors = gold->authors;
      for (std::size_t p = 0; p < page_count; ++p) {
        const auto& page = doc.pages[p];
        PageMetadata out_page = page;
        out_page.first_token_index = writer.Rows(kTokenTextFeaturesDataset);
        out.pages.push_back(out_page);

        const auto first = static_cast<std::size_t>(page.first_token_index);
        const auto count = static_cast<std::size_t>(page.token_count);
        writer.AppendStrings(kTokenTextFeaturesDataset,
                             unlab_text.subspan(first * kTokenTextFeatureCount, count * kTokenTextFeatureCount));
        writer.Append<float>(kTokenNumericFeaturesDataset, unlab_numeric.subspan(first * kTokenNumericFeatureCount,
                                                                                 count * kTokenNumericFeatureCount));
        auto labels = PageLabels(*matches, p, count, doc.doc_id);
        writer.Append<std::int8_t>(kTokenLabelsDataset, labels);
      }
      std::vector<std::string> metadata{SerializeDocMetadata(out)};
      writer.AppendStrings(kDocMetadataDataset, metadata);
      ++labeled;
    }
    LogInfo("labeled " + std::to_string(labeled) + " of " + std::to_string(unlab_metadata.size()) +
            " documents in " + bucket_dir.string());
  });
}

}  // namespace layoutprep
