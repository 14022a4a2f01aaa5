#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "test_support.hpp"

namespace layoutprep::testing {

// 40 hex characters ending in `tag`.
inline std::string FakeSha(char tag) { return std::string(39, 'a') + tag; }

struct TokenSpec {
  std::string text;
  float left;
  float top;
  float font_size = 10.0f;
  std::string font = "Times-Roman";
};

// Tokens laid out on one line each, 10 units wide and 10 high.
inline nlohmann::json MakePage(const std::vector<TokenSpec>& tokens, float width = 600.0f,
                               float height = 800.0f) {
  nlohmann::json page;
  page["width"] = width;
  page["height"] = height;
  page["tokens"] = nlohmann::json::array();
  for (const auto& t : tokens) {
    page["tokens"].push_back({{"text", t.text},
                              {"font", t.font},
                              {"left", t.left},
                              {"right", t.left + 10.0f},
                              {"top", t.top},
                              {"bottom", t.top + 10.0f},
                              {"fontSize", t.font_size},
                              {"fontSpaceWidth", t.font_size / 4.0f}});
  }
  return page;
}

// Consecutive words along one line starting at (left, top).
inline std::vector<TokenSpec> Line(const std::vector<std::string>& words, float top, float font_size,
                                   float left = 50.0f) {
  std::vector<TokenSpec> out;
  for (const auto& w : words) {
    out.push_back(TokenSpec{w, left, top, font_size});
    left += 20.0f;
  }
  return out;
}

inline std::vector<TokenSpec> Concat(std::vector<TokenSpec> a, const std::vector<TokenSpec>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

inline nlohmann::json MakeRecord(const std::string& doc_id, std::vector<nlohmann::json> pages) {
  nlohmann::json record;
  record["docId"] = doc_id;
  record["pages"] = std::move(pages);
  return record;
}

inline std::string JatsXml(const std::string& title, const std::vector<std::pair<std::string, std::string>>& authors) {
  std::string xml =
      "<?xml version=\"1.0\"?>\n<article><front><article-meta>"
      "<title-group><article-title>" +
      title + "</article-title></title-group><contrib-group>";
  for (const auto& [given, surname] : authors) {
    xml += "<contrib contrib-type=\"author\"><name>";
    if (!surname.empty()) {
      xml += "<surname>" + surname + "</surname>";
    }
    if (!given.empty()) {
      xml += "<given-names>" + given + "</given-names>";
    }
    xml += "</name></contrib>";
  }
  xml += "</contrib-group></article-meta></front><body/></article>\n";
  return xml;
}

// Writes the token dump of a bucket; `extra_lines` are appended verbatim.
inline void WriteTokenDump(const std::filesystem::path& bucket_dir, const std::vector<nlohmann::json>& records,
                           const std::vector<std::string>& extra_lines = {}) {
  std::string content;
  for (const auto& r : records) {
    content += r.dump() + "\n";
  }
  for (const auto& line : extra_lines) {
    content += line + "\n";
  }
  WriteGzFile(bucket_dir / "tokens.jsonl.gz", content);
}

// "<sha>/paper.pdf" for FakeSha(tag).
inline std::string DocId(char tag) { return FakeSha(tag) + "/paper.pdf"; }

inline void WriteNxml(const std::filesystem::path& bucket_dir, char tag, const std::string& xml) {
  WriteTextFile(bucket_dir / "docs" / FakeSha(tag) / "paper.nxml", xml);
}

// A bucket with one labelable document (tag '1') and several that are not.
inline void WriteLabelingBucket(const std::filesystem::path& bucket_dir) {
  auto good_first = MakePage(Concat(Line({"Deep", "Learning", "for", "NLP"}, 100.0f, 18.0f),
                                    Line({"John", "Smith"}, 140.0f, 11.0f)));
  auto good_second = MakePage(Line({"Introduction", "text"}, 100.0f, 10.0f));
  auto no_authors = MakePage(Line({"Graph", "Methods", "Revisited"}, 100.0f, 18.0f));
  auto wrong_title = MakePage(Concat(Line({"Something", "else", "entirely"}, 100.0f, 18.0f),
                                     Line({"Jane", "Doe"}, 140.0f, 11.0f)));
  auto no_nxml = MakePage(Line({"Orphan", "Paper"}, 100.0f, 18.0f));

  WriteTokenDump(bucket_dir,
                 {MakeRecord("s3://corpus/" + DocId('1'), {good_first, good_second}),
                  MakeRecord(DocId('2'), {no_authors}), MakeRecord(DocId('3'), {wrong_title}),
                  MakeRecord(DocId('4'), {no_nxml})},
                 {"this line is not json"});

  WriteNxml(bucket_dir, '1', JatsXml("Deep Learning for NLP.", {{"John", "Smith"}}));
  WriteNxml(bucket_dir, '2', JatsXml("Graph Methods Revisited", {}));
  WriteNxml(bucket_dir, '3', JatsXml("Quantum Chromodynamics Today", {{"Jane", "Doe"}}));
}

}  // namespace layoutprep::testing
