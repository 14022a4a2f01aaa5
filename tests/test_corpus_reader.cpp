#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <lzma.h>

#include "layoutprep/corpus_reader.hpp"
#include "layoutprep/log.hpp"
#include "test_support.hpp"

namespace {

std::vector<std::uint8_t> XzCompress(const std::string& content) {
  std::vector<std::uint8_t> out(lzma_stream_buffer_bound(content.size()));
  std::size_t out_pos = 0;
  lzma_ret ret = lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                         reinterpret_cast<const std::uint8_t*>(content.data()), content.size(),
                                         out.data(), &out_pos, out.size());
  if (ret != LZMA_OK) {
    throw std::runtime_error("xz encode failed");
  }
  out.resize(out_pos);
  return out;
}

void WriteBytes(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
  layoutprep::testing::WriteTextFile(path, std::string(bytes.begin(), bytes.end()));
}

std::vector<std::string> ReadAll(const std::string& path, bool* ok) {
  std::vector<std::string> lines;
  *ok = layoutprep::CorpusReader().ForEachLine(path, [&](const std::string& line) { lines.push_back(line); });
  return lines;
}

}  // namespace

int main() {
  using namespace layoutprep;
  SetLogLevel(LogLevel::kSilent);
  testing::TempDir dir("corpus_reader");

  const std::string small = "first\r\nsecond\n\nlast without newline";
  const std::vector<std::string> expected = {"first", "second", "", "last without newline"};

  testing::WriteTextFile(dir.path() / "plain.txt", small);
  testing::WriteGzFile(dir.path() / "lines.gz", small);
  WriteBytes(dir.path() / "lines.xz", XzCompress(small));
  for (const char* name : {"plain.txt", "lines.gz", "lines.xz"}) {
    bool ok = false;
    auto lines = ReadAll((dir.path() / name).string(), &ok);
    assert(ok);
    assert(lines == expected);
  }

  // Lines crossing decoder output chunks come back whole.
  std::string big;
  std::vector<std::string> big_expected;
  for (int i = 0; i < 20000; ++i) {
    big_expected.push_back("line " + std::to_string(i) + " " + std::string(static_cast<std::size_t>(i % 37), 'x'));
    big += big_expected.back() + "\n";
  }
  WriteBytes(dir.path() / "big.xz", XzCompress(big));
  {
    bool ok = false;
    auto lines = ReadAll((dir.path() / "big.xz").string(), &ok);
    assert(ok);
    assert(lines == big_expected);
  }

  // Two concatenated xz streams read as one file.
  auto joined = XzCompress("a\nb\n");
  auto tail = XzCompress("c\n");
  joined.insert(joined.end(), tail.begin(), tail.end());
  WriteBytes(dir.path() / "joined.xz", joined);
  {
    bool ok = false;
    auto lines = ReadAll((dir.path() / "joined.xz").string(), &ok);
    assert(ok);
    assert((lines == std::vector<std::string>{"a", "b", "c"}));
  }

  auto cut = XzCompress(big);
  cut.resize(cut.size() / 2);
  WriteBytes(dir.path() / "cut.xz", cut);
  {
    bool ok = true;
    ReadAll((dir.path() / "cut.xz").string(), &ok);
    assert(!ok);
  }
  {
    bool ok = true;
    ReadAll((dir.path() / "missing.xz").string(), &ok);
    assert(!ok);
  }

  testing::WriteTextFile(dir.path() / "records.jsonl", "{\"id\": 1}\nnot json\n\n{\"id\": 2}\n");
  std::vector<int> ids;
  CorpusReadStats stats;
  bool ok = CorpusReader().ForEachJsonRecord(
      (dir.path() / "records.jsonl").string(), [&](const nlohmann::json& j) { ids.push_back(j.at("id").get<int>()); },
      &stats);
  assert(ok);
  assert((ids == std::vector<int>{1, 2}));
  assert(stats.lines == 4 && stats.records == 2 && stats.skipped == 1);
  return 0;
}
