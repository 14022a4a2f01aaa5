#include "layoutprep/corpus_reader.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <vector>

#include <lzma.h>
#include <zlib.h>

#include "layoutprep/log.hpp"

namespace layoutprep {

namespace {

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void StripCarriageReturn(std::string& line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
}

}  // namespace

InputFormat DetectInputFormat(const std::string& path) {
  if (EndsWith(path, ".gz")) return InputFormat::kGzip;
  if (EndsWith(path, ".xz")) return InputFormat::kXz;
  return InputFormat::kPlain;
}

bool CorpusReader::ForEachLine(const std::string& path, const LineFn& fn) const {
  switch (DetectInputFormat(path)) {
    case InputFormat::kGzip:
      return ReadGzLines(path, fn);
    case InputFormat::kXz:
      return ReadXzLines(path, fn);
    case InputFormat::kPlain:
      break;
  }
  return ReadTextLines(path, fn);
}

bool CorpusReader::ForEachJsonRecord(const std::string& path, const RecordFn& fn, CorpusReadStats* stats) const {
  CorpusReadStats local;
  bool ok = ForEachLine(path, [&](const std::string& line) {
    ++local.lines;
    if (line.empty()) {
      return;
    }
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      ++local.skipped;
      LogWarning("Error while reading record at " + path + ":" + std::to_string(local.lines) + "; skipping");
      return;
    }
    ++local.records;
    fn(j);
  });
  if (stats) {
    *stats = local;
  }
  return ok;
}

bool CorpusReader::ReadTextLines(const std::string& path, const LineFn& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::string line;
  while (std::getline(in, line)) {
    StripCarriageReturn(line);
    fn(line);
  }
  return true;
}

bool CorpusReader::ReadGzLines(const std::string& path, const LineFn& fn) const {
  std::unique_ptr<gzFile_s, decltype(&gzclose)> handle(gzopen(path.c_str(), "rb"), &gzclose);
  if (!handle) {
    return false;
  }
  gzFile f = handle.get();
  gzbuffer(f, 1 << 17);
  const int buf_size = 1 << 16;
  std::string buf(buf_size, '\0');
  std::string line;
  bool ok = true;
  while (true) {
    char* res = gzgets(f, buf.data(), buf_size);
    if (!res) {
      break;
    }
    line.assign(res);
    while (!line.empty() && line.back() != '\n' && !gzeof(f)) {
      res = gzgets(f, buf.data(), buf_size);
      if (!res) {
        break;
      }
      line.append(res);
    }
    StripCarriageReturn(line);
    fn(line);
  }
  int errnum = Z_OK;
  gzerror(f, &errnum);
  if (errnum != Z_OK && errnum != Z_STREAM_END) {
    ok = false;
  }
  return ok;
}

bool CorpusReader::ReadXzLines(const std::string& path, const LineFn& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }

  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
    LogError("Could not start the xz decoder for " + path);
    return false;
  }
  std::unique_ptr<lzma_stream, decltype(&lzma_end)> decoder(&strm, &lzma_end);

  std::vector<std::uint8_t> packed(1 << 16);
  std::string chunk(1 << 16, '\0');
  std::string line;
  lzma_ret ret = LZMA_OK;
  while (ret == LZMA_OK) {
    if (strm.avail_in == 0 && in) {
      in.read(reinterpret_cast<char*>(packed.data()), static_cast<std::streamsize>(packed.size()));
      strm.next_in = packed.data();
      strm.avail_in = static_cast<std::size_t>(in.gcount());
    }
    const lzma_action action = (strm.avail_in == 0 && !in) ? LZMA_FINISH : LZMA_RUN;
    strm.next_out = reinterpret_cast<std::uint8_t*>(chunk.data());
    strm.avail_out = chunk.size();
    ret = lzma_code(&strm, action);

    const std::size_t produced = chunk.size() - strm.avail_out;
    std::size_t start = 0;
    for (std::size_t pos = 0; pos < produced; ++pos) {
      if (chunk[pos] != '\n') {
        continue;
      }
      line.append(chunk, start, pos - start);
      StripCarriageReturn(line);
      fn(line);
      line.clear();
      start = pos + 1;
    }
    line.append(chunk, start, produced - start);
  }
  if (ret != LZMA_STREAM_END) {
    LogWarning("Truncated or corrupt xz stream in " + path);
    return false;
  }

  if (!line.empty()) {
    StripCarriageReturn(line);
    fn(line);
  }
  return true;
}

}  // namespace layoutprep
