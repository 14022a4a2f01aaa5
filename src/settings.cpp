#include "layoutprep/settings.hpp"

#include <cctype>
#include <charconv>
#include <fstream>

namespace layoutprep {

namespace {

std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::size_t ParseSize(const std::string& s, std::size_t def_val) {
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    LogWarning("ignoring non-numeric setting value: " + s);
    return def_val;
  }
  return value;
}

}  // namespace

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path) {
  std::unordered_map<std::string, std::string> env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const std::unordered_map<std::string, std::string>& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    if (it == env.end()) {
      return nullptr;
    }
    return &it->second;
  };
  if (auto v = get("CORPUS_DIR")) cfg.corpus_dir = *v;
  if (auto v = get("TOKEN_STATS")) cfg.token_stats = *v;
  if (auto v = get("GLOVE_VECTORS")) cfg.model.glove_vectors = *v;
  if (auto v = get("MAX_PAGE_NUMBER")) cfg.model.max_page_number = ParseSize(*v, cfg.model.max_page_number);
  if (auto v = get("FONT_HASH_SIZE")) {
    const std::size_t size = ParseSize(*v, cfg.model.font_hash_size);
    if (size == 0) {
      LogWarning("FONT_HASH_SIZE must be positive, keeping " + std::to_string(cfg.model.font_hash_size));
    } else {
      cfg.model.font_hash_size = size;
    }
  }
  if (auto v = get("MIN_TOKEN_FREQ")) {
    cfg.model.minimum_token_frequency = ParseSize(*v, cfg.model.minimum_token_frequency);
  }
  if (auto v = get("TOKEN_DUMP")) cfg.layout.token_dump = *v;
  if (auto v = get("DOCS_DIR")) cfg.layout.docs_dir = *v;
  if (auto v = get("VISION_OUTPUT")) cfg.layout.vision_output = *v;
  if (auto v = get("LOG_LEVEL")) cfg.log_level = ParseLogLevel(*v, cfg.log_level);
}

}  // namespace layoutprep
