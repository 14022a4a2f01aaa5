#include <cassert>
#include <string>

#include "layoutprep/settings.hpp"
#include "test_support.hpp"

int main() {
  using namespace layoutprep;
  SetLogLevel(LogLevel::kSilent);

  testing::TempDir dir("settings");
  const auto env_path = dir.path() / ".env";
  testing::WriteTextFile(env_path,
                         "\xEF\xBB\xBF# corpus settings\r\n"
                         "CORPUS_DIR = \"/data/corpus\"\r\n"
                         "MIN_TOKEN_FREQ=5\n"
                         "FONT_HASH_SIZE=lots\n"
                         "MAX_PAGE_NUMBER='2'\n"
                         "not a setting\n"
                         "LOG_LEVEL=warning\n");

  auto env = ReadEnvFile(env_path.string());
  assert(env.at("CORPUS_DIR") == "/data/corpus");
  assert(env.at("MAX_PAGE_NUMBER") == "2");
  assert(env.count("not a setting") == 0);

  Config cfg;
  ApplyEnvOverrides(cfg, env);
  assert(cfg.corpus_dir == "/data/corpus");
  assert(cfg.model.minimum_token_frequency == 5);
  assert(cfg.model.font_hash_size == 1024);
  assert(cfg.model.max_page_number == 2);
  assert(cfg.model.EffectivePageCount() == 2);
  assert(cfg.log_level == LogLevel::kWarning);
  assert(cfg.model.glove_vectors == "glove.6B.100d.txt.gz");

  cfg.model.max_page_number = 10;
  assert(cfg.model.EffectivePageCount() == kMaxPageCount);

  Config zero_hash;
  ApplyEnvOverrides(zero_hash, {{"FONT_HASH_SIZE", "0"}});
  assert(zero_hash.model.font_hash_size == 1024);
  ApplyEnvOverrides(zero_hash, {{"FONT_HASH_SIZE", "64"}});
  assert(zero_hash.model.font_hash_size == 64);

  assert(ReadEnvFile((dir.path() / "missing.env").string()).empty());
  assert(ParseLogLevel("bogus", LogLevel::kError) == LogLevel::kError);
  return 0;
}
