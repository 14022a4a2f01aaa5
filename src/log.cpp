#include "layoutprep/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace layoutprep {

namespace {

LogLevel g_level = LogLevel::kInfo;
std::mutex g_print_mu;

std::string NowString() {
  auto now = std::chrono::system_clock::now();
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

void Emit(LogLevel level, const char* tag, const std::string& message) {
  if (level < g_level) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_print_mu);
  std::cerr << NowString() << ' ' << tag << ' ' << message << '\n';
}

}  // namespace

void SetLogLevel(LogLevel level) { g_level = level; }

LogLevel GetLogLevel() { return g_level; }

LogLevel ParseLogLevel(const std::string& value, LogLevel def_val) {
  std::string v = value;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "info" || v == "debug") return LogLevel::kInfo;
  if (v == "warning" || v == "warn") return LogLevel::kWarning;
  if (v == "error") return LogLevel::kError;
  if (v == "silent" || v == "quiet" || v == "off") return LogLevel::kSilent;
  return def_val;
}

void LogInfo(const std::string& message) { Emit(LogLevel::kInfo, "INFO", message); }

void LogWarning(const std::string& message) { Emit(LogLevel::kWarning, "WARNING", message); }

void LogError(const std::string& message) { Emit(LogLevel::kError, "ERROR", message); }

}  // namespace layoutprep
