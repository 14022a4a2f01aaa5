#pragma once

#include <string>

namespace layoutprep {

enum class LogLevel {
  kInfo = 0,
  kWarning,
  kError,
  kSilent
};

void SetLogLevel(LogLevel level);
[[nodiscard]] LogLevel GetLogLevel();

// Parses "info", "warning", "error" or "silent". Unknown values yield def_val.
[[nodiscard]] LogLevel ParseLogLevel(const std::string& value, LogLevel def_val);

void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);

}  // namespace layoutprep
