#pragma once

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace hopmap::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

namespace detail {

struct LevelName {
  std::string_view name;
  LogLevel level;
};

// Accepted `--log-level` spellings. The first entry per level is canonical.
inline constexpr std::array<LevelName, 5> kLevelNames = {{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace detail

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }
  for (const auto& entry : detail::kLevelNames) {
    if (detail::EqualsIgnoreCase(raw, entry.name)) {
      level = entry.level;
      return true;
    }
  }
  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// One line per event on an output stream (stderr unless told otherwise):
//
//   ts_utc=<ISO-8601> level=<LEVEL> target="<host>" msg="<text>" key="value"...
//
// `target` is the probe target the command is working on, `-` when the
// command spans several. Values are always quoted and escaped, so a hostname
// with spaces or quotes cannot break the key=value framing.
class Logger {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetTarget(std::string target) {
    target_ = target.empty() ? std::string("-") : std::move(target);
  }

  const std::string& Target() const {
    return target_;
  }

  // Replaces the wall clock used for `ts_utc`; tests pin it for exact output.
  void SetClock(Clock clock) {
    clock_ = std::move(clock);
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    const auto now = clock_ ? clock_() : std::chrono::system_clock::now();
    std::string line = "ts_utc=" + FormatUtcTimestamp(now) + " level=" + ToString(level);
    AppendField(line, "target", target_);
    AppendField(line, "msg", message);
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line.push_back('\n');

    (*out_) << line;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line.append(key);
    line += "=\"";
    line += EscapeJson(value);
    line.push_back('"');
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string target_ = "-";
  Clock clock_;
};

} // namespace hopmap::core::logging
