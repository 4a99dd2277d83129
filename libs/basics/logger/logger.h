////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2025 SereneDB GmbH, Berlin, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is SereneDB GmbH, Berlin, Germany
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <absl/strings/str_cat.h>

#include <atomic>
#include <source_location>
#include <string_view>
#include <vector>

#include "basics/application-exit.h"
#include "basics/logger/log_level.h"
#include "basics/string_utils.h"

namespace rex {

class LogTopic final {
 public:
  // pseudo topic to address all log topics
  static inline constexpr std::string_view kAll = "all";

  explicit LogTopic(std::string_view name,
                    LogLevel level = LogLevel::DEFAULT) noexcept
    : _name{name}, _level{level} {}

  std::string_view GetName() const { return _name; }
  LogLevel GetLevel() const noexcept {
    return _level.load(std::memory_order_relaxed);
  }
  void SetLevel(LogLevel level) noexcept {
    _level.store(level, std::memory_order_relaxed);
  }

 private:
  std::string_view _name;
  std::atomic<LogLevel> _level;
};

struct Logger {
  // NOLINTBEGIN
  static LogTopic CACHE;
  static LogTopic FIXME;
  static LogTopic REGEX;
  // NOLINTEND
};

namespace log {

LogLevel GetLogLevel() noexcept;
void SetLogLevel(LogLevel) noexcept;
// accepts "level" for the general level or "topic=level"
void SetLogLevel(std::string_view);

template<typename C>
void SetLogLevels(const C& levels) {
  for (const auto& level : levels) {
    SetLogLevel(level);
  }
}

void SetShowIds(bool);
void SetShowLineNumber(bool);

void Log(const char* logid, const char* function, const char* file, int line,
         LogLevel level, const LogTopic& topic, std::string_view message);

inline bool IsEnabled(LogLevel level) noexcept {
  return level <= GetLogLevel();
}

inline bool IsEnabled(LogLevel level, const LogTopic& topic) noexcept {
  const auto topic_level = topic.GetLevel();
  return level <=
         ((topic_level == LogLevel::DEFAULT) ? GetLogLevel() : topic_level);
}

// reads REXILE_LOG_LEVEL, a comma separated list of levels
void Initialize();
void Flush() noexcept;

std::vector<LogTopic*> GetTopics();
void SetLogLevel(std::string_view name, LogLevel level) noexcept;
LogTopic* FindTopic(std::string_view name) noexcept;

constexpr bool TranslateLogLevel(std::string_view l, bool is_general,
                                 LogLevel& level) noexcept {
  if (l == "fatal") {
    level = LogLevel::FATAL;
  } else if (l == "error" || l == "err") {
    level = LogLevel::ERR;
  } else if (l == "warning" || l == "warn") {
    level = LogLevel::WARN;
  } else if (l == "info") {
    level = LogLevel::INFO;
  } else if (l == "debug") {
    level = LogLevel::DEBUG;
  } else if (l == "trace") {
    level = LogLevel::TRACE;
  } else if (!is_general && (l.empty() || l == "default")) {
    level = LogLevel::DEFAULT;
  } else {
    return false;
  }

  return true;
}

constexpr std::string_view TranslateLogLevel(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::ERR:
      return "ERROR";
    case LogLevel::WARN:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::FATAL:
      return "FATAL";
    case LogLevel::DEFAULT:
      return "DEFAULT";
  }
  return "UNKNOWN";
}

namespace detail {

template<typename... Args>
void Log(std::source_location location, const char* id, LogLevel level,
         const LogTopic& topic, const Args&... args) {
  log::Log(id, location.function_name(), location.file_name(), location.line(),
           level, topic, absl::StrCat(basics::AsAbsl(args)...));
}

}  // namespace detail
}  // namespace log
}  // namespace rex

#define REX_LOG_IF(id, level, topic, cond, ...)                           \
  if (::rex::log::IsEnabled((::rex::LogLevel::level), (topic)) && (cond)) \
  ::rex::log::detail::Log(std::source_location::current(), (id),          \
                          (::rex::LogLevel::level), (topic), __VA_ARGS__)

#define REX_LOG(id, level, topic, ...) \
  REX_LOG_IF(id, level, topic, true, __VA_ARGS__)

#define REX_TRACE(id, topic, ...) REX_LOG(id, TRACE, topic, __VA_ARGS__)
#define REX_DEBUG(id, topic, ...) REX_LOG(id, DEBUG, topic, __VA_ARGS__)
#define REX_INFO(id, topic, ...) REX_LOG(id, INFO, topic, __VA_ARGS__)
#define REX_WARN(id, topic, ...) REX_LOG(id, WARN, topic, __VA_ARGS__)
#define REX_ERROR(id, topic, ...) REX_LOG(id, ERR, topic, __VA_ARGS__)
#define REX_FATAL(id, topic, ...)         \
  REX_LOG(id, FATAL, topic, __VA_ARGS__); \
  ::rex::FatalErrorExit()

#define REX_TRACE_IF(id, topic, cond, ...) \
  REX_LOG_IF(id, TRACE, topic, cond, __VA_ARGS__)
#define REX_DEBUG_IF(id, topic, cond, ...) \
  REX_LOG_IF(id, DEBUG, topic, cond, __VA_ARGS__)
#define REX_WARN_IF(id, topic, cond, ...) \
  REX_LOG_IF(id, WARN, topic, cond, __VA_ARGS__)

#ifdef REX_DEV
#define REX_PRINT_LEVEL ERR
#else
#define REX_PRINT_LEVEL TRACE
#endif

#define REX_PRINT(...)                                               \
  REX_LOG("xxxxx", REX_PRINT_LEVEL, ::rex::Logger::FIXME, "###### ", \
          __VA_ARGS__)
