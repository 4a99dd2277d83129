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

#include "basics/logger/logger.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "basics/assert.h"
#include "basics/string_utils.h"

namespace rex {

LogTopic Logger::CACHE("cache");
LogTopic Logger::FIXME("general", LogLevel::INFO);
LogTopic Logger::REGEX("regex");

namespace log {
namespace {

std::atomic<LogLevel> gLevel{LogLevel::INFO};
std::atomic<bool> gShowIds{true};
std::atomic<bool> gShowLineNumber{false};

absl::Mutex gOutputMutex;

constexpr std::array<LogTopic*, 3> kTopics{&Logger::CACHE, &Logger::FIXME,
                                           &Logger::REGEX};

std::string_view ShortFileName(std::string_view file) noexcept {
  const auto pos = file.find_last_of('/');
  return pos == std::string_view::npos ? file : file.substr(pos + 1);
}

}  // namespace

LogLevel GetLogLevel() noexcept {
  return gLevel.load(std::memory_order_relaxed);
}

void SetLogLevel(LogLevel level) noexcept {
  gLevel.store(level, std::memory_order_relaxed);
}

void SetLogLevel(std::string_view name, LogLevel level) noexcept {
  if (name == LogTopic::kAll) {
    for (auto* topic : kTopics) {
      topic->SetLevel(level);
    }
    return;
  }
  if (auto* topic = FindTopic(name)) {
    topic->SetLevel(level);
  }
}

void SetLogLevel(std::string_view spec) {
  const std::string lowered =
    absl::AsciiStrToLower(absl::StripAsciiWhitespace(basics::AsAbsl(spec)));
  const std::vector<std::string> parts =
    absl::StrSplit(lowered, absl::MaxSplits('=', 1));

  LogLevel level;
  if (parts.size() == 1) {
    if (!TranslateLogLevel(parts[0], true, level)) {
      REX_WARN("a4c10", Logger::FIXME, "unknown log level '", parts[0], "'");
      return;
    }
    SetLogLevel(level);
    return;
  }

  if (!TranslateLogLevel(parts[1], false, level)) {
    REX_WARN("a4c11", Logger::FIXME, "unknown log level '", parts[1],
             "' for topic '", parts[0], "'");
    return;
  }
  if (parts[0] != LogTopic::kAll && FindTopic(parts[0]) == nullptr) {
    REX_WARN("a4c12", Logger::FIXME, "unknown log topic '", parts[0], "'");
    return;
  }
  SetLogLevel(std::string_view{parts[0]}, level);
}

void SetShowIds(bool show) { gShowIds.store(show, std::memory_order_relaxed); }

void SetShowLineNumber(bool show) {
  gShowLineNumber.store(show, std::memory_order_relaxed);
}

void Log(const char* logid, const char* function, const char* file, int line,
         LogLevel level, const LogTopic& topic, std::string_view message) {
  using basics::AsAbsl;

  std::string out = absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::Now(),
                                     absl::UTCTimeZone());
  absl::StrAppend(&out, " ", AsAbsl(TranslateLogLevel(level)), " {",
                  AsAbsl(topic.GetName()), "}");
  if (gShowIds.load(std::memory_order_relaxed) && logid != nullptr) {
    absl::StrAppend(&out, " [", logid, "]");
  }
  if (gShowLineNumber.load(std::memory_order_relaxed)) {
    absl::StrAppend(&out, " ", AsAbsl(ShortFileName(file)), ":", line, " ",
                    function);
  }
  absl::StrAppend(&out, " ", AsAbsl(message), "\n");

  absl::MutexLock lock{&gOutputMutex};
  std::fwrite(out.data(), 1, out.size(), stderr);
}

void Initialize() {
  const char* env = std::getenv("REXILE_LOG_LEVEL");
  if (env == nullptr) {
    return;
  }
  for (absl::string_view level :
       absl::StrSplit(env, ',', absl::SkipEmpty())) {
    SetLogLevel(basics::AsStd(level));
  }
}

void Flush() noexcept {
  absl::MutexLock lock{&gOutputMutex};
  std::fflush(stderr);
}

std::vector<LogTopic*> GetTopics() { return {kTopics.begin(), kTopics.end()}; }

LogTopic* FindTopic(std::string_view name) noexcept {
  for (auto* topic : kTopics) {
    if (topic->GetName() == name) {
      return topic;
    }
  }
  return nullptr;
}

}  // namespace log

void FatalErrorExit() noexcept {
  log::Flush();
  std::abort();
}

namespace detail {

void AssertionFailed(std::string_view expr, std::source_location location,
                     std::string_view message) noexcept {
  log::Log("fa11d", location.function_name(), location.file_name(),
           static_cast<int>(location.line()), LogLevel::FATAL, Logger::FIXME,
           absl::StrCat("assertion failed: ", basics::AsAbsl(expr),
                        message.empty() ? "" : ": ", basics::AsAbsl(message)));
  FatalErrorExit();
}

}  // namespace detail
}  // namespace rex
