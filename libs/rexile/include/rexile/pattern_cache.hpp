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

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include <optional>
#include <string>
#include <string_view>

#include "rexile/error.hpp"
#include "rexile/matcher/captures.hpp"
#include "rexile/pattern.hpp"

namespace rex {

// Compiled patterns keyed by their source. Entries are never evicted,
// failed compilations are not remembered.
class PatternCache {
 public:
  explicit PatternCache(PatternOptions options = {}) noexcept
    : _options{options} {}

  PatternCache(const PatternCache&) = delete;
  PatternCache& operator=(const PatternCache&) = delete;

  // Process wide instance used by the free functions below.
  static PatternCache& Global();

  Expected<Pattern> Get(std::string_view source);

  size_t Size() const;
  void Clear();

 private:
  std::optional<Pattern> Lookup(std::string_view source) const;

  const PatternOptions _options;
  mutable absl::Mutex _mutex;
  absl::flat_hash_map<std::string, Pattern> _patterns ABSL_GUARDED_BY(_mutex);
};

Expected<Pattern> GetPattern(std::string_view source, PatternCache& cache);
Expected<bool> IsMatch(std::string_view pattern, std::string_view text,
                       PatternCache& cache);
Expected<std::optional<Span>> Find(std::string_view pattern,
                                   std::string_view text, PatternCache& cache);

inline Expected<Pattern> GetPattern(std::string_view source) {
  return GetPattern(source, PatternCache::Global());
}
inline Expected<bool> IsMatch(std::string_view pattern,
                              std::string_view text) {
  return IsMatch(pattern, text, PatternCache::Global());
}
inline Expected<std::optional<Span>> Find(std::string_view pattern,
                                          std::string_view text) {
  return Find(pattern, text, PatternCache::Global());
}

}  // namespace rex
