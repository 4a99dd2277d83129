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

#include "pattern_cache.hpp"

#include <utility>

#include "basics/logger/logger.h"
#include "basics/string_utils.h"

namespace rex {

PatternCache& PatternCache::Global() {
  static PatternCache gInstance;
  return gInstance;
}

std::optional<Pattern> PatternCache::Lookup(std::string_view source) const {
  absl::ReaderMutexLock lock{&_mutex};
  if (const auto it = _patterns.find(basics::AsAbsl(source));
      it != _patterns.end()) {
    return it->second;
  }
  return std::nullopt;
}

Expected<Pattern> PatternCache::Get(std::string_view source) {
  if (auto pattern = Lookup(source)) {
    return std::move(*pattern);
  }

  REX_TRACE("7e610", Logger::CACHE, "pattern cache miss for '", source, "'");
  auto compiled = Pattern::New(source, _options);
  if (!compiled) {
    return compiled;
  }

  absl::MutexLock lock{&_mutex};
  // a concurrent miss may have inserted first, its pattern is kept
  const auto it = _patterns.lazy_emplace(
    basics::AsAbsl(source), [&](const auto& map_ctor) {
      map_ctor(std::string{source}, std::move(*compiled));
    });
  return it->second;
}

size_t PatternCache::Size() const {
  absl::ReaderMutexLock lock{&_mutex};
  return _patterns.size();
}

void PatternCache::Clear() {
  absl::MutexLock lock{&_mutex};
  _patterns.clear();
}

Expected<Pattern> GetPattern(std::string_view source, PatternCache& cache) {
  return cache.Get(source);
}

Expected<bool> IsMatch(std::string_view pattern, std::string_view text,
                       PatternCache& cache) {
  auto compiled = cache.Get(pattern);
  if (!compiled) return std::unexpected(compiled.error());
  return compiled->IsMatch(text);
}

Expected<std::optional<Span>> Find(std::string_view pattern,
                                   std::string_view text, PatternCache& cache) {
  auto compiled = cache.Get(pattern);
  if (!compiled) return std::unexpected(compiled.error());
  return compiled->Find(text);
}

}  // namespace rex
