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

#include "literal_matcher.hpp"

#include "basics/assert.h"

namespace rex {
namespace {

std::variant<std::string, AhoCorasick> MakeSearcher(
  std::vector<std::string> literals) {
  REX_ASSERT(!literals.empty());
  if (literals.size() == 1) {
    return std::move(literals[0]);
  }
  return AhoCorasick{std::move(literals)};
}

}  // namespace

LiteralMatcher::LiteralMatcher(std::vector<std::string> literals)
  : _searcher{MakeSearcher(std::move(literals))} {}

std::optional<Span> LiteralMatcher::FindAt(std::string_view text,
                                           size_t from) const {
  if (from > text.size()) {
    return std::nullopt;
  }
  if (const auto* needle = std::get_if<std::string>(&_searcher)) {
    const size_t pos = text.find(*needle, from);
    if (pos == std::string_view::npos) {
      return std::nullopt;
    }
    return Span{pos, pos + needle->size()};
  }
  const auto match = std::get<AhoCorasick>(_searcher).FindAt(text, from);
  if (!match) {
    return std::nullopt;
  }
  return Span{match->start, match->end};
}

size_t LiteralMatcher::LiteralCount() const noexcept {
  if (std::holds_alternative<std::string>(_searcher)) {
    return 1;
  }
  return std::get<AhoCorasick>(_searcher).Patterns().size();
}

}  // namespace rex
