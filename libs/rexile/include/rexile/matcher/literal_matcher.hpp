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

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rexile/engine/aho_corasick.hpp"
#include "rexile/matcher/captures.hpp"

namespace rex {

// Matches a fixed set of literals, a single needle is searched directly,
// several go through an Aho-Corasick automaton.
class LiteralMatcher {
 public:
  // literals must be non-empty strings
  explicit LiteralMatcher(std::vector<std::string> literals);

  std::optional<Span> FindAt(std::string_view text, size_t from) const;
  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }

  size_t LiteralCount() const noexcept;

 private:
  std::variant<std::string, AhoCorasick> _searcher;
};

}  // namespace rex
