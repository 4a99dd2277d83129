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

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rexile/matcher/captures.hpp"
#include "rexile/parser/ast.hpp"

namespace rex {

// One position of a flat sequence: a character set repeated between min
// and max times. Literal strings are split into single character
// elements.
struct SequenceElement {
  bool IsVariable() const noexcept { return min != max; }
  bool IsNullable() const noexcept { return min == 0; }

  CharClass set;
  uint32_t min = 1;
  uint32_t max = 1;
};

// Linear pattern made only of characters, classes and greedy quantifiers
// over them, optionally anchored at either end.
class Sequence {
 public:
  // Flattens the tree if it has the required shape.
  static std::optional<Sequence> FromAst(const Ast& root);

  // True if no greedy variable element can consume a character the rest
  // of the sequence could start with. Greedy scanning without
  // backtracking is exact for such sequences.
  bool IsDeterministic() const;

  // Greedy-then-validate scan anchored at pos, returns the match end.
  std::optional<size_t> MatchAt(std::string_view text, size_t pos) const;

  // Union of the sets that may consume the first character of a match.
  CharClass FirstSet() const;
  bool IsNullable() const;

  // Bytes of the leading run of single character elements.
  std::string LiteralPrefix() const;
  // Bytes of the single character elements following a leading repeated
  // class, empty if the sequence has another shape.
  std::string InnerLiteral() const;

  const std::vector<SequenceElement>& Elements() const noexcept {
    return _elements;
  }
  bool AnchoredStart() const noexcept { return _anchored_start; }
  bool AnchoredEnd() const noexcept { return _anchored_end; }

 private:
  std::vector<SequenceElement> _elements;
  bool _anchored_start = false;
  bool _anchored_end = false;
};

// Searches with a deterministic Sequence in one pass. Every start position
// opens a greedy run, runs meeting in the same state are merged into the
// one that started first, so the work per character is bounded by the
// number of states. A literal prefix selects the start positions, an
// inner literal rejects texts without it.
class SequenceMatcher {
 public:
  explicit SequenceMatcher(Sequence sequence);

  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }
  std::optional<Span> FindAt(std::string_view text, size_t from) const;

  const Sequence& GetSequence() const noexcept { return _sequence; }
  const std::string& Prefix() const noexcept { return _prefix; }
  const std::string& Anchor() const noexcept { return _anchor; }

 private:
  std::optional<Span> Scan(std::string_view text, size_t from) const;
  // first position at or after pos a match may start at, npos if none
  size_t NextStart(std::string_view text, size_t pos) const;

  Sequence _sequence;
  // non-empty if every match starts with these bytes
  std::string _prefix;
  // literal following a leading repeated class
  std::string _anchor;
  CharClass _first;
  bool _nullable = false;
  // first run state of every element, a state is an element and the
  // number of characters it consumed so far
  std::vector<uint32_t> _offsets;
  uint32_t _state_count = 0;
};

}  // namespace rex
