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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rexile/matcher/captures.hpp"
#include "rexile/parser/parser.hpp"

namespace rex {

// Forward automaton over a flat sequence with capture groups. Transitions
// carry slot writes performed before and after consuming a character,
// which lets a single deterministic pass report group positions. All
// start positions advance together, one run per state, so a search is
// linear in the text; the inner literal only decides where to resume
// while no run is alive.
//
// Supported are groups around characters, classes and their greedy
// repetitions, and single element groups under a quantifier such as (x)+
// whose slots are rewritten on every iteration. Alternation, lookaround,
// backreferences, lazy quantifiers, nested or nullable groups and states
// with overlapping outgoing predicates are declined.
class CaptureDfa {
 public:
  static constexpr size_t kMaxStates = 512;

  struct Transition {
    uint32_t set;
    uint32_t target;
    // slots receiving the position before the character
    std::vector<uint32_t> pre;
    // slots receiving the position after the character
    std::vector<uint32_t> post;
  };

  struct State {
    std::vector<Transition> transitions;
    bool accepting = false;
    // slots receiving the position when the match ends here
    std::vector<uint32_t> accept;
  };

  // lookback bounds how far before an inner literal a match may start
  // when the distance is not bounded by the pattern itself
  static std::optional<CaptureDfa> Build(const ParsedPattern& pattern,
                                         size_t lookback);

  bool FindCapturesAt(std::string_view text, size_t from,
                      Slots& slots) const;
  std::optional<Span> FindAt(std::string_view text, size_t from) const;
  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }

  const std::vector<State>& States() const noexcept { return _states; }
  const std::string& LiteralHint() const noexcept { return _hint; }

 private:
  friend class CaptureDfaBuilder;

  bool MatchAt(std::string_view text, size_t start, Slots& slots) const;
  bool MayStartWith(uint32_t cp) const noexcept;
  // first position at or after pos a run is worth starting at while no
  // run is alive, npos if none; hint_pos caches the next hint occurrence
  size_t NextStart(std::string_view text, size_t pos, size_t& hint_pos) const;

  std::vector<State> _states;
  std::vector<CharClass> _sets;
  uint32_t _group_count = 0;
  bool _anchored_start = false;
  bool _anchored_end = false;

  // literal every match contains, with the byte distance between the
  // match start and the literal
  std::string _hint;
  size_t _hint_min_offset = 0;
  size_t _hint_window = 0;
};

}  // namespace rex
