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
#include <string_view>
#include <vector>

#include "rexile/error.hpp"
#include "rexile/matcher/captures.hpp"
#include "rexile/matcher/lookaround.hpp"
#include "rexile/optimization/prefilter.hpp"
#include "rexile/parser/ast.hpp"

namespace rex {

struct NfaInst {
  enum class Op : uint8_t {
    kChar,
    kClass,
    kSplit,
    kJump,
    kSave,
    kAssert,
    kLookaround,
    kBackref,
    kMatch,
  };

  Op op = Op::kMatch;
  // next instruction, the preferred branch of kSplit
  uint32_t out = 0;
  // lower priority branch of kSplit
  uint32_t alt = 0;
  // code point, class, slot, assertion kind, lookaround or group index
  uint32_t arg = 0;
};

// Thompson automaton simulated by a Pike VM. Threads carry their capture
// slots and are kept in priority order, a thread reaching Match cuts all
// lower priority threads, which yields leftmost-first semantics.
class Nfa {
 public:
  // The program is laid out as Save(0) body Save(1) Match. With
  // match_at_end the body must be followed by the end of text, which is
  // how look-behind bodies are compiled.
  static Expected<Nfa> Compile(const Ast& root, uint32_t group_count,
                               size_t size_limit, bool match_at_end = false);

  // Leftmost-first search for a match starting at or after from, only at
  // from when anchored. Reports the first slots.size() slots.
  bool Search(std::string_view text, size_t from, bool anchored,
              Slots& slots) const;

  std::optional<Span> FindAt(std::string_view text, size_t from) const;
  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }
  bool FindCapturesAt(std::string_view text, size_t from,
                      Slots& slots) const {
    return Search(text, from, false, slots);
  }

  void SetPrefilter(Prefilter prefilter) { _prefilter = std::move(prefilter); }
  const std::optional<Prefilter>& GetPrefilter() const noexcept {
    return _prefilter;
  }

  const std::vector<NfaInst>& Program() const noexcept { return _program; }
  const CharClass& Class(uint32_t index) const noexcept {
    return _classes[index];
  }
  const Lookaround& GetLookaround(uint32_t index) const noexcept {
    return _lookarounds[index];
  }
  uint32_t Start() const noexcept { return 0; }
  uint32_t GroupCount() const noexcept { return _group_count; }
  size_t SlotCount() const noexcept { return 2 * (_group_count + 1); }
  // assertions, lookaround or backreferences are present
  bool HasZeroWidth() const noexcept { return _has_zero_width; }

 private:
  friend class NfaBuilder;

  std::vector<NfaInst> _program;
  std::vector<CharClass> _classes;
  std::vector<Lookaround> _lookarounds;
  std::optional<Prefilter> _prefilter;
  uint32_t _group_count = 0;
  bool _anchored_start = false;
  bool _has_zero_width = false;
  bool _has_backrefs = false;
};

}  // namespace rex
