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
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "basics/system-compiler.h"
#include "rexile/matcher/captures.hpp"
#include "rexile/matcher/sequence.hpp"

namespace rex {

// Precompiled automaton for deterministic "class+ sep class+ ..." shapes
// over ASCII classes. Every element x or x+ owns one state, entered by
// its first character and looping on the rest. Searching runs all start
// positions at once, at most one run per state, so it is linear in the
// text.
class Dfa {
 public:
  enum class Predicate : uint8_t {
    kWord,
    kDigit,
    kWhitespace,
    kByte,
    kClass,
  };

  struct Transition {
    REX_FORCE_INLINE bool Matches(uint8_t c) const noexcept {
      switch (predicate) {
        case Predicate::kWord:
          return IsWordByte(c);
        case Predicate::kDigit:
          return IsDigitByte(c);
        case Predicate::kWhitespace:
          return IsWhitespaceByte(c);
        case Predicate::kByte:
          return c == byte;
        case Predicate::kClass:
          return c < 128 && ((bitmap[c >> 6] >> (c & 63)) & 1);
      }
      return false;
    }

    Predicate predicate = Predicate::kClass;
    uint8_t byte = 0;
    std::array<uint64_t, 2> bitmap{};
    uint32_t target = 0;
  };

  struct State {
    std::optional<Transition> loop;
    std::optional<Transition> advance;
  };

  // Fails unless the sequence is deterministic and every element is an
  // ASCII class occurring once or one or more times.
  static std::optional<Dfa> Build(const Sequence& sequence);

  std::optional<Span> FindAt(std::string_view text, size_t from) const;
  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }

  const std::vector<State>& States() const noexcept { return _states; }
  // literal every match contains, empty if there is none
  const std::string& RequiredLiteral() const noexcept { return _literal; }
  bool LiteralIsPrefix() const noexcept { return _literal_is_prefix; }

 private:
  std::optional<size_t> RunAt(std::string_view text, size_t pos) const;
  std::optional<Span> Scan(std::string_view text, size_t from) const;

  std::vector<State> _states;
  std::array<bool, 256> _first_bytes{};
  std::string _literal;
  bool _literal_is_prefix = false;
  bool _anchored_start = false;
  bool _anchored_end = false;
};

}  // namespace rex
