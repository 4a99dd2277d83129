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
#include <limits>
#include <string>

namespace rex {

// Repetition descriptor. Counted forms keep their bounds in min/max,
// kUnbounded marks a missing upper bound.
struct Quantifier {
  enum class Kind : uint8_t {
    kZeroOrMore,
    kOneOrMore,
    kZeroOrOne,
    kExactly,
    kAtLeast,
    kBetween,
  };

  static constexpr uint32_t kUnbounded = std::numeric_limits<uint32_t>::max();
  static constexpr uint32_t kMaxRepeat = 1000;

  static constexpr Quantifier ZeroOrMore(bool greedy = true) noexcept {
    return {Kind::kZeroOrMore, 0, kUnbounded, greedy};
  }
  static constexpr Quantifier OneOrMore(bool greedy = true) noexcept {
    return {Kind::kOneOrMore, 1, kUnbounded, greedy};
  }
  static constexpr Quantifier ZeroOrOne(bool greedy = true) noexcept {
    return {Kind::kZeroOrOne, 0, 1, greedy};
  }
  static constexpr Quantifier Exactly(uint32_t n, bool greedy = true) noexcept {
    return {Kind::kExactly, n, n, greedy};
  }
  static constexpr Quantifier AtLeast(uint32_t n, bool greedy = true) noexcept {
    return {Kind::kAtLeast, n, kUnbounded, greedy};
  }
  static constexpr Quantifier Between(uint32_t n, uint32_t m,
                                      bool greedy = true) noexcept {
    return {Kind::kBetween, n, m, greedy};
  }
  // a single mandatory occurrence, used for unquantified sequence items
  static constexpr Quantifier Once() noexcept { return Exactly(1); }

  constexpr bool IsUnbounded() const noexcept { return max == kUnbounded; }
  constexpr bool IsFixed() const noexcept { return min == max; }
  constexpr bool IsOnce() const noexcept { return min == 1 && max == 1; }
  constexpr bool IsNullable() const noexcept { return min == 0; }
  // single entry plus optional self loop, i.e. x, x?, x*, x+
  constexpr bool IsSimple() const noexcept {
    return min <= 1 && (max == 1 || IsUnbounded());
  }

  std::string ToString() const;

  constexpr bool operator==(const Quantifier&) const noexcept = default;

  Kind kind = Kind::kExactly;
  uint32_t min = 1;
  uint32_t max = 1;
  bool greedy = true;
};

}  // namespace rex
