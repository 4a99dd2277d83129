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
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basics/system-compiler.h"

namespace rex {

// Set of code points made of explicit characters and inclusive ranges,
// optionally negated. Membership of ASCII code points is mirrored in a
// 128-bit bitmap which is rebuilt on every mutation.
class CharClass {
 public:
  using Range = std::pair<uint32_t, uint32_t>;

  CharClass() = default;

  static CharClass Single(uint32_t cp);
  static CharClass Digit();
  static CharClass Word();
  static CharClass Whitespace();
  // matches every code point
  static CharClass Any();
  // matches every code point except '\n'
  static CharClass AnyButNewline();

  void AddChar(uint32_t cp);
  void AddRange(uint32_t lo, uint32_t hi);
  // adds every member of other, negated classes are expanded into ranges
  void AddClass(const CharClass& other);
  void Negate() noexcept { _negated = !_negated; }
  // ASCII case folding
  void FoldCase();

  REX_FORCE_INLINE bool Matches(uint32_t cp) const noexcept {
    if (cp < 128) [[likely]] {
      return ((_ascii[cp >> 6] >> (cp & 63)) & 1) != _negated;
    }
    return MatchesSlow(cp) != _negated;
  }

  bool MatchesByte(uint8_t byte) const noexcept {
    return byte < 128 && Matches(byte);
  }

  bool IsNegated() const noexcept { return _negated; }
  bool IsEmpty() const noexcept { return _chars.empty() && _ranges.empty(); }

  // canonical \d, \w and \s
  bool IsDigitClass() const noexcept;
  bool IsWordClass() const noexcept;
  bool IsWhitespaceClass() const noexcept;
  // [^c] for the given ASCII character
  bool IsNegatedChar(uint32_t cp) const noexcept;
  // class equal to the given ASCII set, e.g. "a-zA-Z_"
  bool EqualsAscii(const std::array<uint64_t, 2>& bitmap) const noexcept;

  // true if no code point >= 128 can match
  bool IsAsciiOnly() const noexcept;
  // true if membership of every code point >= 128 is the same, so a
  // byte oriented matcher decides it from the lead byte alone
  bool IsByteDecidable() const noexcept;
  // the single code point matched, if the class matches exactly one
  bool IsSingleChar(uint32_t* cp = nullptr) const noexcept;

  // Conservative: returns true when either side is negated.
  bool OverlapsWith(const CharClass& other) const noexcept;

  // number of ASCII code points matched
  size_t AsciiCount() const noexcept;
  const std::array<uint64_t, 2>& AsciiBitmap() const noexcept {
    return _ascii;
  }

  const std::vector<uint32_t>& Chars() const noexcept { return _chars; }
  const std::vector<Range>& Ranges() const noexcept { return _ranges; }

  std::string ToString() const;

  bool operator==(const CharClass& other) const noexcept {
    return _negated == other._negated && _ascii == other._ascii &&
           _chars == other._chars && _ranges == other._ranges;
  }

 private:
  bool MatchesSlow(uint32_t cp) const noexcept;
  // members >= 128 expressed as sorted non-overlapping ranges
  std::vector<Range> NonAsciiRanges() const;
  void RebuildBitmap() noexcept;

  std::vector<uint32_t> _chars;
  std::vector<Range> _ranges;
  std::array<uint64_t, 2> _ascii{};
  bool _negated = false;
};

// builds an ASCII bitmap from a list of characters and "a-z" style ranges
constexpr std::array<uint64_t, 2> MakeAsciiBitmap(std::string_view spec) {
  std::array<uint64_t, 2> bitmap{};
  auto set = [&](uint32_t c) { bitmap[c >> 6] |= uint64_t{1} << (c & 63); };
  for (size_t i = 0; i < spec.size(); ++i) {
    const auto lo = static_cast<uint8_t>(spec[i]);
    if (i + 2 < spec.size() && spec[i + 1] == '-') {
      const auto hi = static_cast<uint8_t>(spec[i + 2]);
      for (uint32_t c = lo; c <= hi; ++c) {
        set(c);
      }
      i += 2;
    } else {
      set(lo);
    }
  }
  return bitmap;
}

inline constexpr auto kDigitBitmap = MakeAsciiBitmap("0-9");
inline constexpr auto kWordBitmap = MakeAsciiBitmap("a-zA-Z0-9_");
inline constexpr auto kWhitespaceBitmap = MakeAsciiBitmap("\t-\r ");
inline constexpr auto kIdentifierStartBitmap = MakeAsciiBitmap("a-zA-Z_");

REX_FORCE_INLINE constexpr bool IsWordByte(uint8_t c) noexcept {
  return c < 128 && ((kWordBitmap[c >> 6] >> (c & 63)) & 1);
}

REX_FORCE_INLINE constexpr bool IsDigitByte(uint8_t c) noexcept {
  return c >= '0' && c <= '9';
}

REX_FORCE_INLINE constexpr bool IsWhitespaceByte(uint8_t c) noexcept {
  return c == ' ' || (c >= '\t' && c <= '\r');
}

}  // namespace rex
