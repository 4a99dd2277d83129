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

#include "char_class.hpp"

#include <absl/algorithm/container.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include <algorithm>
#include <bit>

#include "basics/utf8_utils.hpp"

namespace rex {
namespace {

using Range = CharClass::Range;

std::vector<Range> Merge(std::vector<Range> ranges) {
  if (ranges.empty()) {
    return ranges;
  }
  absl::c_sort(ranges);
  std::vector<Range> merged;
  merged.reserve(ranges.size());
  merged.push_back(ranges[0]);
  for (size_t i = 1; i < ranges.size(); ++i) {
    auto& back = merged.back();
    if (ranges[i].first <= back.second + 1) {
      back.second = std::max(back.second, ranges[i].second);
    } else {
      merged.push_back(ranges[i]);
    }
  }
  return merged;
}

void AppendEscaped(std::string& out, uint32_t cp) {
  switch (cp) {
    case '\n':
      out += "\\n";
      return;
    case '\t':
      out += "\\t";
      return;
    case '\r':
      out += "\\r";
      return;
    case '\f':
      out += "\\f";
      return;
    case '\v':
      out += "\\v";
      return;
    case '\\':
    case ']':
    case '[':
    case '^':
    case '-':
      out += '\\';
      out += static_cast<char>(cp);
      return;
    default:
      break;
  }
  if (cp < 0x20 || cp == 0x7F) {
    absl::StrAppendFormat(&out, "\\x%02X", cp);
  } else {
    utf8_utils::AppendChar32(out, cp);
  }
}

}  // namespace

CharClass CharClass::Single(uint32_t cp) {
  CharClass cls;
  cls.AddChar(cp);
  return cls;
}

CharClass CharClass::Digit() {
  CharClass cls;
  cls.AddRange('0', '9');
  return cls;
}

CharClass CharClass::Word() {
  CharClass cls;
  cls.AddRange('a', 'z');
  cls.AddRange('A', 'Z');
  cls.AddRange('0', '9');
  cls.AddChar('_');
  return cls;
}

CharClass CharClass::Whitespace() {
  CharClass cls;
  cls.AddRange('\t', '\r');
  cls.AddChar(' ');
  return cls;
}

CharClass CharClass::Any() {
  CharClass cls;
  cls.Negate();
  return cls;
}

CharClass CharClass::AnyButNewline() {
  CharClass cls;
  cls.AddChar('\n');
  cls.Negate();
  return cls;
}

void CharClass::AddChar(uint32_t cp) {
  _chars.push_back(cp);
  RebuildBitmap();
}

void CharClass::AddRange(uint32_t lo, uint32_t hi) {
  REX_ASSERT(lo <= hi);
  if (lo == hi) {
    _chars.push_back(lo);
  } else {
    _ranges.emplace_back(lo, hi);
  }
  RebuildBitmap();
}

void CharClass::AddClass(const CharClass& other) {
  if (!other._negated) {
    _chars.insert(_chars.end(), other._chars.begin(), other._chars.end());
    _ranges.insert(_ranges.end(), other._ranges.begin(), other._ranges.end());
    RebuildBitmap();
    return;
  }

  std::vector<Range> members;
  members.reserve(other._chars.size() + other._ranges.size());
  for (const auto cp : other._chars) {
    members.emplace_back(cp, cp);
  }
  members.insert(members.end(), other._ranges.begin(), other._ranges.end());

  uint32_t next = 0;
  for (const auto& [lo, hi] : Merge(std::move(members))) {
    if (lo > next) {
      _ranges.emplace_back(next, lo - 1);
    }
    next = hi + 1;
  }
  if (next <= utf8_utils::kMaxChar32) {
    _ranges.emplace_back(next, utf8_utils::kMaxChar32);
  }
  RebuildBitmap();
}

void CharClass::FoldCase() {
  std::vector<Range> extra;
  auto fold = [&](uint32_t lo, uint32_t hi) {
    const uint32_t lower_lo = std::max<uint32_t>(lo, 'a');
    const uint32_t lower_hi = std::min<uint32_t>(hi, 'z');
    if (lower_lo <= lower_hi) {
      extra.emplace_back(lower_lo - 32, lower_hi - 32);
    }
    const uint32_t upper_lo = std::max<uint32_t>(lo, 'A');
    const uint32_t upper_hi = std::min<uint32_t>(hi, 'Z');
    if (upper_lo <= upper_hi) {
      extra.emplace_back(upper_lo + 32, upper_hi + 32);
    }
  };
  for (const auto cp : _chars) {
    fold(cp, cp);
  }
  for (const auto& [lo, hi] : _ranges) {
    fold(lo, hi);
  }
  for (const auto& [lo, hi] : extra) {
    if (lo == hi) {
      _chars.push_back(lo);
    } else {
      _ranges.emplace_back(lo, hi);
    }
  }
  RebuildBitmap();
}

bool CharClass::IsDigitClass() const noexcept {
  return EqualsAscii(kDigitBitmap);
}

bool CharClass::IsWordClass() const noexcept {
  return EqualsAscii(kWordBitmap);
}

bool CharClass::IsWhitespaceClass() const noexcept {
  return EqualsAscii(kWhitespaceBitmap);
}

bool CharClass::IsNegatedChar(uint32_t cp) const noexcept {
  if (!_negated || cp >= 128 || !IsByteDecidable()) {
    return false;
  }
  std::array<uint64_t, 2> expected{};
  expected[cp >> 6] = uint64_t{1} << (cp & 63);
  return _ascii == expected;
}

bool CharClass::EqualsAscii(
  const std::array<uint64_t, 2>& bitmap) const noexcept {
  return !_negated && _ascii == bitmap && IsByteDecidable();
}

bool CharClass::IsAsciiOnly() const noexcept {
  return !_negated && IsByteDecidable();
}

bool CharClass::IsByteDecidable() const noexcept {
  return absl::c_all_of(_chars, [](uint32_t cp) { return cp < 128; }) &&
         absl::c_all_of(_ranges, [](const Range& r) { return r.second < 128; });
}

bool CharClass::IsSingleChar(uint32_t* cp) const noexcept {
  if (_negated || IsEmpty()) {
    return false;
  }
  const uint32_t first = _chars.empty() ? _ranges[0].first : _chars[0];
  const bool single =
    absl::c_all_of(_chars, [&](uint32_t c) { return c == first; }) &&
    absl::c_all_of(_ranges, [&](const Range& r) {
      return r.first == first && r.second == first;
    });
  if (single && cp != nullptr) {
    *cp = first;
  }
  return single;
}

bool CharClass::OverlapsWith(const CharClass& other) const noexcept {
  if (_negated || other._negated) {
    return true;
  }
  if ((_ascii[0] & other._ascii[0]) != 0 ||
      (_ascii[1] & other._ascii[1]) != 0) {
    return true;
  }
  const auto lhs = NonAsciiRanges();
  const auto rhs = other.NonAsciiRanges();
  for (size_t i = 0, j = 0; i < lhs.size() && j < rhs.size();) {
    if (lhs[i].second < rhs[j].first) {
      ++i;
    } else if (rhs[j].second < lhs[i].first) {
      ++j;
    } else {
      return true;
    }
  }
  return false;
}

size_t CharClass::AsciiCount() const noexcept {
  const size_t count = std::popcount(_ascii[0]) + std::popcount(_ascii[1]);
  return _negated ? 128 - count : count;
}

std::string CharClass::ToString() const {
  std::string out = _negated ? "[^" : "[";
  for (const auto cp : _chars) {
    AppendEscaped(out, cp);
  }
  for (const auto& [lo, hi] : _ranges) {
    AppendEscaped(out, lo);
    out += '-';
    AppendEscaped(out, hi);
  }
  out += ']';
  return out;
}

bool CharClass::MatchesSlow(uint32_t cp) const noexcept {
  return absl::c_linear_search(_chars, cp) ||
         absl::c_any_of(_ranges, [cp](const Range& r) {
           return r.first <= cp && cp <= r.second;
         });
}

std::vector<Range> CharClass::NonAsciiRanges() const {
  std::vector<Range> ranges;
  for (const auto cp : _chars) {
    if (cp >= 128) {
      ranges.emplace_back(cp, cp);
    }
  }
  for (const auto& [lo, hi] : _ranges) {
    if (hi >= 128) {
      ranges.emplace_back(std::max<uint32_t>(lo, 128), hi);
    }
  }
  return Merge(std::move(ranges));
}

void CharClass::RebuildBitmap() noexcept {
  _ascii = {};
  auto set = [&](uint32_t c) { _ascii[c >> 6] |= uint64_t{1} << (c & 63); };
  for (const auto cp : _chars) {
    if (cp < 128) {
      set(cp);
    }
  }
  for (const auto& [lo, hi] : _ranges) {
    for (uint32_t c = lo; c <= std::min<uint32_t>(hi, 127); ++c) {
      set(c);
    }
  }
}

}  // namespace rex
