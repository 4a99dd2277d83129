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

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "basics/assert.h"
#include "basics/system-compiler.h"

namespace rex::utf8_utils {

inline constexpr uint8_t kMaxCharSize = 4;
inline constexpr uint32_t kMaxChar32 = 0x10FFFF;
inline constexpr uint32_t kInvalidChar32 = 0xFFFFFFFF;

// 0 -- return 0 for last invalid and intermediate
// 1 -- return 1 for last invalid
// 4 -- only for valid input
template<uint8_t KError>
REX_FORCE_INLINE constexpr uint8_t LengthFromChar8(uint8_t ch) noexcept {
  static_assert(KError <= 1 || KError == 4);
  if (ch < 0x80) [[likely]] {
    return 1;
  }
  if (ch < 0xE0) [[likely]] {
    if (KError == 0 && ch < 0xC0) {
      return 0;
    }
    return 2;
  }
  if (ch < 0xF0) [[likely]] {
    return 3;
  }
  if (ch < 0xF8) [[likely]] {
    return 4;
  }
  return KError;
}

REX_FORCE_INLINE constexpr bool IsContinuation(uint8_t ch) noexcept {
  return (ch & 0xC0) == 0x80;
}

REX_FORCE_INLINE constexpr bool IsCharBoundary(std::string_view text,
                                               size_t pos) noexcept {
  return pos >= text.size() || !IsContinuation(static_cast<uint8_t>(text[pos]));
}

// byte length of the code point starting at pos, clamped to the text
REX_FORCE_INLINE constexpr size_t CharLength(std::string_view text,
                                             size_t pos) noexcept {
  REX_ASSERT(pos < text.size());
  const size_t length = LengthFromChar8<1>(static_cast<uint8_t>(text[pos]));
  return pos + length <= text.size() ? length : text.size() - pos;
}

REX_FORCE_INLINE constexpr size_t Next(std::string_view text,
                                       size_t pos) noexcept {
  return pos < text.size() ? pos + CharLength(text, pos) : pos + 1;
}

REX_FORCE_INLINE constexpr size_t Prev(std::string_view text,
                                       size_t pos) noexcept {
  REX_ASSERT(pos > 0);
  do {
    --pos;
  } while (pos > 0 && IsContinuation(static_cast<uint8_t>(text[pos])));
  return pos;
}

struct DecodedChar {
  uint32_t cp;
  uint32_t length;
};

// Decodes the code point at pos. Malformed sequences decode byte by byte
// as kInvalidChar32 so that scanning always makes progress.
inline constexpr DecodedChar Decode(std::string_view text,
                                    size_t pos) noexcept {
  REX_ASSERT(pos < text.size());
  const auto lead = static_cast<uint8_t>(text[pos]);
  const uint32_t length = LengthFromChar8<0>(lead);
  if (length == 1) [[likely]] {
    return {lead, 1};
  }
  if (length == 0 || pos + length > text.size()) [[unlikely]] {
    return {kInvalidChar32, 1};
  }
  uint32_t cp = 0;
  switch (length) {
    case 2:
      cp = lead & 0x1F;
      break;
    case 3:
      cp = lead & 0x0F;
      break;
    case 4:
      cp = lead & 0x07;
      break;
    default:
      return {kInvalidChar32, 1};
  }
  for (uint32_t i = 1; i < length; ++i) {
    const auto next = static_cast<uint8_t>(text[pos + i]);
    if (!IsContinuation(next)) [[unlikely]] {
      return {kInvalidChar32, 1};
    }
    cp = (cp << 6) | (next & 0x3F);
  }
  return {cp, length};
}

inline constexpr DecodedChar DecodeLast(std::string_view text,
                                        size_t end) noexcept {
  const size_t start = Prev(text, end);
  const auto decoded = Decode(text, start);
  if (start + decoded.length != end) [[unlikely]] {
    return {kInvalidChar32, 1};
  }
  return decoded;
}

REX_FORCE_INLINE constexpr uint32_t LengthFromChar32(uint32_t cp) noexcept {
  if (cp < 0x80) {
    return 1;
  }
  if (cp < 0x800) {
    return 2;
  }
  if (cp < 0x10000) {
    return 3;
  }
  return 4;
}

inline constexpr uint32_t FromChar32(uint32_t cp, char* begin) noexcept {
  if (cp < 0x80) {
    begin[0] = static_cast<char>(cp);
    return 1;
  }
  auto convert = [](uint32_t cp, uint32_t mask = 0x3F, uint32_t header = 0x80) {
    return static_cast<char>((cp & mask) | header);
  };

  if (cp < 0x800) {
    begin[0] = convert(cp >> 6, 0x1F, 0xC0);
    begin[1] = convert(cp);
    return 2;
  }

  if (cp < 0x10000) {
    begin[0] = convert(cp >> 12, 0xF, 0xE0);
    begin[1] = convert(cp >> 6);
    begin[2] = convert(cp);
    return 3;
  }

  begin[0] = convert(cp >> 18, 0x7, 0xF0);
  begin[1] = convert(cp >> 12);
  begin[2] = convert(cp >> 6);
  begin[3] = convert(cp);
  return 4;
}

inline void AppendChar32(std::string& out, uint32_t cp) {
  char buf[kMaxCharSize];
  out.append(buf, FromChar32(cp, buf));
}

inline bool IsValid(std::string_view text) noexcept {
  for (size_t pos = 0; pos < text.size();) {
    const auto decoded = Decode(text, pos);
    if (decoded.cp == kInvalidChar32) {
      return false;
    }
    pos += decoded.length;
  }
  return true;
}

}  // namespace rex::utf8_utils
