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

#include "boundary.hpp"

#include "basics/system-compiler.h"
#include "basics/utf8_utils.hpp"

namespace rex {

bool IsAtBoundary(std::string_view text, size_t pos) noexcept {
  const bool before =
    pos > 0 && pos <= text.size() && IsWordByte(text[pos - 1]);
  const bool after = pos < text.size() && IsWordByte(text[pos]);
  return before != after;
}

std::optional<size_t> FindFirst(BoundaryType type, std::string_view text,
                                size_t from) noexcept {
  for (size_t pos = from; pos <= text.size();
       pos = utf8_utils::Next(text, pos)) {
    if (Matches(type, text, pos)) {
      return pos;
    }
    if (pos == text.size()) {
      break;
    }
  }
  return std::nullopt;
}

std::vector<size_t> FindAll(BoundaryType type, std::string_view text) {
  std::vector<size_t> positions;
  for (auto pos = FindFirst(type, text); pos;
       pos = *pos < text.size()
               ? FindFirst(type, text, utf8_utils::Next(text, *pos))
               : std::nullopt) {
    positions.push_back(*pos);
  }
  return positions;
}

bool MatchesAssertion(AssertionKind kind, std::string_view text,
                      size_t pos) noexcept {
  switch (kind) {
    case AssertionKind::kTextStart:
      return pos == 0;
    case AssertionKind::kTextEnd:
      return pos == text.size();
    case AssertionKind::kLineStart:
      return pos == 0 || text[pos - 1] == '\n';
    case AssertionKind::kLineEnd:
      return pos == text.size() || text[pos] == '\n';
    case AssertionKind::kWordBoundary:
      return IsAtBoundary(text, pos);
    case AssertionKind::kNotWordBoundary:
      return !IsAtBoundary(text, pos);
  }
  REX_UNREACHABLE();
}

}  // namespace rex
