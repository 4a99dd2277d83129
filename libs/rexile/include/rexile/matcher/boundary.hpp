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

#include "rexile/parser/ast.hpp"

namespace rex {

enum class BoundaryType : uint8_t {
  // \b
  kWord,
  // \B
  kNonWord,
};

// True if exactly one of the bytes around pos is a word byte. Positions
// outside the text count as non-word.
bool IsAtBoundary(std::string_view text, size_t pos) noexcept;

inline bool Matches(BoundaryType type, std::string_view text,
                    size_t pos) noexcept {
  return IsAtBoundary(text, pos) == (type == BoundaryType::kWord);
}

std::optional<size_t> FindFirst(BoundaryType type, std::string_view text,
                                size_t from = 0) noexcept;
std::vector<size_t> FindAll(BoundaryType type, std::string_view text);

// Zero-width assertion evaluated at pos with the whole text as context.
bool MatchesAssertion(AssertionKind kind, std::string_view text,
                      size_t pos) noexcept;

}  // namespace rex
