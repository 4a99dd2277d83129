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
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rexile/engine/aho_corasick.hpp"

namespace rex {

// Skips to positions where one of a set of literals begins. Every match
// of the guarded pattern must start with one of the literals.
class Prefilter {
 public:
  enum class Kind : uint8_t {
    // single byte, memchr
    kByte,
    // one literal of two or more bytes
    kSubstring,
    // two or three literals, scan for their first bytes and verify
    kFirstBytes,
    // more literals
    kAhoCorasick,
  };

  // Fails for an empty set or a set containing the empty string.
  static std::optional<Prefilter> FromLiterals(
    std::vector<std::string> literals);

  std::optional<size_t> Next(std::string_view text, size_t from) const;

  Kind GetKind() const noexcept { return _kind; }
  const std::vector<std::string>& Literals() const noexcept {
    return _literals;
  }

 private:
  Prefilter() = default;

  std::optional<size_t> NextFirstByte(std::string_view text,
                                      size_t from) const;

  Kind _kind = Kind::kByte;
  std::vector<std::string> _literals;
  std::array<bool, 256> _first_bytes{};
  std::shared_ptr<const AhoCorasick> _automaton;
};

std::string_view ToString(Prefilter::Kind kind) noexcept;

}  // namespace rex
