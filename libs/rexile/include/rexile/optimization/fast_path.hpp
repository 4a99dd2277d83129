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
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rexile/engine/aho_corasick.hpp"
#include "rexile/matcher/captures.hpp"
#include "rexile/parser/ast.hpp"

namespace rex {

// Hand written scanners for common capture-free pattern shapes.
class FastPath {
 public:
  enum class Kind : uint8_t {
    // hello
    kLiteral,
    // \d+
    kDigits,
    // \w+
    kWord,
    // [a-zA-Z_]\w*
    kIdentifier,
    // lit\s+
    kLiteralWhitespace,
    // "[^"]+"
    kQuoted,
    // lit\s+"[^"]+"
    kLiteralWhitespaceQuoted,
    // lit\s+\d+
    kLiteralWhitespaceDigits,
    // lit\s+\w+
    kLiteralWhitespaceWord,
    // foo|bar|baz
    kLiteralAlternation,
  };

  static std::optional<FastPath> Detect(const Ast& root);

  std::optional<Span> FindAt(std::string_view text, size_t from) const;
  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }

  Kind GetKind() const noexcept { return _kind; }

 private:
  FastPath(Kind kind, std::string literal) noexcept
    : _kind{kind}, _literal{std::move(literal)} {}

  // lit\s+ followed by tail, tail returns its end or nothing
  template<typename Tail>
  std::optional<Span> FindLiteralWhitespace(std::string_view text,
                                            size_t from, Tail tail) const;

  Kind _kind;
  std::string _literal;
  std::shared_ptr<const AhoCorasick> _alternation;
};

std::string_view ToString(FastPath::Kind kind) noexcept;

}  // namespace rex
