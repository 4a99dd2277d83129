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

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "rexile/parser/char_class.hpp"
#include "rexile/parser/quantifier.hpp"

namespace rex {

struct Ast;

enum class AssertionKind : uint8_t {
  kTextStart,
  kTextEnd,
  kLineStart,
  kLineEnd,
  kWordBoundary,
  kNotWordBoundary,
};

enum class LookaroundKind : uint8_t {
  kPositiveLookahead,
  kNegativeLookahead,
  kPositiveLookbehind,
  kNegativeLookbehind,
};

constexpr bool IsLookbehind(LookaroundKind kind) noexcept {
  return kind == LookaroundKind::kPositiveLookbehind ||
         kind == LookaroundKind::kNegativeLookbehind;
}

constexpr bool IsNegative(LookaroundKind kind) noexcept {
  return kind == LookaroundKind::kNegativeLookahead ||
         kind == LookaroundKind::kNegativeLookbehind;
}

namespace ast {

struct Empty {};

// UTF-8 encoded, never empty
struct Literal {
  std::string text;
};

struct Class {
  CharClass set;
};

struct Sequence {
  std::vector<Ast> items;
};

struct Alternation {
  std::vector<Ast> branches;
};

struct Group {
  std::unique_ptr<Ast> inner;
  // capture index starting at 1, unset for (?:...)
  std::optional<uint32_t> index;
  std::string name;
};

struct Quantified {
  std::unique_ptr<Ast> inner;
  Quantifier quantifier;
};

// top level ^ and $ of a branch
struct Anchored {
  std::unique_ptr<Ast> inner;
  bool start = false;
  bool end = false;
};

struct Assertion {
  AssertionKind kind;
};

struct Lookaround {
  std::unique_ptr<Ast> inner;
  LookaroundKind kind;
};

struct Backreference {
  uint32_t group;
};

}  // namespace ast

struct Ast {
  using Node =
    std::variant<ast::Empty, ast::Literal, ast::Class, ast::Sequence,
                 ast::Alternation, ast::Group, ast::Quantified, ast::Anchored,
                 ast::Assertion, ast::Lookaround, ast::Backreference>;

  template<typename T>
  bool Is() const noexcept {
    return std::holds_alternative<T>(node);
  }

  template<typename T>
  const T* As() const noexcept {
    return std::get_if<T>(&node);
  }

  template<typename T>
  T* As() noexcept {
    return std::get_if<T>(&node);
  }

  Node node;
};

template<typename T>
Ast MakeAst(T&& node) {
  return Ast{Ast::Node{std::forward<T>(node)}};
}

template<typename T>
std::unique_ptr<Ast> MakeAstPtr(T&& node) {
  return std::make_unique<Ast>(MakeAst(std::forward<T>(node)));
}

// true if the node can match the empty string
bool IsNullable(const Ast& node);
// true if any capturing group is present
bool HasCaptures(const Ast& node);
// true if lookaround, backreferences or assertions other than the
// top level anchors are present
bool HasZeroWidthConstructs(const Ast& node);
// minimal and maximal match length in bytes, max is unset if unbounded
size_t MinLength(const Ast& node);
std::optional<size_t> MaxLength(const Ast& node);

// debugging representation
std::string ToString(const Ast& node);

}  // namespace rex
