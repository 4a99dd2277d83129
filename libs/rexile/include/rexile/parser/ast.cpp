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

#include "ast.hpp"

#include <absl/algorithm/container.h>
#include <absl/strings/str_cat.h>

#include <algorithm>
#include <limits>
#include <type_traits>

#include "basics/string_utils.h"
#include "basics/system-compiler.h"

namespace rex {
namespace {

template<typename T, typename N>
constexpr bool kIs = std::is_same_v<std::decay_t<N>, T>;

size_t MaxCharBytes(const CharClass& set) noexcept {
  return set.IsAsciiOnly() ? 1 : 4;
}

size_t MinCharBytes(const CharClass&) noexcept { return 1; }

std::string_view AssertionName(AssertionKind kind) noexcept {
  switch (kind) {
    case AssertionKind::kTextStart:
      return "TextStart";
    case AssertionKind::kTextEnd:
      return "TextEnd";
    case AssertionKind::kLineStart:
      return "LineStart";
    case AssertionKind::kLineEnd:
      return "LineEnd";
    case AssertionKind::kWordBoundary:
      return "WordBoundary";
    case AssertionKind::kNotWordBoundary:
      return "NotWordBoundary";
  }
  REX_UNREACHABLE();
}

std::string_view LookaroundName(LookaroundKind kind) noexcept {
  switch (kind) {
    case LookaroundKind::kPositiveLookahead:
      return "PositiveLookahead";
    case LookaroundKind::kNegativeLookahead:
      return "NegativeLookahead";
    case LookaroundKind::kPositiveLookbehind:
      return "PositiveLookbehind";
    case LookaroundKind::kNegativeLookbehind:
      return "NegativeLookbehind";
  }
  REX_UNREACHABLE();
}

}  // namespace

std::string Quantifier::ToString() const {
  std::string out;
  switch (kind) {
    case Kind::kZeroOrMore:
      out = "*";
      break;
    case Kind::kOneOrMore:
      out = "+";
      break;
    case Kind::kZeroOrOne:
      out = "?";
      break;
    case Kind::kExactly:
      out = absl::StrCat("{", min, "}");
      break;
    case Kind::kAtLeast:
      out = absl::StrCat("{", min, ",}");
      break;
    case Kind::kBetween:
      out = absl::StrCat("{", min, ",", max, "}");
      break;
  }
  if (!greedy) {
    out += '?';
  }
  return out;
}

bool IsNullable(const Ast& node) {
  return std::visit(
    [](const auto& n) -> bool {
      using N = decltype(n);
      if constexpr (kIs<ast::Literal, N> || kIs<ast::Class, N>) {
        return false;
      } else if constexpr (kIs<ast::Sequence, N>) {
        return absl::c_all_of(n.items,
                              [](const Ast& item) { return IsNullable(item); });
      } else if constexpr (kIs<ast::Alternation, N>) {
        return absl::c_any_of(n.branches,
                              [](const Ast& item) { return IsNullable(item); });
      } else if constexpr (kIs<ast::Group, N> || kIs<ast::Anchored, N>) {
        return IsNullable(*n.inner);
      } else if constexpr (kIs<ast::Quantified, N>) {
        return n.quantifier.min == 0 || IsNullable(*n.inner);
      } else if constexpr (kIs<ast::Backreference, N>) {
        // the referenced group may have matched the empty string
        return true;
      } else {
        // empty, assertions and lookaround are zero width
        return true;
      }
    },
    node.node);
}

bool HasCaptures(const Ast& node) {
  return std::visit(
    [](const auto& n) -> bool {
      using N = decltype(n);
      if constexpr (kIs<ast::Sequence, N>) {
        return absl::c_any_of(
          n.items, [](const Ast& item) { return HasCaptures(item); });
      } else if constexpr (kIs<ast::Alternation, N>) {
        return absl::c_any_of(
          n.branches, [](const Ast& item) { return HasCaptures(item); });
      } else if constexpr (kIs<ast::Group, N>) {
        return n.index.has_value() || HasCaptures(*n.inner);
      } else if constexpr (kIs<ast::Quantified, N> || kIs<ast::Anchored, N> ||
                           kIs<ast::Lookaround, N>) {
        return HasCaptures(*n.inner);
      } else {
        return false;
      }
    },
    node.node);
}

bool HasZeroWidthConstructs(const Ast& node) {
  return std::visit(
    [](const auto& n) -> bool {
      using N = decltype(n);
      if constexpr (kIs<ast::Assertion, N> || kIs<ast::Lookaround, N> ||
                    kIs<ast::Backreference, N>) {
        return true;
      } else if constexpr (kIs<ast::Sequence, N>) {
        return absl::c_any_of(n.items, [](const Ast& item) {
          return HasZeroWidthConstructs(item);
        });
      } else if constexpr (kIs<ast::Alternation, N>) {
        return absl::c_any_of(n.branches, [](const Ast& item) {
          return HasZeroWidthConstructs(item);
        });
      } else if constexpr (kIs<ast::Group, N> || kIs<ast::Quantified, N> ||
                           kIs<ast::Anchored, N>) {
        return HasZeroWidthConstructs(*n.inner);
      } else {
        return false;
      }
    },
    node.node);
}

size_t MinLength(const Ast& node) {
  return std::visit(
    [](const auto& n) -> size_t {
      using N = decltype(n);
      if constexpr (kIs<ast::Literal, N>) {
        return n.text.size();
      } else if constexpr (kIs<ast::Class, N>) {
        return MinCharBytes(n.set);
      } else if constexpr (kIs<ast::Sequence, N>) {
        size_t total = 0;
        for (const auto& item : n.items) {
          total += MinLength(item);
        }
        return total;
      } else if constexpr (kIs<ast::Alternation, N>) {
        size_t min = std::numeric_limits<size_t>::max();
        for (const auto& branch : n.branches) {
          min = std::min(min, MinLength(branch));
        }
        return n.branches.empty() ? 0 : min;
      } else if constexpr (kIs<ast::Group, N> || kIs<ast::Anchored, N>) {
        return MinLength(*n.inner);
      } else if constexpr (kIs<ast::Quantified, N>) {
        return n.quantifier.min * MinLength(*n.inner);
      } else {
        return 0;
      }
    },
    node.node);
}

std::optional<size_t> MaxLength(const Ast& node) {
  return std::visit(
    [](const auto& n) -> std::optional<size_t> {
      using N = decltype(n);
      if constexpr (kIs<ast::Literal, N>) {
        return n.text.size();
      } else if constexpr (kIs<ast::Class, N>) {
        return MaxCharBytes(n.set);
      } else if constexpr (kIs<ast::Sequence, N>) {
        size_t total = 0;
        for (const auto& item : n.items) {
          const auto length = MaxLength(item);
          if (!length) {
            return std::nullopt;
          }
          total += *length;
        }
        return total;
      } else if constexpr (kIs<ast::Alternation, N>) {
        size_t max = 0;
        for (const auto& branch : n.branches) {
          const auto length = MaxLength(branch);
          if (!length) {
            return std::nullopt;
          }
          max = std::max(max, *length);
        }
        return max;
      } else if constexpr (kIs<ast::Group, N> || kIs<ast::Anchored, N>) {
        return MaxLength(*n.inner);
      } else if constexpr (kIs<ast::Quantified, N>) {
        const auto length = MaxLength(*n.inner);
        if (!length) {
          return std::nullopt;
        }
        if (*length == 0) {
          return 0;
        }
        if (n.quantifier.IsUnbounded()) {
          return std::nullopt;
        }
        return n.quantifier.max * *length;
      } else if constexpr (kIs<ast::Backreference, N>) {
        return std::nullopt;
      } else {
        return 0;
      }
    },
    node.node);
}

std::string ToString(const Ast& node) {
  using basics::AsAbsl;

  return std::visit(
    [](const auto& n) -> std::string {
      using N = decltype(n);
      if constexpr (kIs<ast::Empty, N>) {
        return "Empty";
      } else if constexpr (kIs<ast::Literal, N>) {
        return absl::StrCat("Literal(\"", n.text, "\")");
      } else if constexpr (kIs<ast::Class, N>) {
        return absl::StrCat("Class(", n.set.ToString(), ")");
      } else if constexpr (kIs<ast::Sequence, N> || kIs<ast::Alternation, N>) {
        std::string out = kIs<ast::Sequence, N> ? "Sequence(" : "Alternation(";
        const auto& items = [&]() -> const std::vector<Ast>& {
          if constexpr (kIs<ast::Sequence, N>) {
            return n.items;
          } else {
            return n.branches;
          }
        }();
        for (size_t i = 0; i < items.size(); ++i) {
          absl::StrAppend(&out, i == 0 ? "" : ", ", ToString(items[i]));
        }
        out += ')';
        return out;
      } else if constexpr (kIs<ast::Group, N>) {
        if (!n.index) {
          return absl::StrCat("Group(?:", ToString(*n.inner), ")");
        }
        const std::string name =
          n.name.empty() ? "" : absl::StrCat("<", n.name, ">");
        return absl::StrCat("Group#", *n.index, name, "(", ToString(*n.inner),
                            ")");
      } else if constexpr (kIs<ast::Quantified, N>) {
        return absl::StrCat("Quantified(", ToString(*n.inner),
                            n.quantifier.ToString(), ")");
      } else if constexpr (kIs<ast::Anchored, N>) {
        return absl::StrCat("Anchored(", n.start ? "^" : "",
                            ToString(*n.inner), n.end ? "$" : "", ")");
      } else if constexpr (kIs<ast::Assertion, N>) {
        return absl::StrCat("Assertion(", AsAbsl(AssertionName(n.kind)), ")");
      } else if constexpr (kIs<ast::Lookaround, N>) {
        return absl::StrCat(AsAbsl(LookaroundName(n.kind)), "(",
                            ToString(*n.inner), ")");
      } else {
        static_assert(kIs<ast::Backreference, N>);
        return absl::StrCat("Backreference(", n.group, ")");
      }
    },
    node.node);
}

}  // namespace rex
