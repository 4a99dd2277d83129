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

#include "literal.hpp"

#include <absl/algorithm/container.h>

#include <algorithm>
#include <string_view>

#include "basics/utf8_utils.hpp"

namespace rex {
namespace {

using Strings = std::vector<std::string>;

// small ASCII class as its members
std::optional<Strings> ClassMembers(const CharClass& set) {
  if (set.IsNegated() || !set.IsAsciiOnly() ||
      set.AsciiCount() > kMaxLiterals / 2) {
    return std::nullopt;
  }
  Strings members;
  for (uint32_t c = 0; c < 128; ++c) {
    if (set.Matches(c)) {
      members.emplace_back(1, static_cast<char>(c));
    }
  }
  return members;
}

std::optional<Strings> Cross(const Strings& lhs, const Strings& rhs) {
  if (lhs.size() * rhs.size() > kMaxLiterals) {
    return std::nullopt;
  }
  Strings out;
  out.reserve(lhs.size() * rhs.size());
  for (const auto& l : lhs) {
    for (const auto& r : rhs) {
      out.push_back(l + r);
    }
  }
  return out;
}

bool HasEmpty(const Strings& strings) {
  return absl::c_any_of(strings, [](const auto& s) { return s.empty(); });
}

// The finite set of strings a node matches, zero-width nodes count as
// the empty string.
std::optional<Strings> Exact(const Ast& node) {
  if (node.Is<ast::Empty>() || node.Is<ast::Assertion>() ||
      node.Is<ast::Lookaround>()) {
    return Strings{""};
  }
  if (const auto* literal = node.As<ast::Literal>()) {
    return Strings{literal->text};
  }
  if (const auto* cls = node.As<ast::Class>()) {
    return ClassMembers(cls->set);
  }
  if (const auto* group = node.As<ast::Group>()) {
    return Exact(*group->inner);
  }
  if (const auto* alternation = node.As<ast::Alternation>()) {
    Strings out;
    for (const auto& branch : alternation->branches) {
      auto strings = Exact(branch);
      if (!strings) {
        return std::nullopt;
      }
      out.insert(out.end(), strings->begin(), strings->end());
    }
    if (out.size() > kMaxLiterals) {
      return std::nullopt;
    }
    return out;
  }
  if (const auto* sequence = node.As<ast::Sequence>()) {
    Strings out{""};
    for (const auto& item : sequence->items) {
      auto strings = Exact(item);
      if (!strings) {
        return std::nullopt;
      }
      auto crossed = Cross(out, *strings);
      if (!crossed) {
        return std::nullopt;
      }
      out = std::move(*crossed);
    }
    return out;
  }
  if (const auto* quantified = node.As<ast::Quantified>()) {
    const auto& q = quantified->quantifier;
    if (!q.IsFixed() || q.min > kMaxLiterals) {
      return std::nullopt;
    }
    auto strings = Exact(*quantified->inner);
    if (!strings) {
      return std::nullopt;
    }
    Strings out{""};
    for (uint32_t i = 0; i < q.min; ++i) {
      auto crossed = Cross(out, *strings);
      if (!crossed) {
        return std::nullopt;
      }
      out = std::move(*crossed);
    }
    return out;
  }
  return std::nullopt;
}

std::optional<Strings> Prefixes(const Ast& node) {
  if (auto exact = Exact(node); exact && !HasEmpty(*exact)) {
    return exact;
  }
  if (const auto* sequence = node.As<ast::Sequence>()) {
    Strings out{""};
    for (const auto& item : sequence->items) {
      if (auto exact = Exact(item)) {
        auto crossed = Cross(out, *exact);
        if (!crossed) {
          break;
        }
        out = std::move(*crossed);
        continue;
      }
      if (auto prefixes = Prefixes(item)) {
        if (auto crossed = Cross(out, *prefixes)) {
          out = std::move(*crossed);
        }
      }
      break;
    }
    if (HasEmpty(out)) {
      return std::nullopt;
    }
    return out;
  }
  if (const auto* alternation = node.As<ast::Alternation>()) {
    Strings out;
    for (const auto& branch : alternation->branches) {
      auto prefixes = Prefixes(branch);
      if (!prefixes) {
        return std::nullopt;
      }
      out.insert(out.end(), prefixes->begin(), prefixes->end());
    }
    if (out.size() > kMaxLiterals) {
      auto common = LongestCommonPrefix(out);
      if (common.empty()) {
        return std::nullopt;
      }
      return Strings{std::move(common)};
    }
    return out;
  }
  if (const auto* group = node.As<ast::Group>()) {
    return Prefixes(*group->inner);
  }
  if (const auto* anchored = node.As<ast::Anchored>()) {
    return Prefixes(*anchored->inner);
  }
  if (const auto* quantified = node.As<ast::Quantified>()) {
    if (quantified->quantifier.min > 0) {
      return Prefixes(*quantified->inner);
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<Strings> ExtractAlternation(const Ast& root) {
  if (const auto* literal = root.As<ast::Literal>()) {
    return Strings{literal->text};
  }
  if (const auto* group = root.As<ast::Group>(); group && !group->index) {
    return ExtractAlternation(*group->inner);
  }
  const auto* alternation = root.As<ast::Alternation>();
  if (!alternation) {
    return std::nullopt;
  }
  Strings literals;
  for (const auto& branch : alternation->branches) {
    const auto* literal = branch.As<ast::Literal>();
    if (!literal) {
      return std::nullopt;
    }
    literals.push_back(literal->text);
  }
  return literals;
}

std::optional<Strings> ExtractPrefixes(const Ast& root) {
  auto prefixes = Prefixes(root);
  if (!prefixes || prefixes->empty() || HasEmpty(*prefixes)) {
    return std::nullopt;
  }
  return prefixes;
}

std::string LongestCommonPrefix(const Strings& literals) {
  if (literals.empty()) {
    return {};
  }
  std::string_view common = literals[0];
  for (const auto& literal : literals) {
    const auto end = std::mismatch(common.begin(), common.end(),
                                   literal.begin(), literal.end())
                       .first;
    common = common.substr(0, end - common.begin());
  }
  // never split a code point
  size_t length = common.size();
  while (length > 0 && !utf8_utils::IsCharBoundary(literals[0], length)) {
    --length;
  }
  return std::string{common.substr(0, length)};
}

}  // namespace rex
