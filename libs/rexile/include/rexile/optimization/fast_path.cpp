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

#include "fast_path.hpp"

#include "rexile/optimization/literal.hpp"

namespace rex {
namespace {

const CharClass* OneOrMoreOf(const Ast& node) {
  const auto* quantified = node.As<ast::Quantified>();
  if (!quantified) {
    return nullptr;
  }
  const auto& q = quantified->quantifier;
  if (!q.greedy || q.min != 1 || !q.IsUnbounded()) {
    return nullptr;
  }
  const auto* cls = quantified->inner->As<ast::Class>();
  return cls ? &cls->set : nullptr;
}

bool IsDigits(const Ast& node) {
  const auto* set = OneOrMoreOf(node);
  return set && set->IsDigitClass();
}

bool IsWords(const Ast& node) {
  const auto* set = OneOrMoreOf(node);
  return set && set->IsWordClass();
}

bool IsSpaces(const Ast& node) {
  const auto* set = OneOrMoreOf(node);
  return set && set->IsWhitespaceClass();
}

bool IsQuote(const Ast& node) {
  const auto* literal = node.As<ast::Literal>();
  return literal && literal->text == "\"";
}

bool IsNotQuotes(const Ast& node) {
  const auto* set = OneOrMoreOf(node);
  return set && set->IsNegatedChar('"');
}

bool IsIdentifier(const std::vector<Ast>& items) {
  if (items.size() != 2) {
    return false;
  }
  const auto* head = items[0].As<ast::Class>();
  const auto* tail = items[1].As<ast::Quantified>();
  if (!head || !tail || !head->set.EqualsAscii(kIdentifierStartBitmap)) {
    return false;
  }
  const auto& q = tail->quantifier;
  const auto* cls = tail->inner->As<ast::Class>();
  return q.greedy && q.min == 0 && q.IsUnbounded() && cls &&
         cls->set.IsWordClass();
}

template<typename Predicate>
size_t SkipWhile(std::string_view text, size_t pos, Predicate predicate) {
  while (pos < text.size() && predicate(static_cast<uint8_t>(text[pos]))) {
    ++pos;
  }
  return pos;
}

template<typename Predicate>
std::optional<Span> FindRun(std::string_view text, size_t from,
                            Predicate start, Predicate rest) {
  for (size_t pos = from; pos < text.size(); ++pos) {
    if (start(static_cast<uint8_t>(text[pos]))) {
      return Span{pos, SkipWhile(text, pos + 1, rest)};
    }
  }
  return std::nullopt;
}

// end of "[^"]+" starting at pos
std::optional<size_t> QuotedAt(std::string_view text, size_t pos) {
  if (pos >= text.size() || text[pos] != '"') {
    return std::nullopt;
  }
  const size_t close = text.find('"', pos + 1);
  if (close == std::string_view::npos || close == pos + 1) {
    return std::nullopt;
  }
  return close + 1;
}

}  // namespace

std::optional<FastPath> FastPath::Detect(const Ast& root) {
  if (root.Is<ast::Empty>()) {
    return FastPath{Kind::kLiteral, {}};
  }
  if (const auto* literal = root.As<ast::Literal>()) {
    return FastPath{Kind::kLiteral, literal->text};
  }
  if (IsDigits(root)) {
    return FastPath{Kind::kDigits, {}};
  }
  if (IsWords(root)) {
    return FastPath{Kind::kWord, {}};
  }

  if (const auto* sequence = root.As<ast::Sequence>()) {
    const auto& items = sequence->items;
    if (IsIdentifier(items)) {
      return FastPath{Kind::kIdentifier, {}};
    }
    if (items.size() == 3 && IsQuote(items[0]) && IsNotQuotes(items[1]) &&
        IsQuote(items[2])) {
      return FastPath{Kind::kQuoted, {}};
    }

    const auto* literal = items.empty() ? nullptr : items[0].As<ast::Literal>();
    if (literal && items.size() >= 2 && IsSpaces(items[1])) {
      if (items.size() == 2) {
        return FastPath{Kind::kLiteralWhitespace, literal->text};
      }
      if (items.size() == 3 && IsDigits(items[2])) {
        return FastPath{Kind::kLiteralWhitespaceDigits, literal->text};
      }
      if (items.size() == 3 && IsWords(items[2])) {
        return FastPath{Kind::kLiteralWhitespaceWord, literal->text};
      }
      if (items.size() == 5 && IsQuote(items[2]) && IsNotQuotes(items[3]) &&
          IsQuote(items[4])) {
        return FastPath{Kind::kLiteralWhitespaceQuoted, literal->text};
      }
    }
    return std::nullopt;
  }

  if (root.Is<ast::Alternation>()) {
    if (auto literals = ExtractAlternation(root); literals) {
      FastPath fast_path{Kind::kLiteralAlternation, {}};
      fast_path._alternation =
        std::make_shared<const AhoCorasick>(std::move(*literals));
      return fast_path;
    }
  }
  return std::nullopt;
}

template<typename Tail>
std::optional<Span> FastPath::FindLiteralWhitespace(std::string_view text,
                                                    size_t from,
                                                    Tail tail) const {
  for (size_t pos = text.find(_literal, from); pos != std::string_view::npos;
       pos = text.find(_literal, pos + 1)) {
    const size_t spaces = pos + _literal.size();
    const size_t end = SkipWhile(text, spaces, IsWhitespaceByte);
    if (end == spaces) {
      continue;
    }
    if (const auto tail_end = tail(end)) {
      return Span{pos, *tail_end};
    }
  }
  return std::nullopt;
}

std::optional<Span> FastPath::FindAt(std::string_view text,
                                     size_t from) const {
  if (from > text.size()) {
    return std::nullopt;
  }

  auto run_of = [&](auto predicate) {
    return [&text, predicate](size_t pos) -> std::optional<size_t> {
      const size_t end = SkipWhile(text, pos, predicate);
      if (end == pos) {
        return std::nullopt;
      }
      return end;
    };
  };

  switch (_kind) {
    case Kind::kLiteral: {
      const size_t pos = text.find(_literal, from);
      if (pos == std::string_view::npos) {
        return std::nullopt;
      }
      return Span{pos, pos + _literal.size()};
    }
    case Kind::kDigits:
      return FindRun(text, from, IsDigitByte, IsDigitByte);
    case Kind::kWord:
      return FindRun(text, from, IsWordByte, IsWordByte);
    case Kind::kIdentifier:
      return FindRun(
        text, from,
        +[](uint8_t c) {
          return c < 128 &&
                 ((kIdentifierStartBitmap[c >> 6] >> (c & 63)) & 1) != 0;
        },
        +[](uint8_t c) { return IsWordByte(c); });
    case Kind::kLiteralWhitespace:
      return FindLiteralWhitespace(
        text, from, [](size_t end) -> std::optional<size_t> { return end; });
    case Kind::kQuoted:
      // an empty "" pair cannot match, the search resumes at its closing
      // quote which may open the next string
      for (size_t pos = text.find('"', from); pos != std::string_view::npos;
           pos = text.find('"', pos + 1)) {
        if (const auto end = QuotedAt(text, pos)) {
          return Span{pos, *end};
        }
      }
      return std::nullopt;
    case Kind::kLiteralWhitespaceQuoted:
      return FindLiteralWhitespace(
        text, from, [&](size_t end) { return QuotedAt(text, end); });
    case Kind::kLiteralWhitespaceDigits:
      return FindLiteralWhitespace(text, from, run_of(IsDigitByte));
    case Kind::kLiteralWhitespaceWord:
      return FindLiteralWhitespace(text, from, run_of(IsWordByte));
    case Kind::kLiteralAlternation:
      if (const auto match = _alternation->FindAt(text, from)) {
        return Span{match->start, match->end};
      }
      return std::nullopt;
  }
  return std::nullopt;
}

std::string_view ToString(FastPath::Kind kind) noexcept {
  switch (kind) {
    case FastPath::Kind::kLiteral:
      return "literal";
    case FastPath::Kind::kDigits:
      return "digits";
    case FastPath::Kind::kWord:
      return "word";
    case FastPath::Kind::kIdentifier:
      return "identifier";
    case FastPath::Kind::kLiteralWhitespace:
      return "literal-whitespace";
    case FastPath::Kind::kQuoted:
      return "quoted";
    case FastPath::Kind::kLiteralWhitespaceQuoted:
      return "literal-whitespace-quoted";
    case FastPath::Kind::kLiteralWhitespaceDigits:
      return "literal-whitespace-digits";
    case FastPath::Kind::kLiteralWhitespaceWord:
      return "literal-whitespace-word";
    case FastPath::Kind::kLiteralAlternation:
      return "literal-alternation";
  }
  return "unknown";
}

}  // namespace rex
