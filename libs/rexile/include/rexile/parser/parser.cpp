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

#include "parser.hpp"

#include <absl/algorithm/container.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include <algorithm>
#include <optional>
#include <variant>

#include "basics/assert.h"
#include "basics/string_utils.h"
#include "basics/utf8_utils.hpp"

namespace rex {
namespace {

using basics::AsAbsl;

constexpr size_t kMaxNesting = 256;

bool IsFlagChar(char c) noexcept {
  switch (c) {
    case 'i':
    case 'm':
    case 's':
    case 'x':
    case 'U':
    case '-':
      return true;
    default:
      return false;
  }
}

bool IsNameChar(char c, bool first) noexcept {
  return c == '_' || absl::ascii_isalpha(static_cast<unsigned char>(c)) ||
         (!first && absl::ascii_isdigit(static_cast<unsigned char>(c)));
}

// \d, \w, \s and their negations
std::optional<CharClass> ClassEscape(char c) {
  std::optional<CharClass> cls;
  switch (c) {
    case 'd':
    case 'D':
      cls = CharClass::Digit();
      break;
    case 'w':
    case 'W':
      cls = CharClass::Word();
      break;
    case 's':
    case 'S':
      cls = CharClass::Whitespace();
      break;
    default:
      return std::nullopt;
  }
  if (absl::ascii_isupper(static_cast<unsigned char>(c))) {
    cls->Negate();
  }
  return cls;
}

std::optional<uint32_t> ControlEscape(char c) noexcept {
  switch (c) {
    case 'n':
      return '\n';
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case 'f':
      return '\f';
    case 'v':
      return '\v';
    default:
      return std::nullopt;
  }
}

void MergeLiterals(std::vector<Ast>& items) {
  std::vector<Ast> merged;
  merged.reserve(items.size());
  for (auto& item : items) {
    auto* literal = item.As<ast::Literal>();
    if (literal && !merged.empty()) {
      if (auto* prev = merged.back().As<ast::Literal>()) {
        prev->text += literal->text;
        continue;
      }
    }
    merged.push_back(std::move(item));
  }
  items = std::move(merged);
}

class PatternParser {
 public:
  explicit PatternParser(std::string_view pattern) noexcept
    : _pattern(pattern), _pos(0) {}

  Expected<ParsedPattern> Parse() {
    if (!utf8_utils::IsValid(_pattern)) {
      return std::unexpected(
        PatternError::Parse("pattern is not valid UTF-8"));
    }

    ParseLeadingFlags();
    auto root = ParseExpr(0);

    // only an unbalanced ')' stops the top level expression early
    if (!_error && !AtEnd()) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("unmatched ')' at offset ", _pos));
    }
    if (!_error && _max_backref > _group_count) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("backreference \\", _max_backref,
                        " refers to a non-existent group"));
    }
    if (_error) {
      return std::unexpected(std::move(*_error));
    }

    _names.resize(_group_count + 1);
    return ParsedPattern{.root = std::move(root),
                         .group_count = _group_count,
                         .group_names = std::move(_names),
                         .flags = _flags};
  }

 private:
  // Leading (?imsxU-) group. Any other group starting with "(?" is left
  // for ParseGroup.
  void ParseLeadingFlags() {
    if (!_pattern.starts_with("(?")) {
      return;
    }
    size_t end = 2;
    while (end < _pattern.size() && IsFlagChar(_pattern[end])) {
      ++end;
    }
    if (end == 2 || end >= _pattern.size() ||
        _pattern[end] != RegexMeta::kRParen) {
      return;
    }

    bool enable = true;
    for (size_t i = 2; i < end; ++i) {
      switch (_pattern[i]) {
        case 'i':
          _flags.case_insensitive = enable;
          break;
        case 'm':
          _flags.multiline = enable;
          break;
        case 's':
          _flags.dot_all = enable;
          break;
        case '-':
          enable = false;
          break;
        default:
          // 'x' and 'U' are accepted and ignored
          break;
      }
    }
    _pos = end + 1;
  }

  // expr = branch ('|' branch)*
  Ast ParseExpr(size_t depth) {
    if (depth > kMaxNesting) {
      Fail(PatternErrorKind::kUnsupportedFeature, "pattern nests too deeply");
      return {};
    }

    std::vector<Ast> branches;
    branches.push_back(ParseBranch(depth));
    while (!_error && !AtEnd() && Peek() == RegexMeta::kPipe) {
      Advance();
      branches.push_back(ParseBranch(depth));
    }

    if (branches.size() == 1) {
      return std::move(branches[0]);
    }
    return MakeAst(ast::Alternation{std::move(branches)});
  }

  // branch = '^'? (atom quantifier?)* '$'?
  // Anchors at the edges of a top level branch become Anchored, any
  // other ^ and $ is an assertion.
  Ast ParseBranch(size_t depth) {
    const bool top_level = depth == 0 && !_flags.multiline;
    bool anchored_start = false;
    bool anchored_end = false;

    if (top_level && !AtEnd() && Peek() == RegexMeta::kCaret) {
      Advance();
      anchored_start = true;
    }

    std::vector<Ast> items;
    while (!_error && !AtEnd()) {
      const char c = Peek();
      if (c == RegexMeta::kPipe || c == RegexMeta::kRParen) {
        break;
      }
      if (c == RegexMeta::kDollar && top_level && IsBranchEnd(_pos + 1)) {
        Advance();
        anchored_end = true;
        break;
      }

      auto atom = ParseAtom(depth);
      if (_error) {
        break;
      }
      ParseQuantifier(atom);
      items.push_back(std::move(atom));
    }
    if (_error) {
      return {};
    }

    MergeLiterals(items);
    Ast body;
    if (items.size() == 1) {
      body = std::move(items[0]);
    } else if (!items.empty()) {
      body = MakeAst(ast::Sequence{std::move(items)});
    }

    if (anchored_start || anchored_end) {
      auto inner = std::make_unique<Ast>(std::move(body));
      return MakeAst(ast::Anchored{.inner = std::move(inner),
                                   .start = anchored_start,
                                   .end = anchored_end});
    }
    return body;
  }

  Ast ParseAtom(size_t depth) {
    const char c = Peek();
    switch (c) {
      case RegexMeta::kLParen:
        return ParseGroup(depth);
      case RegexMeta::kLBracket:
        return ParseClass();
      case RegexMeta::kDot:
        Advance();
        return MakeAst(ast::Class{_flags.dot_all ? CharClass::Any()
                                                 : CharClass::AnyButNewline()});
      case RegexMeta::kEscape:
        return ParseEscape();
      case RegexMeta::kCaret:
        Advance();
        return MakeAst(ast::Assertion{_flags.multiline
                                        ? AssertionKind::kLineStart
                                        : AssertionKind::kTextStart});
      case RegexMeta::kDollar:
        Advance();
        return MakeAst(ast::Assertion{_flags.multiline
                                        ? AssertionKind::kLineEnd
                                        : AssertionKind::kTextEnd});
      case RegexMeta::kStar:
      case RegexMeta::kPlus:
      case RegexMeta::kQuestion:
        Fail(PatternErrorKind::kParse,
             absl::StrCat("nothing to repeat at offset ", _pos));
        return {};
      case RegexMeta::kLBrace:
        if (ScanCounted(_pos).end != 0) {
          Fail(PatternErrorKind::kParse,
               absl::StrCat("nothing to repeat at offset ", _pos));
          return {};
        }
        Advance();
        return MakeChar('{');
      default:
        return MakeChar(ParseCodepoint());
    }
  }

  Ast ParseGroup(size_t depth) {
    const size_t open = _pos;
    Advance();  // consume '('

    std::optional<uint32_t> index;
    std::optional<LookaroundKind> lookaround;
    std::string name;

    if (Consume("?")) {
      if (Consume(":")) {
        // non-capturing
      } else if (Consume("=")) {
        lookaround = LookaroundKind::kPositiveLookahead;
      } else if (Consume("!")) {
        lookaround = LookaroundKind::kNegativeLookahead;
      } else if (Consume("<=")) {
        lookaround = LookaroundKind::kPositiveLookbehind;
      } else if (Consume("<!")) {
        lookaround = LookaroundKind::kNegativeLookbehind;
      } else if (Consume("P<") || Consume("<")) {
        name = ParseGroupName();
        if (_error) {
          return {};
        }
        index = ++_group_count;
        _names.resize(_group_count + 1);
        _names[*index] = name;
      } else if (Consume(">")) {
        Fail(PatternErrorKind::kUnsupportedFeature,
             absl::StrCat("atomic groups are not supported, offset ", open));
        return {};
      } else if (Consume("#")) {
        Fail(PatternErrorKind::kUnsupportedFeature,
             absl::StrCat("comment groups are not supported, offset ", open));
        return {};
      } else if (!AtEnd() && IsFlagChar(Peek())) {
        Fail(PatternErrorKind::kUnsupportedFeature,
             absl::StrCat("inline flags are only supported at the start of "
                          "the pattern, offset ",
                          open));
        return {};
      } else {
        Fail(PatternErrorKind::kParse,
             absl::StrCat("unknown group syntax at offset ", open));
        return {};
      }
    } else {
      index = ++_group_count;
    }

    auto inner = ParseExpr(depth + 1);
    if (_error) {
      return {};
    }
    if (AtEnd() || Peek() != RegexMeta::kRParen) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("unmatched '(' at offset ", open));
      return {};
    }
    Advance();

    auto inner_ptr = std::make_unique<Ast>(std::move(inner));
    if (lookaround) {
      return MakeAst(ast::Lookaround{std::move(inner_ptr), *lookaround});
    }
    return MakeAst(ast::Group{.inner = std::move(inner_ptr),
                              .index = index,
                              .name = std::move(name)});
  }

  std::string ParseGroupName() {
    const size_t begin = _pos;
    while (!AtEnd() && Peek() != '>') {
      if (!IsNameChar(Peek(), _pos == begin)) {
        Fail(PatternErrorKind::kParse,
             absl::StrCat("invalid character in group name at offset ", _pos));
        return {};
      }
      Advance();
    }
    if (AtEnd()) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("unterminated group name at offset ", begin));
      return {};
    }
    std::string name{_pattern.substr(begin, _pos - begin)};
    Advance();  // consume '>'
    if (name.empty()) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("empty group name at offset ", begin));
      return {};
    }
    if (absl::c_linear_search(_names, name)) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("duplicate group name '", name, "'"));
      return {};
    }
    return name;
  }

  Ast ParseClass() {
    const size_t open = _pos;
    Advance();  // consume '['

    bool negated = false;
    if (!AtEnd() && Peek() == RegexMeta::kCaret) {
      negated = true;
      Advance();
    }

    CharClass set;
    bool empty = true;
    while (!_error && !AtEnd() && Peek() != RegexMeta::kRBracket) {
      auto first = ParseClassItem();
      if (_error) {
        return {};
      }
      empty = false;

      if (auto* cls = std::get_if<CharClass>(&first)) {
        set.AddClass(*cls);
        continue;
      }
      const uint32_t lo = std::get<uint32_t>(first);

      // Check for range: a-z, a trailing dash is literal
      if (!AtEnd() && Peek() == '-' && _pos + 1 < _pattern.size() &&
          _pattern[_pos + 1] != RegexMeta::kRBracket) {
        Advance();  // consume '-'
        auto last = ParseClassItem();
        if (_error) {
          return {};
        }
        const auto* hi = std::get_if<uint32_t>(&last);
        if (!hi) {
          Fail(PatternErrorKind::kParse,
               absl::StrCat("invalid character class range at offset ", _pos));
          return {};
        }
        if (lo > *hi) {
          Fail(PatternErrorKind::kParse,
               absl::StrCat("invalid character class range at offset ", _pos,
                            ": start is greater than end"));
          return {};
        }
        set.AddRange(lo, *hi);
      } else {
        set.AddChar(lo);
      }
    }

    if (AtEnd()) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("unterminated character class at offset ", open));
      return {};
    }
    if (empty) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("empty character class at offset ", open));
      return {};
    }
    Advance();  // consume ']'

    if (_flags.case_insensitive) {
      set.FoldCase();
    }
    if (negated) {
      set.Negate();
    }
    return MakeAst(ast::Class{std::move(set)});
  }

  std::variant<uint32_t, CharClass> ParseClassItem() {
    if (Peek() != RegexMeta::kEscape) {
      return ParseCodepoint();
    }
    Advance();
    if (AtEnd()) {
      Fail(PatternErrorKind::kParse, "trailing backslash");
      return uint32_t{0};
    }
    const char c = Peek();
    if (auto cls = ClassEscape(c)) {
      Advance();
      return std::move(*cls);
    }
    if (auto cp = ControlEscape(c)) {
      Advance();
      return *cp;
    }
    if (absl::ascii_ispunct(static_cast<unsigned char>(c))) {
      Advance();
      return static_cast<uint32_t>(c);
    }
    FailUnknownEscape();
    return uint32_t{0};
  }

  Ast ParseEscape() {
    Advance();  // consume '\'
    if (AtEnd()) {
      Fail(PatternErrorKind::kParse, "trailing backslash");
      return {};
    }

    const char c = Peek();
    if (auto cls = ClassEscape(c)) {
      Advance();
      return MakeAst(ast::Class{std::move(*cls)});
    }
    if (auto cp = ControlEscape(c)) {
      Advance();
      return MakeChar(*cp);
    }
    switch (c) {
      case 'b':
        Advance();
        return MakeAst(ast::Assertion{AssertionKind::kWordBoundary});
      case 'B':
        Advance();
        return MakeAst(ast::Assertion{AssertionKind::kNotWordBoundary});
      default:
        break;
    }
    if (c >= '1' && c <= '9') {
      Advance();
      const uint32_t group = static_cast<uint32_t>(c - '0');
      _max_backref = std::max(_max_backref, group);
      return MakeAst(ast::Backreference{group});
    }
    if (absl::ascii_ispunct(static_cast<unsigned char>(c))) {
      Advance();
      return MakeChar(static_cast<uint32_t>(c));
    }
    FailUnknownEscape();
    return {};
  }

  // Applies a trailing quantifier to atom in place.
  void ParseQuantifier(Ast& atom) {
    if (AtEnd()) {
      return;
    }

    const size_t start = _pos;
    std::optional<Quantifier> quantifier;
    switch (Peek()) {
      case RegexMeta::kStar:
        Advance();
        quantifier = Quantifier::ZeroOrMore();
        break;
      case RegexMeta::kPlus:
        Advance();
        quantifier = Quantifier::OneOrMore();
        break;
      case RegexMeta::kQuestion:
        Advance();
        quantifier = Quantifier::ZeroOrOne();
        break;
      case RegexMeta::kLBrace:
        quantifier = ParseCounted();
        break;
      default:
        break;
    }
    if (_error || !quantifier) {
      return;
    }

    if (!AtEnd() && Peek() == RegexMeta::kQuestion) {
      Advance();
      quantifier->greedy = false;
    }

    if (atom.Is<ast::Assertion>() || atom.Is<ast::Lookaround>()) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("nothing to repeat at offset ", start));
      return;
    }
    if (!AtEnd() && (Peek() == RegexMeta::kStar || Peek() == RegexMeta::kPlus ||
                     Peek() == RegexMeta::kQuestion ||
                     (Peek() == RegexMeta::kLBrace && ScanCounted(_pos).end))) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("nothing to repeat at offset ", _pos));
      return;
    }

    atom = MakeAst(ast::Quantified{std::make_unique<Ast>(std::move(atom)),
                                   *quantifier});
  }

  struct CountedScan {
    // position past '}', 0 if the text is not a counted repetition
    size_t end = 0;
    uint64_t min = 0;
    std::optional<uint64_t> max;
    bool has_comma = false;
  };

  // {n}, {n,} or {n,m}; anything else is not a quantifier
  CountedScan ScanCounted(size_t pos) const noexcept {
    CountedScan scan;
    auto digits = [&](uint64_t& value) {
      const size_t begin = pos;
      while (pos < _pattern.size() &&
             absl::ascii_isdigit(static_cast<unsigned char>(_pattern[pos]))) {
        value = std::min<uint64_t>(value * 10 + (_pattern[pos] - '0'),
                                   uint64_t{1} << 32);
        ++pos;
      }
      return pos != begin;
    };

    REX_ASSERT(_pattern[pos] == RegexMeta::kLBrace);
    ++pos;
    if (!digits(scan.min)) {
      return {};
    }
    if (pos < _pattern.size() && _pattern[pos] == ',') {
      ++pos;
      scan.has_comma = true;
      uint64_t max = 0;
      if (digits(max)) {
        scan.max = max;
      }
    } else {
      scan.max = scan.min;
    }
    if (pos >= _pattern.size() || _pattern[pos] != '}') {
      return {};
    }
    scan.end = pos + 1;
    return scan;
  }

  std::optional<Quantifier> ParseCounted() {
    const auto scan = ScanCounted(_pos);
    if (scan.end == 0) {
      // a brace which does not start a repetition is a literal
      return std::nullopt;
    }
    if (scan.min > Quantifier::kMaxRepeat ||
        scan.max.value_or(0) > Quantifier::kMaxRepeat) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("repetition count exceeds ", Quantifier::kMaxRepeat,
                        " at offset ", _pos));
      return std::nullopt;
    }
    if (scan.max && scan.min > *scan.max) {
      Fail(PatternErrorKind::kParse,
           absl::StrCat("invalid repetition range {", scan.min, ",", *scan.max,
                        "} at offset ", _pos));
      return std::nullopt;
    }

    const auto min = static_cast<uint32_t>(scan.min);
    _pos = scan.end;
    if (!scan.max) {
      return Quantifier::AtLeast(min);
    }
    if (!scan.has_comma) {
      return Quantifier::Exactly(min);
    }
    return Quantifier::Between(min, static_cast<uint32_t>(*scan.max));
  }

  Ast MakeChar(uint32_t cp) {
    if (_flags.case_insensitive && cp < 128 &&
        absl::ascii_isalpha(static_cast<unsigned char>(cp))) {
      CharClass set;
      set.AddChar(cp);
      set.FoldCase();
      return MakeAst(ast::Class{std::move(set)});
    }
    std::string text;
    utf8_utils::AppendChar32(text, cp);
    return MakeAst(ast::Literal{std::move(text)});
  }

  uint32_t ParseCodepoint() {
    const auto decoded = utf8_utils::Decode(_pattern, _pos);
    _pos += decoded.length;
    return decoded.cp;
  }

  void FailUnknownEscape() {
    const size_t length = utf8_utils::CharLength(_pattern, _pos);
    Fail(PatternErrorKind::kParse,
         absl::StrCat("unknown escape sequence '\\",
                      AsAbsl(_pattern.substr(_pos, length)), "' at offset ",
                      _pos - 1));
  }

  void Fail(PatternErrorKind kind, std::string message) {
    if (!_error) {
      _error.emplace(PatternError{kind, std::move(message)});
    }
  }

  bool IsBranchEnd(size_t pos) const noexcept {
    return pos >= _pattern.size() || _pattern[pos] == RegexMeta::kPipe;
  }

  bool Consume(std::string_view token) noexcept {
    if (_pattern.substr(_pos).starts_with(token)) {
      _pos += token.size();
      return true;
    }
    return false;
  }

  bool AtEnd() const noexcept { return _pos >= _pattern.size(); }

  char Peek() const noexcept {
    REX_ASSERT(!AtEnd());
    return _pattern[_pos];
  }

  void Advance() noexcept {
    REX_ASSERT(!AtEnd());
    ++_pos;
  }

  std::string_view _pattern;
  size_t _pos;
  ParseFlags _flags;
  uint32_t _group_count = 0;
  uint32_t _max_backref = 0;
  std::vector<std::string> _names;
  std::optional<PatternError> _error;
};

}  // namespace

Expected<ParsedPattern> Parse(std::string_view pattern) {
  PatternParser parser(pattern);
  return parser.Parse();
}

}  // namespace rex
