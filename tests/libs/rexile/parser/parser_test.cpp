#include <rexile/parser/parser.hpp>

#include "tests_shared.hpp"

class ParserTest : public TestBase {
 protected:
  static rex::ParsedPattern ParseOk(std::string_view pattern) {
    auto parsed = rex::Parse(pattern);
    EXPECT_TRUE(parsed.has_value())
      << pattern << ": " << (parsed ? "" : parsed.error().message);
    return parsed ? std::move(*parsed) : rex::ParsedPattern{};
  }

  static rex::PatternErrorKind ErrorKind(std::string_view pattern) {
    auto parsed = rex::Parse(pattern);
    EXPECT_FALSE(parsed.has_value()) << pattern;
    return parsed ? rex::PatternErrorKind::kParse : parsed.error().kind;
  }
};

// Tree shape

TEST_F(ParserTest, empty_pattern) {
  auto parsed = ParseOk("");
  EXPECT_TRUE(parsed.root.Is<rex::ast::Empty>());
  EXPECT_EQ(0U, parsed.group_count);
  EXPECT_EQ(1U, parsed.group_names.size());
}

TEST_F(ParserTest, literal_merged) {
  auto parsed = ParseOk("hello");
  const auto* literal = parsed.root.As<rex::ast::Literal>();
  ASSERT_NE(nullptr, literal);
  EXPECT_EQ("hello", literal->text);
}

TEST_F(ParserTest, escaped_metacharacters) {
  auto parsed = ParseOk(R"(a\.b\*c\\)");
  const auto* literal = parsed.root.As<rex::ast::Literal>();
  ASSERT_NE(nullptr, literal);
  EXPECT_EQ(R"(a.b*c\)", literal->text);
}

TEST_F(ParserTest, quantifier_binds_last_char) {
  auto parsed = ParseOk("ab+");
  const auto* sequence = parsed.root.As<rex::ast::Sequence>();
  ASSERT_NE(nullptr, sequence);
  ASSERT_EQ(2U, sequence->items.size());
  const auto* prefix = sequence->items[0].As<rex::ast::Literal>();
  ASSERT_NE(nullptr, prefix);
  EXPECT_EQ("a", prefix->text);
  const auto* quantified = sequence->items[1].As<rex::ast::Quantified>();
  ASSERT_NE(nullptr, quantified);
  EXPECT_EQ(1U, quantified->quantifier.min);
  EXPECT_TRUE(quantified->quantifier.IsUnbounded());
  EXPECT_TRUE(quantified->quantifier.greedy);
}

TEST_F(ParserTest, counted_quantifiers) {
  auto check = [](std::string_view pattern, uint32_t min, uint32_t max,
                  bool greedy) {
    auto parsed = ParseOk(pattern);
    const auto* quantified = parsed.root.As<rex::ast::Quantified>();
    ASSERT_NE(nullptr, quantified) << pattern;
    EXPECT_EQ(min, quantified->quantifier.min) << pattern;
    EXPECT_EQ(max, quantified->quantifier.max) << pattern;
    EXPECT_EQ(greedy, quantified->quantifier.greedy) << pattern;
  };
  check("a{3}", 3, 3, true);
  check("a{2,}", 2, rex::Quantifier::kUnbounded, true);
  check("a{2,4}", 2, 4, true);
  check("a{2,4}?", 2, 4, false);
  check("a*?", 0, rex::Quantifier::kUnbounded, false);
  check("a??", 0, 1, false);
}

TEST_F(ParserTest, brace_without_count_is_literal) {
  for (std::string_view pattern : {"a{", "a{x}", "a{,"}) {
    auto parsed = ParseOk(pattern);
    const auto* literal = parsed.root.As<rex::ast::Literal>();
    ASSERT_NE(nullptr, literal) << pattern;
    EXPECT_EQ(pattern, literal->text);
  }
}

TEST_F(ParserTest, alternation) {
  auto parsed = ParseOk("cat|dog|bird");
  const auto* alternation = parsed.root.As<rex::ast::Alternation>();
  ASSERT_NE(nullptr, alternation);
  ASSERT_EQ(3U, alternation->branches.size());
  EXPECT_EQ("dog", alternation->branches[1].As<rex::ast::Literal>()->text);
}

TEST_F(ParserTest, top_level_anchors) {
  auto parsed = ParseOk("^abc$");
  const auto* anchored = parsed.root.As<rex::ast::Anchored>();
  ASSERT_NE(nullptr, anchored);
  EXPECT_TRUE(anchored->start);
  EXPECT_TRUE(anchored->end);
  EXPECT_TRUE(anchored->inner->Is<rex::ast::Literal>());
}

TEST_F(ParserTest, multiline_anchors_are_assertions) {
  auto parsed = ParseOk("(?m)^a");
  EXPECT_TRUE(parsed.flags.multiline);
  const auto* sequence = parsed.root.As<rex::ast::Sequence>();
  ASSERT_NE(nullptr, sequence);
  const auto* assertion = sequence->items[0].As<rex::ast::Assertion>();
  ASSERT_NE(nullptr, assertion);
  EXPECT_EQ(rex::AssertionKind::kLineStart, assertion->kind);
}

TEST_F(ParserTest, nested_anchor_is_assertion) {
  auto parsed = ParseOk("(?:^a)");
  const auto* group = parsed.root.As<rex::ast::Group>();
  ASSERT_NE(nullptr, group);
  EXPECT_FALSE(group->index.has_value());
  const auto* sequence = group->inner->As<rex::ast::Sequence>();
  ASSERT_NE(nullptr, sequence);
  EXPECT_TRUE(sequence->items[0].Is<rex::ast::Assertion>());
}

TEST_F(ParserTest, groups_are_numbered_left_to_right) {
  auto parsed = ParseOk(R"((?P<year>\d{4})-((?<month>\d{2}))(?:x))");
  EXPECT_EQ(3U, parsed.group_count);
  ASSERT_EQ(4U, parsed.group_names.size());
  EXPECT_EQ("year", parsed.group_names[1]);
  EXPECT_EQ("", parsed.group_names[2]);
  EXPECT_EQ("month", parsed.group_names[3]);
}

TEST_F(ParserTest, lookaround_kinds) {
  auto check = [](std::string_view pattern, rex::LookaroundKind kind) {
    auto parsed = ParseOk(pattern);
    const auto* lookaround = parsed.root.As<rex::ast::Lookaround>();
    ASSERT_NE(nullptr, lookaround) << pattern;
    EXPECT_EQ(kind, lookaround->kind) << pattern;
  };
  check("(?=a)", rex::LookaroundKind::kPositiveLookahead);
  check("(?!a)", rex::LookaroundKind::kNegativeLookahead);
  check("(?<=a)", rex::LookaroundKind::kPositiveLookbehind);
  check("(?<!a)", rex::LookaroundKind::kNegativeLookbehind);
}

TEST_F(ParserTest, backreference) {
  auto parsed = ParseOk(R"((a)\1)");
  const auto* sequence = parsed.root.As<rex::ast::Sequence>();
  ASSERT_NE(nullptr, sequence);
  const auto* backref = sequence->items[1].As<rex::ast::Backreference>();
  ASSERT_NE(nullptr, backref);
  EXPECT_EQ(1U, backref->group);
}

// Classes and flags

TEST_F(ParserTest, class_with_ranges_and_escapes) {
  auto parsed = ParseOk(R"([a-c\d_-])");
  const auto* cls = parsed.root.As<rex::ast::Class>();
  ASSERT_NE(nullptr, cls);
  for (char c : std::string_view{"abc05_-"}) {
    EXPECT_TRUE(cls->set.Matches(c)) << c;
  }
  EXPECT_FALSE(cls->set.Matches('d'));
}

TEST_F(ParserTest, negated_class) {
  auto parsed = ParseOk("[^\"]");
  const auto* cls = parsed.root.As<rex::ast::Class>();
  ASSERT_NE(nullptr, cls);
  EXPECT_TRUE(cls->set.IsNegatedChar('"'));
}

TEST_F(ParserTest, case_insensitive_letters) {
  auto parsed = ParseOk("(?i)ab");
  EXPECT_TRUE(parsed.flags.case_insensitive);
  const auto* sequence = parsed.root.As<rex::ast::Sequence>();
  ASSERT_NE(nullptr, sequence);
  const auto* cls = sequence->items[0].As<rex::ast::Class>();
  ASSERT_NE(nullptr, cls);
  EXPECT_TRUE(cls->set.Matches('a'));
  EXPECT_TRUE(cls->set.Matches('A'));
}

TEST_F(ParserTest, dot_all) {
  auto dot = ParseOk(".");
  EXPECT_FALSE(dot.root.As<rex::ast::Class>()->set.Matches('\n'));
  auto dot_all = ParseOk("(?s).");
  EXPECT_TRUE(dot_all.root.As<rex::ast::Class>()->set.Matches('\n'));
}

TEST_F(ParserTest, ignored_flags) {
  auto parsed = ParseOk("(?xU-i)a");
  EXPECT_FALSE(parsed.flags.case_insensitive);
  EXPECT_TRUE(parsed.root.Is<rex::ast::Literal>());
}

// Errors

TEST_F(ParserTest, parse_errors) {
  for (std::string_view pattern :
       {"(abc", "abc)", "[abc", "[]", "[z-a]", R"(\q)", "*a", "a**", "+",
        "a{4,2}", "a{1001}", R"((?P<n>a)(?P<n>b))", R"(\2(a))", "abc\\",
        "(?P<1x>a)", "(?<=a)*"}) {
    EXPECT_EQ(rex::PatternErrorKind::kParse, ErrorKind(pattern)) << pattern;
  }
}

TEST_F(ParserTest, unsupported_constructs) {
  for (std::string_view pattern : {"(?>a)", "(?#note)a", "a(?i)b"}) {
    EXPECT_EQ(rex::PatternErrorKind::kUnsupportedFeature, ErrorKind(pattern))
      << pattern;
  }
}

TEST_F(ParserTest, nesting_limit) {
  std::string pattern(300, '(');
  pattern += 'a';
  pattern.append(300, ')');
  EXPECT_EQ(rex::PatternErrorKind::kUnsupportedFeature, ErrorKind(pattern));
}

TEST_F(ParserTest, invalid_utf8) {
  EXPECT_EQ(rex::PatternErrorKind::kParse, ErrorKind("a\xFF"));
}

TEST_F(ParserTest, error_to_string) {
  auto parsed = rex::Parse("(a");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_TRUE(parsed.error().ToString().starts_with("parse error: "))
    << parsed.error().ToString();
}
