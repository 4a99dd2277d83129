#include <rexile/optimization/literal.hpp>
#include <rexile/optimization/prefilter.hpp>
#include <rexile/parser/parser.hpp>

#include "tests_shared.hpp"

class LiteralTest : public TestBase {
 protected:
  using Strings = std::vector<std::string>;

  static std::optional<Strings> Alternation(std::string_view pattern) {
    auto parsed = rex::Parse(pattern);
    EXPECT_TRUE(parsed.has_value()) << pattern;
    return rex::ExtractAlternation(parsed->root);
  }

  static std::optional<Strings> Prefixes(std::string_view pattern) {
    auto parsed = rex::Parse(pattern);
    EXPECT_TRUE(parsed.has_value()) << pattern;
    return rex::ExtractPrefixes(parsed->root);
  }
};

// ExtractAlternation

TEST_F(LiteralTest, alternation_of_literals) {
  EXPECT_EQ((Strings{"foo", "bar", "baz"}), Alternation("foo|bar|baz"));
  EXPECT_EQ((Strings{"foo", "bar"}), Alternation("(?:foo|bar)"));
  EXPECT_EQ((Strings{"foo"}), Alternation("foo"));
}

TEST_F(LiteralTest, alternation_declined) {
  EXPECT_EQ(std::nullopt, Alternation("(foo|bar)"));
  EXPECT_EQ(std::nullopt, Alternation("foo|b.r"));
  EXPECT_EQ(std::nullopt, Alternation("foo|"));
  EXPECT_EQ(std::nullopt, Alternation(""));
}

// ExtractPrefixes

TEST_F(LiteralTest, literal_prefix) {
  EXPECT_EQ((Strings{"hello"}), Prefixes(R"(hello\d+)"));
  EXPECT_EQ((Strings{"id="}), Prefixes(R"(^id=\w+)"));
}

TEST_F(LiteralTest, prefixes_cross_groups) {
  EXPECT_EQ((Strings{"foobaz", "barbaz"}), Prefixes("(foo|bar)baz"));
  EXPECT_EQ((Strings{"AB", "Ab", "aB", "ab"}), Prefixes("(?i)ab"));
  EXPECT_EQ((Strings{"ab"}), Prefixes(R"(ab+c)"));
}

TEST_F(LiteralTest, prefixes_declined) {
  EXPECT_EQ(std::nullopt, Prefixes(R"(\d+)"));
  EXPECT_EQ(std::nullopt, Prefixes(".*foo"));
  EXPECT_EQ(std::nullopt, Prefixes("a?b"));
  EXPECT_EQ(std::nullopt, Prefixes(""));
}

TEST_F(LiteralTest, longest_common_prefix) {
  EXPECT_EQ("foo", rex::LongestCommonPrefix({"foobar", "foobaz", "foo"}));
  EXPECT_EQ("", rex::LongestCommonPrefix({"abc", "xyz"}));
  EXPECT_EQ("", rex::LongestCommonPrefix({}));
  // the shared lead byte of two different code points is not a prefix
  EXPECT_EQ("", rex::LongestCommonPrefix({"\xC3\xA9" "a", "\xC3\xA8" "b"}));
}

// Prefilter

TEST_F(LiteralTest, prefilter_kinds) {
  EXPECT_EQ(rex::Prefilter::Kind::kByte,
            rex::Prefilter::FromLiterals({"x"})->GetKind());
  EXPECT_EQ(rex::Prefilter::Kind::kSubstring,
            rex::Prefilter::FromLiterals({"abc", "abc"})->GetKind());
  EXPECT_EQ(rex::Prefilter::Kind::kFirstBytes,
            rex::Prefilter::FromLiterals({"ab", "cd", "ef"})->GetKind());
  EXPECT_EQ(rex::Prefilter::Kind::kAhoCorasick,
            rex::Prefilter::FromLiterals({"a", "b", "c", "d"})->GetKind());
  EXPECT_EQ(std::nullopt, rex::Prefilter::FromLiterals({}));
  EXPECT_EQ(std::nullopt, rex::Prefilter::FromLiterals({"", "a"}));
}

TEST_F(LiteralTest, prefilter_next) {
  auto byte = rex::Prefilter::FromLiterals({"x"});
  EXPECT_EQ(2U, byte->Next("aaxa", 0));
  EXPECT_EQ(std::nullopt, byte->Next("aaxa", 3));

  auto substring = rex::Prefilter::FromLiterals({"needle"});
  EXPECT_EQ(4U, substring->Next("hay needle", 0));

  auto first_bytes = rex::Prefilter::FromLiterals({"cat", "dog"});
  EXPECT_EQ(4U, first_bytes->Next("cow dog", 0));
  EXPECT_EQ(std::nullopt, first_bytes->Next("cow doe", 0));

  auto automaton =
    rex::Prefilter::FromLiterals({"one", "two", "three", "four"});
  EXPECT_EQ(5U, automaton->Next("zero two one", 0));
  EXPECT_EQ("aho-corasick", rex::ToString(automaton->GetKind()));
}
