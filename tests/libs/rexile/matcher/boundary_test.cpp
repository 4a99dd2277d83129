#include <rexile/matcher/boundary.hpp>

#include "tests_shared.hpp"

class BoundaryTest : public TestBase {};

TEST_F(BoundaryTest, word_boundaries) {
  EXPECT_EQ((std::vector<size_t>{0, 5, 6, 11}),
            rex::FindAll(rex::BoundaryType::kWord, "hello world"));
}

TEST_F(BoundaryTest, non_word_boundaries) {
  EXPECT_EQ((std::vector<size_t>{1, 2, 3, 4, 7, 8, 9, 10}),
            rex::FindAll(rex::BoundaryType::kNonWord, "hello world"));
}

TEST_F(BoundaryTest, text_edges_are_non_word) {
  EXPECT_FALSE(rex::IsAtBoundary("", 0));
  EXPECT_FALSE(rex::IsAtBoundary("  ", 0));
  EXPECT_FALSE(rex::IsAtBoundary("  ", 2));
  EXPECT_TRUE(rex::IsAtBoundary("a", 0));
  EXPECT_TRUE(rex::IsAtBoundary("a", 1));
  EXPECT_TRUE(rex::Matches(rex::BoundaryType::kNonWord, "", 0));
}

TEST_F(BoundaryTest, non_ascii_is_non_word) {
  // "é" is two bytes, neither is a word byte
  std::string_view text = "a\xC3\xA9";
  EXPECT_TRUE(rex::IsAtBoundary(text, 1));
  EXPECT_EQ((std::vector<size_t>{0, 1}),
            rex::FindAll(rex::BoundaryType::kWord, text));
}

TEST_F(BoundaryTest, find_first_from) {
  EXPECT_EQ(5U, rex::FindFirst(rex::BoundaryType::kWord, "hello world", 1));
  EXPECT_EQ(std::nullopt, rex::FindFirst(rex::BoundaryType::kWord, "   "));
}

TEST_F(BoundaryTest, assertions) {
  std::string_view text = "ab\ncd";
  EXPECT_TRUE(rex::MatchesAssertion(rex::AssertionKind::kTextStart, text, 0));
  EXPECT_FALSE(rex::MatchesAssertion(rex::AssertionKind::kTextStart, text, 3));
  EXPECT_TRUE(rex::MatchesAssertion(rex::AssertionKind::kLineStart, text, 3));
  EXPECT_TRUE(rex::MatchesAssertion(rex::AssertionKind::kLineEnd, text, 2));
  EXPECT_FALSE(rex::MatchesAssertion(rex::AssertionKind::kTextEnd, text, 2));
  EXPECT_TRUE(rex::MatchesAssertion(rex::AssertionKind::kTextEnd, text, 5));
  EXPECT_TRUE(
    rex::MatchesAssertion(rex::AssertionKind::kNotWordBoundary, text, 1));
}
