#include <rexile/engine/aho_corasick.hpp>

#include "tests_shared.hpp"

class AhoCorasickTest : public TestBase {
 protected:
  static std::vector<std::pair<size_t, uint32_t>> All(
    const rex::AhoCorasick& ac, std::string_view text) {
    std::vector<std::pair<size_t, uint32_t>> out;
    for (size_t pos = 0;;) {
      auto match = ac.FindAt(text, pos);
      if (!match) {
        break;
      }
      out.emplace_back(match->start, match->pattern);
      pos = match->end;
    }
    return out;
  }
};

TEST_F(AhoCorasickTest, leftmost_start_wins) {
  rex::AhoCorasick ac{std::vector<std::string>{"bcd", "ab"}};
  auto match = ac.FindAt("xabcd", 0);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(1U, match->start);
  EXPECT_EQ(3U, match->end);
  EXPECT_EQ(1U, match->pattern);
}

TEST_F(AhoCorasickTest, ties_prefer_earlier_pattern) {
  rex::AhoCorasick first{std::vector<std::string>{"sam", "samwise"}};
  EXPECT_EQ(3U, first.FindAt("samwise", 0)->end);
  rex::AhoCorasick second{std::vector<std::string>{"samwise", "sam"}};
  EXPECT_EQ(7U, second.FindAt("samwise", 0)->end);
}

TEST_F(AhoCorasickTest, suffix_outputs) {
  rex::AhoCorasick ac{std::vector<std::string>{"he", "she", "his", "hers"}};
  EXPECT_EQ((std::vector<std::pair<size_t, uint32_t>>{{1, 1}, {7, 2}}),
            All(ac, "ushers his"));
}

TEST_F(AhoCorasickTest, no_match) {
  rex::AhoCorasick ac{std::vector<std::string>{"foo", "bar"}};
  EXPECT_FALSE(ac.IsMatch("fo ba"));
  EXPECT_EQ(std::nullopt, ac.FindAt("foo", 1));
  EXPECT_EQ(std::nullopt, ac.FindAt("", 0));
}

TEST_F(AhoCorasickTest, state_count) {
  rex::AhoCorasick ac{std::vector<std::string>{"ab", "ac"}};
  EXPECT_EQ(4U, ac.StateCount());
  EXPECT_EQ(2U, ac.Patterns().size());
}
