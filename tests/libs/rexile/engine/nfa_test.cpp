#include <rexile/engine/nfa.hpp>
#include <rexile/parser/parser.hpp>

#include "tests_shared.hpp"

class NfaTest : public TestBase {
 protected:
  static rex::Nfa Compile(std::string_view pattern) {
    auto parsed = rex::Parse(pattern);
    EXPECT_TRUE(parsed.has_value()) << pattern;
    auto nfa = rex::Nfa::Compile(parsed->root, parsed->group_count, 100000);
    EXPECT_TRUE(nfa.has_value()) << pattern;
    return std::move(*nfa);
  }

  static std::vector<std::string_view> Groups(const rex::Nfa& nfa,
                                              std::string_view text) {
    auto slots = rex::MakeSlots(nfa.GroupCount());
    std::vector<std::string_view> groups;
    if (!nfa.FindCapturesAt(text, 0, slots)) {
      return groups;
    }
    for (size_t i = 0; i < slots.size(); i += 2) {
      groups.push_back(slots[i] == rex::kNoPos
                         ? std::string_view{"<none>"}
                         : text.substr(slots[i], slots[i + 1] - slots[i]));
    }
    return groups;
  }
};

// Matching semantics

TEST_F(NfaTest, greedy_counted) {
  auto nfa = Compile("a{2,4}");
  EXPECT_EQ((rex::Span{0, 4}), nfa.FindAt("aaaaa", 0));
  EXPECT_EQ(std::nullopt, nfa.FindAt("a", 0));
}

TEST_F(NfaTest, lazy_quantifiers) {
  EXPECT_EQ((rex::Span{0, 4}), Compile(".*?b").FindAt("aaabab", 0));
  EXPECT_EQ((rex::Span{0, 4}), Compile(".*b").FindAt("aaab", 0));
  EXPECT_EQ((rex::Span{0, 6}), Compile(".*b").FindAt("aaabab", 0));
  EXPECT_EQ((rex::Span{0, 2}), Compile("a{2,4}?").FindAt("aaaa", 0));
}

TEST_F(NfaTest, alternation_is_leftmost_first) {
  EXPECT_EQ((rex::Span{0, 3}), Compile("foo|foobar").FindAt("foobar", 0));
  EXPECT_EQ((rex::Span{0, 6}), Compile("foobar|foo").FindAt("foobar", 0));
  EXPECT_EQ((rex::Span{2, 5}), Compile("x+y|abc").FindAt("zzabc", 0));
}

TEST_F(NfaTest, empty_pattern) {
  auto nfa = Compile("");
  EXPECT_EQ((rex::Span{0, 0}), nfa.FindAt("", 0));
  EXPECT_EQ((rex::Span{2, 2}), nfa.FindAt("abc", 2));
}

TEST_F(NfaTest, anchors) {
  auto nfa = Compile("^abc$");
  EXPECT_TRUE(nfa.IsMatch("abc"));
  EXPECT_FALSE(nfa.IsMatch("abcd"));
  EXPECT_FALSE(nfa.IsMatch("xabc"));
  EXPECT_EQ(std::nullopt, nfa.FindAt("abc", 1));

  auto lines = Compile("(?m)^b$");
  EXPECT_EQ((rex::Span{2, 3}), lines.FindAt("a\nb\nc", 0));
}

TEST_F(NfaTest, word_boundary) {
  auto nfa = Compile(R"(\bcat\b)");
  EXPECT_EQ((rex::Span{4, 7}), nfa.FindAt("the cat sat", 0));
  EXPECT_EQ(std::nullopt, nfa.FindAt("concatenate", 0));
  EXPECT_EQ((rex::Span{3, 6}), Compile(R"(\Bcat)").FindAt("concat", 0));
}

TEST_F(NfaTest, utf8_dot) {
  auto nfa = Compile("a.c");
  EXPECT_EQ((rex::Span{0, 4}), nfa.FindAt("a\xC3\xA9" "c", 0));
  EXPECT_EQ(std::nullopt, Compile("a.c").FindAt("a\nc", 0));
  EXPECT_TRUE(Compile("(?s)a.c").IsMatch("a\nc"));
}

TEST_F(NfaTest, case_insensitive) {
  auto nfa = Compile("(?i)hello");
  EXPECT_EQ((rex::Span{4, 9}), nfa.FindAt("say HeLLo", 0));
}

// Captures

TEST_F(NfaTest, date_captures) {
  auto nfa = Compile(R"((\d{4})-(\d{2})-(\d{2}))");
  EXPECT_EQ((std::vector<std::string_view>{"2024-01-15", "2024", "01", "15"}),
            Groups(nfa, "Date: 2024-01-15"));
}

TEST_F(NfaTest, optional_group_does_not_participate) {
  auto nfa = Compile("(a)?(b)");
  EXPECT_EQ((std::vector<std::string_view>{"b", "<none>", "b"}),
            Groups(nfa, "b"));
}

TEST_F(NfaTest, repeated_group_keeps_last_iteration) {
  auto nfa = Compile("(?:(a)|(b))+");
  EXPECT_EQ((std::vector<std::string_view>{"ab", "a", "b"}), Groups(nfa, "ab"));
  EXPECT_EQ((std::vector<std::string_view>{"abc", "c"}),
            Groups(Compile(R"((\w)+)"), "abc"));
}

TEST_F(NfaTest, alternation_in_group) {
  auto nfa = Compile("(cat|dog)s");
  EXPECT_EQ((std::vector<std::string_view>{"dogs", "dog"}),
            Groups(nfa, "hotdogs"));
}

// Zero-width constructs

TEST_F(NfaTest, lookahead) {
  auto positive = Compile("foo(?=bar)");
  EXPECT_EQ((rex::Span{0, 3}), positive.FindAt("foobar", 0));
  EXPECT_EQ(std::nullopt, positive.FindAt("foobaz", 0));

  auto negative = Compile("foo(?!bar)");
  EXPECT_EQ((rex::Span{6, 9}), negative.FindAt("foobarfoobaz", 0));
  EXPECT_TRUE(positive.HasZeroWidth());
}

TEST_F(NfaTest, lookbehind) {
  auto positive = Compile(R"((?<=\$)\d+)");
  EXPECT_EQ((rex::Span{7, 9}), positive.FindAt("cost: $42", 0));
  EXPECT_EQ(std::nullopt, positive.FindAt("cost: 42", 0));

  auto negative = Compile(R"((?<!-)\b\d+)");
  EXPECT_EQ((rex::Span{4, 5}), negative.FindAt("-12 7", 0));

  auto variable = Compile(R"((?<=ab+)c)");
  EXPECT_EQ((rex::Span{4, 5}), variable.FindAt("abbbc", 0));
  EXPECT_EQ(std::nullopt, variable.FindAt("ac", 0));
}

TEST_F(NfaTest, lookbehind_sees_text_before_from) {
  auto nfa = Compile("(?<=a)b");
  EXPECT_EQ((rex::Span{1, 2}), nfa.FindAt("ab", 1));
}

TEST_F(NfaTest, backreference) {
  auto nfa = Compile(R"((\w+) \1)");
  EXPECT_EQ((std::vector<std::string_view>{"hey hey", "hey"}),
            Groups(nfa, "say hey hey"));
  EXPECT_EQ(std::nullopt, nfa.FindAt("hey you", 0));
  EXPECT_TRUE(Compile(R"((a)(b)\2\1)").IsMatch("xabba"));
}

TEST_F(NfaTest, backreference_many_pending_threads) {
  // every start and length of the group resumes at its own position
  auto nfa = Compile(R"((a+)\1b)");
  const std::string text = std::string(64, 'a') + "b";
  auto span = nfa.FindAt(text, 0);
  ASSERT_TRUE(span.has_value());
  EXPECT_EQ(65U, span->end);
  EXPECT_EQ(1U, span->Length() % 2);
  EXPECT_FALSE(nfa.IsMatch(std::string(64, 'a')));
}

// Program construction

TEST_F(NfaTest, program_layout) {
  auto nfa = Compile("ab");
  const auto& program = nfa.Program();
  ASSERT_FALSE(program.empty());
  EXPECT_EQ(rex::NfaInst::Op::kSave, program.front().op);
  EXPECT_EQ(rex::NfaInst::Op::kMatch, program.back().op);
  EXPECT_FALSE(nfa.HasZeroWidth());
  EXPECT_EQ(2U, nfa.SlotCount());
}

TEST_F(NfaTest, size_limit) {
  auto parsed = rex::Parse("(?:abcdefghij){1000}");
  ASSERT_TRUE(parsed.has_value());
  auto nfa = rex::Nfa::Compile(parsed->root, parsed->group_count, 1000);
  ASSERT_FALSE(nfa.has_value());
  EXPECT_EQ(rex::PatternErrorKind::kUnsupportedFeature, nfa.error().kind);
}
