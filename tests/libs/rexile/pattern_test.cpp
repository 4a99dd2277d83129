#include <rexile/pattern.hpp>

#include <chrono>

#include "tests_shared.hpp"

class PatternTest : public TestBase {
 protected:
  static rex::Pattern New(std::string_view source,
                          const rex::PatternOptions& options = {}) {
    auto pattern = rex::Pattern::New(source, options);
    EXPECT_TRUE(pattern.has_value())
      << source << ": " << (pattern ? "" : pattern.error().message);
    return std::move(*pattern);
  }

  static std::vector<std::string_view> Texts(const rex::Pattern& pattern,
                                             std::string_view text) {
    std::vector<std::string_view> out;
    for (const auto& span : pattern.FindAll(text)) {
      out.push_back(span.In(text));
    }
    return out;
  }

  static rex::PatternErrorKind ErrorKind(
    std::string_view source, const rex::PatternOptions& options = {}) {
    auto pattern = rex::Pattern::New(source, options);
    EXPECT_FALSE(pattern.has_value()) << source;
    return pattern ? rex::PatternErrorKind::kParse : pattern.error().kind;
  }
};

// Back-end selection

TEST_F(PatternTest, backend_selection) {
  EXPECT_EQ("fast-path", New("hello").BackendName());
  EXPECT_EQ("fast-path", New("foo|bar").BackendName());
  EXPECT_EQ("capture-dfa", New(R"((\d{4})-(\d{2})-(\d{2}))").BackendName());
  EXPECT_EQ("dfa", New("^hello$").BackendName());
  EXPECT_EQ("dfa", New(R"(x\d+y)").BackendName());
  EXPECT_EQ("dfa", New("(?i)hello").BackendName());
  EXPECT_EQ("sequence", New("a{2,4}").BackendName());
  EXPECT_EQ("sequence", New("\xC3\xA9+").BackendName());
  EXPECT_EQ("lazy-dfa", New(R"(\w+\d)").BackendName());
  EXPECT_EQ("lazy-dfa", New(".*?b").BackendName());
  EXPECT_EQ("nfa", New("(a|b)+c").BackendName());
  EXPECT_EQ("nfa", New("foo(?=bar)").BackendName());
}

TEST_F(PatternTest, backend_options) {
  rex::PatternOptions no_fast_path;
  no_fast_path.enable_fast_path = false;
  EXPECT_EQ("literal", New("foo|bar", no_fast_path).BackendName());

  rex::PatternOptions no_capture_dfa;
  no_capture_dfa.enable_capture_dfa = false;
  auto pattern = New(R"((\w+)@(\w+))", no_capture_dfa);
  EXPECT_EQ("nfa", pattern.BackendName());
  auto captures = pattern.FindCaptures("mail bob@host now");
  ASSERT_TRUE(captures.has_value());
  EXPECT_EQ("host", (*captures)[2]);
}

// Errors

TEST_F(PatternTest, construction_errors) {
  EXPECT_EQ(rex::PatternErrorKind::kParse, ErrorKind("(abc"));
  EXPECT_EQ(rex::PatternErrorKind::kParse, ErrorKind("[z-a]"));
  EXPECT_EQ(rex::PatternErrorKind::kUnsupportedFeature, ErrorKind("(?>a)"));

  rex::PatternOptions small;
  small.size_limit = 10;
  EXPECT_EQ(rex::PatternErrorKind::kUnsupportedFeature,
            ErrorKind("(a|b){20}", small));
}

// Finding

TEST_F(PatternTest, empty_pattern) {
  auto pattern = New("");
  EXPECT_EQ((rex::Span{0, 0}), pattern.Find(""));
  EXPECT_TRUE(pattern.IsMatch("anything"));
  EXPECT_EQ((std::vector<rex::Span>{{0, 0}, {1, 1}, {2, 2}}),
            pattern.FindAll("ab"));
  // empty matches only occur on code point boundaries
  EXPECT_EQ((std::vector<rex::Span>{{0, 0}, {2, 2}}),
            pattern.FindAll("\xC3\xA9"));
}

TEST_F(PatternTest, anchoring) {
  auto pattern = New("^hello$");
  EXPECT_TRUE(pattern.IsMatch("hello"));
  EXPECT_FALSE(pattern.IsMatch("hello!"));
  EXPECT_FALSE(pattern.IsMatch("oh hello"));
}

TEST_F(PatternTest, greedy_counted) {
  EXPECT_EQ((rex::Span{0, 4}), New("a{2,4}").Find("aaaaa"));
  EXPECT_EQ((std::vector<std::string_view>{"aaaa", "aa"}),
            Texts(New("a{2,4}"), "aaaaaa"));
}

TEST_F(PatternTest, lazy) {
  EXPECT_EQ((rex::Span{0, 4}), New(".*?b").Find("aaabab"));
  EXPECT_EQ((rex::Span{0, 5}), New(".*?b").Find("axxxbyyybzzz"));
  EXPECT_EQ((std::vector<std::string_view>{"<a>", "<b>"}),
            Texts(New("<.+?>"), "<a><b>"));
}

TEST_F(PatternTest, word_boundary) {
  EXPECT_EQ((rex::Span{5, 7}), New(R"(\bis\b)").Find("this is it"));
}

TEST_F(PatternTest, lookahead_is_zero_width) {
  EXPECT_EQ((rex::Span{0, 3}), New("foo(?=bar)").Find("foobar"));
  EXPECT_EQ(std::nullopt, New("foo(?=bar)").Find("foobaz"));
  auto pattern = New(R"(\w+(?=!))");
  EXPECT_EQ((std::vector<std::string_view>{"hey", "you"}),
            Texts(pattern, "hey! hi you!"));
}

TEST_F(PatternTest, alternation_leftmost_first) {
  EXPECT_EQ((rex::Span{0, 7}), New("samwise|sam").Find("samwise"));
  EXPECT_EQ((rex::Span{0, 3}), New("sam|samwise").Find("samwise"));
  EXPECT_EQ((rex::Span{2, 5}), New("(?:x|abc)").Find("zzabc"));
  EXPECT_EQ((rex::Span{0, 3}), New("(foo|fo|f)").Find("foo"));
}

TEST_F(PatternTest, find_all_is_non_overlapping) {
  EXPECT_EQ((std::vector<rex::Span>{{0, 2}, {2, 4}}),
            New("aa").FindAll("aaaaa"));
  EXPECT_EQ((std::vector<std::string_view>{"1", "22", "333"}),
            Texts(New(R"(\d+)"), "a1b22c333"));
  EXPECT_EQ((std::vector<std::string_view>{"h", "llo", "w", "rld"}),
            Texts(New(R"(\w+)"), "h\xC3\xA9llo w\xC3\xB6rld"));
}

TEST_F(PatternTest, find_at) {
  auto pattern = New(R"(\d+)");
  EXPECT_EQ((rex::Span{6, 8}), pattern.FindAt("12 ab 34", 2));
  EXPECT_EQ(std::nullopt, pattern.FindAt("12", 3));
  // a position inside a code point moves to the next boundary
  EXPECT_EQ((rex::Span{2, 3}), pattern.FindAt("\xC3\xA9" "5", 1));
}

TEST_F(PatternTest, inner_literal_rejects_and_finds) {
  auto pattern = New(R"(\w+@\w+)");
  EXPECT_EQ("dfa", pattern.BackendName());
  EXPECT_EQ((std::vector<std::string_view>{"ann@a", "bo@b", "cy@c"}),
            Texts(pattern, "to ann@a, bo@b and cy@c."));
  EXPECT_FALSE(pattern.IsMatch("no address in this line"));
  EXPECT_FALSE(pattern.IsMatch("dangling @ sign"));
}

TEST_F(PatternTest, long_inputs_scan_once) {
  constexpr size_t kLength = 100000;
  const std::string run(kLength, 'a');
  const auto started = std::chrono::steady_clock::now();

  auto lazy = New(R"(\w+\d)");
  EXPECT_EQ("lazy-dfa", lazy.BackendName());
  EXPECT_FALSE(lazy.IsMatch(run));
  EXPECT_EQ(std::nullopt, lazy.Find(run));
  EXPECT_EQ((rex::Span{0, kLength + 1}), lazy.Find(run + "1"));

  auto dfa = New(R"(\w+@\w+)");
  EXPECT_EQ(std::nullopt, dfa.Find("@" + run));
  EXPECT_EQ((rex::Span{1, kLength + 3}), dfa.Find("@" + run + "@b"));

  auto sequence = New("a+\xC3\xA9");
  EXPECT_EQ("sequence", sequence.BackendName());
  EXPECT_EQ(std::nullopt, sequence.Find("\xC3\xA9" + run));
  EXPECT_EQ((rex::Span{0, kLength + 2}), sequence.Find(run + "\xC3\xA9"));

  auto captures = New("(a+)(c+)");
  EXPECT_EQ("capture-dfa", captures.BackendName());
  EXPECT_EQ(std::nullopt, captures.Find(run));
  auto groups = captures.FindCaptures(run + "c");
  ASSERT_TRUE(groups.has_value());
  EXPECT_EQ(kLength, (*groups)[1].size());
  EXPECT_EQ("c", (*groups)[2]);

  // a scan restarted at every position would take minutes here
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(PatternTest, deterministic) {
  auto pattern = New(R"((\w+)\s(\w+))");
  auto first = pattern.FindAllCaptures("a b c d");
  auto second = pattern.FindAllCaptures("a b c d");
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].GetSlots(), second[i].GetSlots());
  }
}

TEST_F(PatternTest, copies_share_matcher) {
  auto pattern = New(R"([a-z]+\d)");
  rex::Pattern copy = pattern;
  EXPECT_EQ(pattern.Source(), copy.Source());
  EXPECT_EQ(pattern.BackendName(), copy.BackendName());
  EXPECT_EQ(pattern.Find("xx abc1"), copy.Find("xx abc1"));
}

// Captures

TEST_F(PatternTest, date_captures) {
  auto pattern = New(R"((\d{4})-(\d{2})-(\d{2}))");
  EXPECT_EQ(3U, pattern.GroupCount());
  auto captures = pattern.FindCaptures("Date: 2024-01-15");
  ASSERT_TRUE(captures.has_value());
  EXPECT_EQ(4U, captures->Size());
  EXPECT_EQ("2024-01-15", (*captures)[0]);
  EXPECT_EQ("2024", (*captures)[1]);
  EXPECT_EQ("01", (*captures)[2]);
  EXPECT_EQ("15", (*captures)[3]);
  EXPECT_EQ((rex::Span{6, 10}), captures->Pos(1));

  auto exact = pattern.FindCaptures("2026-01-22");
  ASSERT_TRUE(exact.has_value());
  EXPECT_EQ((std::vector<std::string_view>{"2026-01-22", "2026", "01", "22"}),
            (std::vector<std::string_view>{(*exact)[0], (*exact)[1],
                                           (*exact)[2], (*exact)[3]}));
}

TEST_F(PatternTest, named_captures) {
  auto pattern = New(R"((?P<key>\w+)=(?<value>\d+))");
  auto captures = pattern.FindCaptures("x: port=8080");
  ASSERT_TRUE(captures.has_value());
  EXPECT_EQ("port", captures->Name("key"));
  EXPECT_EQ("8080", captures->Name("value"));
  EXPECT_EQ(std::nullopt, captures->Name("other"));
}

TEST_F(PatternTest, captures_without_groups) {
  auto captures = New(R"(\d+)").FindCaptures("ab 42");
  ASSERT_TRUE(captures.has_value());
  EXPECT_EQ(1U, captures->Size());
  EXPECT_EQ("42", (*captures)[0]);
  EXPECT_EQ(std::nullopt, New(R"(\d+)").FindCaptures("ab"));
}

TEST_F(PatternTest, find_all_captures) {
  auto pattern = New(R"((\w+)=(\d+))");
  auto all = pattern.FindAllCaptures("a=1 b=2 c=3");
  ASSERT_EQ(3U, all.size());
  EXPECT_EQ("a", all[0][1]);
  EXPECT_EQ("2", all[1][2]);
  EXPECT_EQ("c=3", all[2][0]);
}

TEST_F(PatternTest, lookbehind_and_backreference) {
  EXPECT_EQ((std::vector<std::string_view>{"42", "7"}),
            Texts(New(R"((?<=\$)\d+)"), "$42 and 13 and $7"));
  auto doubled = New(R"(\b(\w+) \1\b)");
  auto captures = doubled.FindCaptures("it is is fine");
  ASSERT_TRUE(captures.has_value());
  EXPECT_EQ("is is", (*captures)[0]);
}

// Replace and split

TEST_F(PatternTest, replace_all_with_groups) {
  auto pattern = New(R"((\w+)=(\d+))");
  EXPECT_EQ("a:[1] b:[2]", pattern.ReplaceAll("a=1 b=2", "$1:[$2]"));
  EXPECT_EQ("[a=1] [b=2]", pattern.ReplaceAll("a=1 b=2", "[$0]"));
}

TEST_F(PatternTest, replace_first_only) {
  auto pattern = New(R"(\d+)");
  EXPECT_EQ("a#b2", pattern.Replace("a1b2", "#"));
  EXPECT_EQ("a#b#", pattern.ReplaceAll("a1b2", "#"));
  EXPECT_EQ("none", pattern.Replace("none", "#"));
}

TEST_F(PatternTest, replace_dollar_rules) {
  auto pattern = New(R"((\d+))");
  // $ not followed by a digit is literal, a missing group is empty
  EXPECT_EQ("cost $$x$", pattern.Replace("cost 5", "$$x$"));
  EXPECT_EQ("cost []", pattern.Replace("cost 5", "[$9]"));
  // only one digit is read
  EXPECT_EQ("cost 50", pattern.Replace("cost 5", "$10"));
}

TEST_F(PatternTest, split) {
  using Parts = std::vector<std::string_view>;
  EXPECT_EQ((Parts{"a", "b", "c"}), New(R"(\s+)").Split("a  b   c"));
  EXPECT_EQ((Parts{"a", "b", ""}), New(",").Split("a,b,"));
  EXPECT_EQ((Parts{"", "a"}), New(",").Split(",a"));
  EXPECT_EQ((Parts{"abc"}), New(",").Split("abc"));
  EXPECT_EQ((Parts{""}), New(",").Split(""));
}
