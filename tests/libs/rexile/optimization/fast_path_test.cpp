#include <rexile/optimization/fast_path.hpp>
#include <rexile/parser/parser.hpp>

#include "tests_shared.hpp"

class FastPathTest : public TestBase {
 protected:
  static std::optional<rex::FastPath> Detect(std::string_view pattern) {
    auto parsed = rex::Parse(pattern);
    EXPECT_TRUE(parsed.has_value()) << pattern;
    return rex::FastPath::Detect(parsed->root);
  }

  static void AssertKind(std::string_view pattern, rex::FastPath::Kind kind) {
    auto fast_path = Detect(pattern);
    ASSERT_TRUE(fast_path.has_value()) << pattern;
    EXPECT_EQ(kind, fast_path->GetKind()) << pattern;
  }
};

// Detection

TEST_F(FastPathTest, detect_shapes) {
  AssertKind("hello", rex::FastPath::Kind::kLiteral);
  AssertKind("", rex::FastPath::Kind::kLiteral);
  AssertKind(R"(\d+)", rex::FastPath::Kind::kDigits);
  AssertKind(R"(\w+)", rex::FastPath::Kind::kWord);
  AssertKind(R"([a-zA-Z_]\w*)", rex::FastPath::Kind::kIdentifier);
  AssertKind(R"(import\s+)", rex::FastPath::Kind::kLiteralWhitespace);
  AssertKind(R"("[^"]+")", rex::FastPath::Kind::kQuoted);
  AssertKind(R"(let\s+"[^"]+")", rex::FastPath::Kind::kLiteralWhitespaceQuoted);
  AssertKind(R"(port\s+\d+)", rex::FastPath::Kind::kLiteralWhitespaceDigits);
  AssertKind(R"(fn\s+\w+)", rex::FastPath::Kind::kLiteralWhitespaceWord);
  AssertKind("cat|dog|bird", rex::FastPath::Kind::kLiteralAlternation);
}

TEST_F(FastPathTest, detect_declines) {
  for (std::string_view pattern :
       {R"(\d+?)", R"(\d*)", R"(a\d+)", R"(\s+)", R"([a-z]\w*)",
        R"("[^']+")", R"(^\d+)", "cat|d.g", R"(import\s*)"}) {
    EXPECT_FALSE(Detect(pattern).has_value()) << pattern;
  }
}

// Scanning

TEST_F(FastPathTest, literal) {
  auto fast_path = Detect("needle");
  EXPECT_EQ((rex::Span{4, 10}), fast_path->FindAt("hay needle", 0));
  EXPECT_EQ(std::nullopt, fast_path->FindAt("hay needle", 5));

  auto empty = Detect("");
  EXPECT_EQ((rex::Span{1, 1}), empty->FindAt("abc", 1));
  EXPECT_EQ((rex::Span{0, 0}), empty->FindAt("", 0));
}

TEST_F(FastPathTest, runs) {
  EXPECT_EQ((rex::Span{3, 6}), Detect(R"(\d+)")->FindAt("ab 123 45", 0));
  EXPECT_EQ((rex::Span{5, 6}), Detect(R"(\d+)")->FindAt("ab 123 45", 5));
  EXPECT_EQ((rex::Span{7, 9}), Detect(R"(\d+)")->FindAt("ab 123 45", 6));
  EXPECT_EQ((rex::Span{1, 5}), Detect(R"(\w+)")->FindAt(" a_b9-", 0));
  EXPECT_EQ((rex::Span{3, 8}),
            Detect(R"([a-zA-Z_]\w*)")->FindAt("123abc_9 x", 0));
  EXPECT_FALSE(Detect(R"(\d+)")->IsMatch("no digits"));
}

TEST_F(FastPathTest, literal_whitespace) {
  auto fast_path = Detect(R"(import\s+)");
  EXPECT_EQ((rex::Span{0, 9}), fast_path->FindAt("import   x", 0));
  EXPECT_EQ(std::nullopt, fast_path->FindAt("important", 0));
}

TEST_F(FastPathTest, literal_whitespace_digits) {
  auto fast_path = Detect(R"(port\s+\d+)");
  EXPECT_EQ((rex::Span{8, 17}), fast_path->FindAt("port:80 port  443", 0));
  EXPECT_EQ(std::nullopt, fast_path->FindAt("port x", 0));
}

TEST_F(FastPathTest, literal_whitespace_word) {
  auto fast_path = Detect(R"(fn\s+\w+)");
  EXPECT_EQ((rex::Span{0, 7}), fast_path->FindAt("fn main()", 0));
}

TEST_F(FastPathTest, quoted) {
  auto fast_path = Detect(R"("[^"]+")");
  EXPECT_EQ((rex::Span{0, 3}), fast_path->FindAt(R"("a" "b")", 0));
  EXPECT_EQ((rex::Span{2, 5}), fast_path->FindAt(R"("a" "b")", 1));
  // an empty pair is skipped, its closing quote opens the next candidate
  EXPECT_EQ((rex::Span{5, 12}), fast_path->FindAt(R"(say "" and "hi")", 0));
  EXPECT_EQ(std::nullopt, fast_path->FindAt(R"(say "")", 0));
}

TEST_F(FastPathTest, literal_whitespace_quoted) {
  auto fast_path = Detect(R"(let\s+"[^"]+")");
  EXPECT_EQ((rex::Span{4, 15}), fast_path->FindAt(R"(x = let "value")", 0));
  EXPECT_EQ(std::nullopt, fast_path->FindAt(R"(let "")", 0));
}

TEST_F(FastPathTest, literal_alternation) {
  auto fast_path = Detect("cat|dog");
  EXPECT_EQ((rex::Span{3, 6}), fast_path->FindAt("hotdog cat", 0));
  EXPECT_EQ((rex::Span{7, 10}), fast_path->FindAt("hotdog cat", 4));
}

TEST_F(FastPathTest, kind_names) {
  EXPECT_EQ("literal", rex::ToString(rex::FastPath::Kind::kLiteral));
  EXPECT_EQ("literal-whitespace-quoted",
            rex::ToString(rex::FastPath::Kind::kLiteralWhitespaceQuoted));
}
