#include <rexile/pattern_cache.hpp>

#include <atomic>
#include <thread>

#include "tests_shared.hpp"

class PatternCacheTest : public TestBase {};

TEST_F(PatternCacheTest, get_reuses_compiled_pattern) {
  rex::PatternCache cache;
  EXPECT_EQ(0U, cache.Size());

  auto first = cache.Get(R"(\d+)");
  ASSERT_TRUE(first.has_value());
  auto second = cache.Get(R"(\d+)");
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(1U, cache.Size());
  EXPECT_EQ(first->Source(), second->Source());
  EXPECT_EQ(first->BackendName(), second->BackendName());

  ASSERT_TRUE(cache.Get("[a-z]+").has_value());
  EXPECT_EQ(2U, cache.Size());

  cache.Clear();
  EXPECT_EQ(0U, cache.Size());
}

TEST_F(PatternCacheTest, errors_are_not_cached) {
  rex::PatternCache cache;
  auto pattern = cache.Get("(abc");
  ASSERT_FALSE(pattern.has_value());
  EXPECT_EQ(rex::PatternErrorKind::kParse, pattern.error().kind);
  EXPECT_EQ(0U, cache.Size());

  // the same failure is reported again
  EXPECT_EQ(pattern.error(), cache.Get("(abc").error());
}

TEST_F(PatternCacheTest, options_apply_to_entries) {
  rex::PatternOptions options;
  options.enable_fast_path = false;
  rex::PatternCache cache{options};
  auto pattern = cache.Get("foo|bar");
  ASSERT_TRUE(pattern.has_value());
  EXPECT_EQ("literal", pattern->BackendName());
}

TEST_F(PatternCacheTest, free_functions) {
  rex::PatternCache cache;

  auto matched = rex::IsMatch(R"(\d+)", "abc123", cache);
  ASSERT_TRUE(matched.has_value());
  EXPECT_TRUE(*matched);

  auto missed = rex::IsMatch(R"(\d+)", "abc", cache);
  ASSERT_TRUE(missed.has_value());
  EXPECT_FALSE(*missed);

  auto found = rex::Find("b+", "abbbc", cache);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ((rex::Span{1, 4}), *found);

  auto none = rex::Find("z", "abc", cache);
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(std::nullopt, *none);

  EXPECT_FALSE(rex::IsMatch("[b-a]", "abc", cache).has_value());
  EXPECT_FALSE(rex::GetPattern("(?>x)", cache).has_value());
  EXPECT_EQ(3U, cache.Size());
}

TEST_F(PatternCacheTest, global_cache) {
  EXPECT_EQ(&rex::PatternCache::Global(), &rex::PatternCache::Global());

  auto pattern = rex::GetPattern(R"(\w+@\w+)");
  ASSERT_TRUE(pattern.has_value());
  EXPECT_TRUE(pattern->IsMatch("mail bob@host"));

  auto found = rex::Find(R"(\w+@\w+)", "mail bob@host");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ((rex::Span{5, 13}), *found);

  auto matched = rex::IsMatch("^abc$", "abc");
  ASSERT_TRUE(matched.has_value());
  EXPECT_TRUE(*matched);
}

TEST_F(PatternCacheTest, concurrent_access) {
  rex::PatternCache cache;
  const std::vector<std::string> sources{R"(\d+)", "[a-z]+", "a|b|c",
                                         R"((\w+)=(\d+))", "x*y"};
  constexpr size_t kThreads = 8;
  constexpr size_t kIterations = 200;

  std::atomic<size_t> failures{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (size_t t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (size_t i = 0; i < kIterations; ++i) {
        const auto& source = sources[(t + i) % sources.size()];
        auto pattern = cache.Get(source);
        if (!pattern || pattern->Source() != source) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(0U, failures.load());
  EXPECT_EQ(sources.size(), cache.Size());
}
