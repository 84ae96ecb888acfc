#include <chklib/checkpoint/pattern_matcher.hh>
#include <gtest/gtest.h>
#include <string>

using chk::PatternMatcher;

namespace {

PatternMatcher compile(const std::string& pattern) {
    auto res = PatternMatcher::compile(pattern);
    if (res.is_err()) {
        ADD_FAILURE() << std::move(res).unwrap_err();
        return std::move(PatternMatcher::compile("^$")).unwrap();
    }
    return std::move(res).unwrap();
}

} // namespace

// NOLINTNEXTLINE
TEST(pattern_matcher, searches_anywhere) {
    auto matcher = compile(R"(for\s+\w+\s+in\s+range\()");
    EXPECT_TRUE(matcher.search("x = 0\nfor i in range(10):\n    x += i\n"));
    EXPECT_FALSE(matcher.search("while i < 10:\n    i += 1\n"));
    EXPECT_FALSE(matcher.search(""));
}

// NOLINTNEXTLINE
TEST(pattern_matcher, multiline_anchors) {
    auto matcher = compile(R"(^def \w+\(.*\):$)");
    EXPECT_TRUE(matcher.search("x = 1\ndef solve(n):\n    return n\n"));
    EXPECT_FALSE(matcher.search("x = 1\n  def solve(n):\n"));
}

// NOLINTNEXTLINE
TEST(pattern_matcher, is_case_sensitive) {
    auto matcher = compile("print");
    EXPECT_TRUE(matcher.search("print(1)"));
    EXPECT_FALSE(matcher.search("PRINT(1)"));
    EXPECT_TRUE(compile("(?:P|p)rint").search("PRINT Print"));
}

// NOLINTNEXTLINE
TEST(pattern_matcher, invalid_pattern) {
    auto res = PatternMatcher::compile("(unclosed");
    ASSERT_TRUE(res.is_err());
    auto error = std::move(res).unwrap_err();
    EXPECT_EQ(error.rfind("invalid regular expression `(unclosed`: ", 0), 0) << error;
    EXPECT_TRUE(PatternMatcher::compile("[z-a]").is_err());
}
