#include "match/match_stream.hpp"
#include "pattern/pattern.hpp"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>

using namespace sublocator;
using namespace sublocator::pattern;

// ============================================================================
// Test helpers
// ============================================================================

static Matcher regex_matcher(std::string_view source) {
    auto compiled = Regex::compile(source);
    EXPECT_TRUE(compiled.is_ok()) << "Failed to compile: " << source;
    return Matcher{compiled.value()};
}

// Concatenate preceding + matched for every span.
static std::string rejoin(const std::vector<match::MatchSpan>& spans) {
    std::string out;
    for (const auto& span : spans) {
        out += span.preceding;
        out += span.matched;
    }
    return out;
}

// ============================================================================
// Literal matching
// ============================================================================

TEST(MatchStreamTest, LiteralSpans) {
    Matcher matcher{Literal{"a"}};
    match::MatchStream stream("banana", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0].preceding, "b");
    EXPECT_EQ(spans[0].matched, "a");
    EXPECT_EQ(spans[0].offset, 1u);
    EXPECT_EQ(spans[1].preceding, "n");
    EXPECT_EQ(spans[2].offset, 5u);
    EXPECT_TRUE(stream.at_end());
}

TEST(MatchStreamTest, LiteralNotReinterpretedAsRegex) {
    Matcher matcher{Literal{"a.c"}};
    match::MatchStream stream("abc a.c", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].offset, 4u);
}

TEST(MatchStreamTest, NonOverlapping) {
    Matcher matcher{Literal{"aa"}};
    match::MatchStream stream("aaaaa", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].offset, 0u);
    EXPECT_EQ(spans[1].offset, 2u);
}

TEST(MatchStreamTest, NoMatch) {
    Matcher matcher{Literal{"xyz"}};
    match::MatchStream stream("abcabc", matcher);
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_TRUE(stream.at_end());
    EXPECT_FALSE(stream.next().has_value());
}

TEST(MatchStreamTest, SpansCoverInputWithoutGaps) {
    std::string_view source = "one\ntwo one\r\nthree one";
    Matcher matcher{Literal{"one"}};
    match::MatchStream stream(source, matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 3u);
    // Everything up to the end of the last match, in order
    EXPECT_EQ(rejoin(spans), source);
}

// ============================================================================
// Regex matching
// ============================================================================

TEST(MatchStreamTest, RegexAcrossLines) {
    Matcher matcher = regex_matcher("o\\nba");
    match::MatchStream stream("foo\nbar", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].preceding, "fo");
    EXPECT_EQ(spans[0].matched, "o\nba");
}

TEST(MatchStreamTest, RegexSeesContextBeforeSearchStart) {
    // \b after the first match must consider the preceding character
    Matcher matcher = regex_matcher("\\bab");
    match::MatchStream stream("ab xab ab", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].offset, 0u);
    EXPECT_EQ(spans[1].offset, 7u);
}

TEST(MatchStreamTest, ZeroWidthMatchesAdvance) {
    Matcher matcher = regex_matcher("x*");
    match::MatchStream stream("ab", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0].offset, 0u);
    EXPECT_EQ(spans[1].offset, 1u);
    EXPECT_EQ(spans[1].preceding, "a");
    EXPECT_EQ(spans[2].offset, 2u);
    EXPECT_EQ(spans[2].preceding, "b");
}

TEST(MatchStreamTest, ZeroWidthStepsWholeCodepoints) {
    Matcher matcher = regex_matcher("");
    match::MatchStream stream("\xC3\xA9z", matcher);
    auto spans = stream.collect_all();

    // Before é, before z, at the end
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[1].offset, 2u);
    EXPECT_EQ(spans[1].preceding, "\xC3\xA9");
    EXPECT_EQ(spans[2].offset, 3u);
}

TEST(MatchStreamTest, ZeroWidthNeverSplitsCrLf) {
    Matcher empty = regex_matcher("");
    match::MatchStream all_positions("a\r\nb", empty);
    auto spans = all_positions.collect_all();
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(spans[1].offset, 1u);
    EXPECT_EQ(spans[2].offset, 3u);
    EXPECT_EQ(spans[2].preceding, "\r\n");
    EXPECT_EQ(spans[3].offset, 4u);

    // RE2's multi-line $ matches before the '\n'; it is reported on the '\r'
    Matcher line_end = regex_matcher("(?m)$");
    match::MatchStream ends("a\r\nb", line_end);
    spans = ends.collect_all();
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].offset, 1u);
    EXPECT_EQ(spans[0].preceding, "a");
    EXPECT_EQ(spans[1].offset, 4u);
    EXPECT_EQ(spans[1].preceding, "\r\nb");
}

TEST(MatchStreamTest, ZeroWidthAfterConsumedCrIsDropped) {
    Matcher matcher = regex_matcher("(?m)\\r|$");
    match::MatchStream stream("a\r\nb", matcher);
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].matched, "\r");
    EXPECT_EQ(spans[1].offset, 4u);
    EXPECT_EQ(spans[1].preceding, "\nb");
    EXPECT_EQ(rejoin(spans), "a\r\nb");
}

TEST(MatchStreamTest, BorrowsOnlyNamedMatchers) {
    static_assert(std::is_constructible_v<match::MatchStream, std::string_view, const Matcher&>);
    static_assert(!std::is_constructible_v<match::MatchStream, std::string_view, Matcher>);
    static_assert(!std::is_constructible_v<match::MatchStream, std::string_view, Literal>);
}

TEST(MatchStreamTest, LeftmostFirstAlternation) {
    auto set = normalize(Pattern{LiteralSet{{"ab", "abc"}}});
    ASSERT_TRUE(set.is_ok());
    match::MatchStream stream("abc", set.value());
    auto spans = stream.collect_all();

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].matched, "ab");
}

// ============================================================================
// Laziness
// ============================================================================

TEST(MatchStreamTest, ProducesOneSpanPerCall) {
    Matcher matcher{Literal{"x"}};
    match::MatchStream stream("x x x", matcher);

    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->offset, 0u);
    EXPECT_FALSE(stream.at_end());

    auto second = stream.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->preceding, " ");
    EXPECT_EQ(second->offset, 2u);
}
