#include "text/lines.hpp"

#include <gtest/gtest.h>

using namespace sublocator;

TEST(FindTerminatorTest, Kinds) {
    auto lf = text::find_terminator("ab\ncd", 0);
    EXPECT_TRUE(lf.found());
    EXPECT_EQ(lf.offset, 2u);
    EXPECT_EQ(lf.width, 1u);

    auto crlf = text::find_terminator("ab\r\ncd", 0);
    EXPECT_EQ(crlf.offset, 2u);
    EXPECT_EQ(crlf.width, 2u);

    auto cr = text::find_terminator("ab\rcd", 0);
    EXPECT_EQ(cr.offset, 2u);
    EXPECT_EQ(cr.width, 1u);
}

TEST(FindTerminatorTest, NotFound) {
    auto none = text::find_terminator("abc", 0);
    EXPECT_FALSE(none.found());
    EXPECT_EQ(none.offset, 3u);
}

TEST(FindTerminatorTest, StartsFromOffset) {
    auto t = text::find_terminator("a\nb\nc", 2);
    EXPECT_EQ(t.offset, 3u);
}

TEST(SplitLinesTest, SingleLine) {
    auto lines = text::split_lines("no terminator");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "no terminator");
    EXPECT_EQ(lines[0].number, 1);
}

TEST(SplitLinesTest, EmptyTextIsOneLine) {
    auto lines = text::split_lines("");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "");
}

TEST(SplitLinesTest, MixedTerminators) {
    auto lines = text::split_lines("a\r\nb\nc\rd");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].text, "a");
    EXPECT_EQ(lines[1].text, "b");
    EXPECT_EQ(lines[2].text, "c");
    EXPECT_EQ(lines[3].text, "d");
    EXPECT_EQ(lines[3].number, 4);
}

TEST(SplitLinesTest, TrailingTerminatorYieldsEmptyLine) {
    auto lines = text::split_lines("x\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].text, "");
    EXPECT_EQ(lines[1].number, 2);
}

TEST(SplitLinesTest, CrCrLf) {
    // "\r" then "\r\n": two terminators, three lines
    auto lines = text::split_lines("a\r\r\nb");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1].text, "");
    EXPECT_EQ(lines[2].text, "b");
}
