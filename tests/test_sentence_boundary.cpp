#include <gtest/gtest.h>

#include "SentenceBoundary.hpp"

using cjkreflow::detail::EndsWithCjkBracketBoundary;
using cjkreflow::detail::EndsWithSentenceBoundary;

TEST(SentenceBoundary, StrongEndAtEveryLevel) {
    for (int level = 1; level <= 3; ++level) {
        EXPECT_TRUE(EndsWithSentenceBoundary(U"今天天氣很好。", level));
        EXPECT_TRUE(EndsWithSentenceBoundary(U"真的嗎？  ", level));
        EXPECT_TRUE(EndsWithSentenceBoundary(U"Really!", level));
    }
}

TEST(SentenceBoundary, NoBoundaryMidSentence) {
    for (int level = 1; level <= 3; ++level) {
        EXPECT_FALSE(EndsWithSentenceBoundary(U"今天天氣", level));
        EXPECT_FALSE(EndsWithSentenceBoundary(U"然後，", level));
        EXPECT_FALSE(EndsWithSentenceBoundary(U"", level));
    }
}

TEST(SentenceBoundary, OcrAsciiPunctAfterCjk) {
    EXPECT_TRUE(EndsWithSentenceBoundary(U"他走了.", 3));
    EXPECT_TRUE(EndsWithSentenceBoundary(U"他說:", 3));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"version 1.", 3));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"see Fig.", 2));
}

TEST(SentenceBoundary, CloserAfterStrongEndIsLenientOnly) {
    EXPECT_TRUE(EndsWithSentenceBoundary(U"「你好。」", 2));
    EXPECT_TRUE(EndsWithSentenceBoundary(U"（完。）", 2));
    EXPECT_TRUE(EndsWithSentenceBoundary(U"「他走了.」", 2));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"「你好。」", 3));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"「你好」", 2));
}

TEST(SentenceBoundary, FullwidthColonAndEllipsis) {
    EXPECT_TRUE(EndsWithSentenceBoundary(U"他說：", 2));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"他說：", 3));

    EXPECT_TRUE(EndsWithSentenceBoundary(U"很久以前……", 2));
    EXPECT_TRUE(EndsWithSentenceBoundary(U"很久以前...", 2));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"很久以前……", 3));
}

TEST(SentenceBoundary, BareSemicolonOnlyVeryLenient) {
    EXPECT_TRUE(EndsWithSentenceBoundary(U"第一點；", 1));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"第一點；", 2));
    EXPECT_TRUE(EndsWithSentenceBoundary(U"note;", 1));
    EXPECT_FALSE(EndsWithSentenceBoundary(U"note;", 2));
}

TEST(SentenceBoundary, LevelsAreMonotonic) {
    const std::u32string_view samples[] = {
        U"今天。", U"「你好。」", U"他說：", U"很久以前……", U"第一點；", U"他說:",
        U"今天天氣", U"Fig.", U"（附錄）", U"然後，"
    };

    for (const auto s: samples) {
        // stricter level true → every looser level true
        if (EndsWithSentenceBoundary(s, 3))
            EXPECT_TRUE(EndsWithSentenceBoundary(s, 2));
        if (EndsWithSentenceBoundary(s, 2))
            EXPECT_TRUE(EndsWithSentenceBoundary(s, 1));
    }
}

TEST(SentenceBoundary, OutOfRangeLevelIsClamped) {
    EXPECT_EQ(EndsWithSentenceBoundary(U"他說：", 0), EndsWithSentenceBoundary(U"他說：", 1));
    EXPECT_EQ(EndsWithSentenceBoundary(U"他說：", 9), EndsWithSentenceBoundary(U"他說：", 3));
}

TEST(CjkBracketBoundary, WholeLineBracketedCjk) {
    EXPECT_TRUE(EndsWithCjkBracketBoundary(U"（附錄）"));
    EXPECT_TRUE(EndsWithCjkBracketBoundary(U"【組成】"));
    EXPECT_TRUE(EndsWithCjkBracketBoundary(U"《三體》"));
    EXPECT_TRUE(EndsWithCjkBracketBoundary(U"  (附錄一)  "));
}

TEST(CjkBracketBoundary, RejectsLatinAndEmpty) {
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"(test)"));
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"[1.2]"));
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"（）"));
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"（"));
}

TEST(CjkBracketBoundary, RejectsPartialOrMismatched) {
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"前文（附錄）"));
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"（附錄】"));
}

TEST(CjkBracketBoundary, NeverTrueWhenBracketTypeUnbalanced) {
    // Matching outer pair but the same bracket type is unbalanced inside.
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"（甲）乙）"));
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"（甲（乙）"));
    EXPECT_FALSE(EndsWithCjkBracketBoundary(U"【甲】】"));
}
