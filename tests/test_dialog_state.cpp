#include <gtest/gtest.h>

#include "ReflowCommon.hpp"

using cjkreflow::detail::DialogState;

TEST(DialogState, StartsClosed) {
    const DialogState state;
    EXPECT_FALSE(state.is_unclosed());
}

TEST(DialogState, OpenAcrossLinesThenClose) {
    DialogState state;
    state.update(U"「我們走吧，");
    EXPECT_TRUE(state.is_unclosed());

    state.update(U"天快黑了。");
    EXPECT_TRUE(state.is_unclosed());

    state.update(U"」");
    EXPECT_FALSE(state.is_unclosed());
}

TEST(DialogState, EachFamilyTracked) {
    for (const std::u32string_view opener: {U"“", U"‘", U"「", U"『", U"﹁", U"﹃"}) {
        DialogState state;
        state.update(opener);
        EXPECT_TRUE(state.is_unclosed());
    }
}

TEST(DialogState, StrayCloserNeverGoesNegative) {
    DialogState state;
    state.update(U"」」」");
    EXPECT_EQ(state.corner, 0);
    EXPECT_FALSE(state.is_unclosed());

    // a later opener is not cancelled by the earlier stray closers
    state.update(U"「");
    EXPECT_TRUE(state.is_unclosed());
}

TEST(DialogState, NestedQuotes) {
    DialogState state;
    state.update(U"「他說『好』");
    EXPECT_EQ(state.corner, 1);
    EXPECT_EQ(state.corner_bold, 0);
    EXPECT_TRUE(state.is_unclosed());

    state.update(U"。」");
    EXPECT_FALSE(state.is_unclosed());
}

TEST(DialogState, MismatchedFamiliesStayOpen) {
    DialogState state;
    state.update(U"「你好”");
    EXPECT_TRUE(state.is_unclosed());
    EXPECT_EQ(state.double_quote, 0);
}

TEST(DialogState, ResetClearsEverything) {
    DialogState state;
    state.update(U"“‘「『﹁﹃");
    ASSERT_TRUE(state.is_unclosed());

    state.reset();
    EXPECT_FALSE(state.is_unclosed());
    EXPECT_EQ(state.double_quote, 0);
    EXPECT_EQ(state.corner_wide, 0);
}
