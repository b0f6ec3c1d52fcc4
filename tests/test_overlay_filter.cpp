#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "OverlayFilter.hpp"

using cjkreflow::pdf::ComposePageText;
using cjkreflow::pdf::FilterOverlayFragments;
using cjkreflow::pdf::IsTiledWatermark;
using cjkreflow::pdf::MakeFragment;
using cjkreflow::pdf::NormalizeFragmentKey;
using cjkreflow::pdf::OverlayFilterOptions;
using cjkreflow::pdf::TextObjectFragment;

namespace {
    std::vector<std::string> keptTexts(const std::vector<TextObjectFragment> &kept) {
        std::vector<std::string> out;
        for (const auto &f: kept)
            out.push_back(f.text);
        return out;
    }

    TextObjectFragment fragmentAt(const std::string &text, const long bucket) {
        TextObjectFragment f;
        f.text = text;
        f.key = NormalizeFragmentKey(std::u32string(text.begin(), text.end()));
        f.bucket = bucket;
        return f;
    }
}

TEST(OverlayFilter, KeyNormalization) {
    EXPECT_EQ(NormalizeFragmentKey(U"  A \t B  "), U"A B");
    EXPECT_EQ(NormalizeFragmentKey(U"　機密　"), U"機密");
    EXPECT_EQ(NormalizeFragmentKey(U" \t "), U"");
}

TEST(OverlayFilter, FragmentBucketIsFloored) {
    const OverlayFilterOptions options;
    EXPECT_EQ(MakeFragment("x", 13.0, options).bucket, 2);
    EXPECT_EQ(MakeFragment("x", 12.0, options).bucket, 2);
    EXPECT_EQ(MakeFragment("x", -1.0, options).bucket, -1);
    EXPECT_EQ(MakeFragment("機密  文件", 0.0, options).key, U"機密 文件");
}

TEST(OverlayFilter, RepeatedStampInOneBandIsDropped) {
    const OverlayFilterOptions options;

    std::vector<TextObjectFragment> fragments;
    fragments.push_back(MakeFragment("第一行正文", 700.0, options));
    for (int i = 0; i < 5; ++i)
        fragments.push_back(MakeFragment("CONFIDENTIAL", 400.0, options));
    fragments.push_back(MakeFragment("第二行正文", 380.0, options));

    const auto result = FilterOverlayFragments(fragments, options);
    EXPECT_EQ(result.dropped, 5u);
    EXPECT_EQ(keptTexts(result.kept), (std::vector<std::string>{"第一行正文", "第二行正文"}));
}

TEST(OverlayFilter, BelowThresholdIsKept) {
    const OverlayFilterOptions options;

    std::vector<TextObjectFragment> fragments;
    for (int i = 0; i < 3; ++i)
        fragments.push_back(MakeFragment("CONFIDENTIAL", 400.0, options));

    const auto result = FilterOverlayFragments(fragments, options);
    EXPECT_EQ(result.dropped, 0u);
    EXPECT_EQ(result.kept.size(), 3u);
}

TEST(OverlayFilter, RepeatsAcrossBandsAreKept) {
    const OverlayFilterOptions options;

    // A running header on every line of a table, one per band.
    std::vector<TextObjectFragment> fragments;
    for (int i = 0; i < 6; ++i)
        fragments.push_back(MakeFragment("合計", 100.0 + 20.0 * i, options));

    const auto result = FilterOverlayFragments(fragments, options);
    EXPECT_EQ(result.dropped, 0u);
    EXPECT_EQ(result.kept.size(), 6u);
}

TEST(OverlayFilter, TiledWatermark) {
    const OverlayFilterOptions options;

    EXPECT_TRUE(IsTiledWatermark(U"DRAFT DRAFT DRAFT DRAFT DRAFT DRAFT", options));
    EXPECT_TRUE(IsTiledWatermark(U"DRAFT DRAFT DRAFT DRAFT DRAFT X", options));
    EXPECT_FALSE(IsTiledWatermark(U"DRAFT DRAFT DRAFT DRAFT DRAFT", options));
    EXPECT_FALSE(IsTiledWatermark(U"the cat sat on the mat", options));
    EXPECT_FALSE(IsTiledWatermark(U"", options));

    // tokens longer than tiledMaxTokenLength are not counted
    EXPECT_FALSE(IsTiledWatermark(
        U"CONFIDENTIALITY CONFIDENTIALITY CONFIDENTIALITY CONFIDENTIALITY CONFIDENTIALITY CONFIDENTIALITY",
        options));
}

TEST(OverlayFilter, TiledAndEmptyFragmentsAreDropped) {
    const OverlayFilterOptions options;

    const std::vector<TextObjectFragment> fragments = {
        MakeFragment("正文。", 500.0, options),
        MakeFragment("   ", 500.0, options),
        MakeFragment("DRAFT DRAFT DRAFT DRAFT DRAFT DRAFT", 300.0, options),
    };

    const auto result = FilterOverlayFragments(fragments, options);
    EXPECT_EQ(result.dropped, 2u);
    EXPECT_EQ(keptTexts(result.kept), std::vector<std::string>{"正文。"});
}

TEST(OverlayFilter, ComposeBreaksOnBandJumps) {
    const OverlayFilterOptions options;

    const std::vector<TextObjectFragment> kept = {
        fragmentAt("a", 100),
        fragmentAt("b", 100),
        fragmentAt("c", 99),
        fragmentAt("d", 96),
    };

    EXPECT_EQ(ComposePageText(kept, options), "abc\nd");
    EXPECT_EQ(ComposePageText({}, options), "");
}

TEST(OverlayFilter, ComposeWithZeroTolerance) {
    OverlayFilterOptions options;
    options.lineGapTolerance = 0;

    const std::vector<TextObjectFragment> kept = {
        fragmentAt("a", 10),
        fragmentAt("b", 10),
        fragmentAt("c", 9),
    };

    EXPECT_EQ(ComposePageText(kept, options), "ab\nc");
}

TEST(OverlayFilter, OptionsAreNormalized) {
    OverlayFilterOptions options;
    options.bandStep = 0.0;
    options.repeatThreshold = 0;
    options.tiledMinTokens = -3;
    options.tiledMaxTokenLength = 0;
    options.lineGapTolerance = -1;

    const OverlayFilterOptions n = options.Normalized();
    EXPECT_DOUBLE_EQ(n.bandStep, 6.0);
    EXPECT_EQ(n.repeatThreshold, 2);
    EXPECT_EQ(n.tiledMinTokens, 2);
    EXPECT_EQ(n.tiledMaxTokenLength, 1);
    EXPECT_EQ(n.lineGapTolerance, 0);
}
