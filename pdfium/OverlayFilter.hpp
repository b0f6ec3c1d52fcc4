#pragma once
//
// OverlayFilter.hpp
// -----------------------------------------------------------------------------
// Watermark / overlay suppression for page-object text extraction.
//
// Each text object of a page becomes a TextObjectFragment (text + vertical
// band). Fragments are dropped when:
//   (a) the same normalized text repeats >= repeatThreshold times in one band,
//   (b) the text is a tiled single-word pattern ("DRAFT DRAFT DRAFT ...").
// The survivors are joined in content-stream order; a line break is inserted
// only when the band jumps by more than lineGapTolerance.
//
// No pdfium types here: the extractor in PdfiumHelper.hpp feeds plain values.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <vector>

namespace cjkreflow::pdf {
    struct OverlayFilterOptions {
        double bandStep = 6.0; // points per vertical bucket
        int repeatThreshold = 4;
        int tiledMinTokens = 6;
        int tiledMaxTokenLength = 12; // code points
        int lineGapTolerance = 1; // buckets

        [[nodiscard]] OverlayFilterOptions Normalized() const noexcept;
    };

    struct TextObjectFragment {
        std::string text; // UTF-8, as extracted
        std::u32string key; // whitespace-collapsed, trimmed
        long bucket = 0; // floor(yMid / bandStep)
    };

    struct OverlayFilterResult {
        std::vector<TextObjectFragment> kept;
        std::size_t dropped = 0;
    };

    [[nodiscard]] TextObjectFragment MakeFragment(const std::string &utf8Text,
                                                  double yMid,
                                                  const OverlayFilterOptions &options);

    // Collapse whitespace runs to one space and trim.
    [[nodiscard]] std::u32string NormalizeFragmentKey(const std::u32string &text);

    [[nodiscard]] bool IsTiledWatermark(const std::u32string &key, const OverlayFilterOptions &options);

    [[nodiscard]] OverlayFilterResult FilterOverlayFragments(const std::vector<TextObjectFragment> &fragments,
                                                             const OverlayFilterOptions &options);

    [[nodiscard]] std::string ComposePageText(const std::vector<TextObjectFragment> &kept,
                                              const OverlayFilterOptions &options);
} // namespace cjkreflow::pdf
