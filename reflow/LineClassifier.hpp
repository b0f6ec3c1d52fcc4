#pragma once
//
// LineClassifier.hpp
// -----------------------------------------------------------------------------
// Ordered, first-match-wins classification of a single input line.
//
//   1. visual divider        (──── / ***** / ～～～)
//   2. style-repeat collapse (not a kind; rewrites the line before 3..9)
//   3. empty
//   4. page marker           (=== [Page x/y] ===)
//   5. custom / built-in title heading
//   6. metadata key:value
//   7. short heading
//   8. bracket-wrapped structural line
//   9. prose
//
// Classification is context-free. Whether a short heading really splits the
// paragraph depends on the buffer and is decided by the segmentation engine.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

#include "ReflowOptions.hpp"

namespace cjkreflow {
    enum class LineKind {
        Empty,
        VisualDivider,
        PageMarker,
        TitleHeading,
        CustomTitleHeading,
        MetadataLine,
        ShortHeading,
        BracketStructural,
        Prose
    };

    [[nodiscard]] const char *ToString(LineKind kind) noexcept;

    struct ClassifiedLine {
        LineKind kind = LineKind::Empty;
        std::u32string stripped; // output form, after repeat collapse
        std::u32string bare; // no leading indentation; classification only
        bool indented = false; // raw line starts with >= 2 whitespace chars
        bool dialogStart = false; // bare begins with a dialog opener
    };

    [[nodiscard]] ClassifiedLine ClassifyLine(std::u32string_view rawLine, const ReflowOptions &options);

    namespace detail {
        // Longest key in the metadata vocabulary, in code points.
        [[nodiscard]] std::size_t MaxMetadataKeyLength();

        [[nodiscard]] bool IsMetadataKey(std::u32string_view key);

        /// Detect lines like:
        ///   書名：假面遊戲
        ///   作者 : 東野圭吾
        ///   出版時間　2024-03-12
        [[nodiscard]] bool IsMetadataLine(std::u32string_view line);

        // Built-in chapter / prologue / epilogue patterns:
        //   ^(?!.*[,，])(?=.{0,50}$)
        //   (前言|序章|楔子|终章|尾声|后记|尾聲|後記|番外.*
        //    |.{0,10}?第.{0,5}?[章节部卷節回](?:[^分合的]|$).{0,20}
        //    |(?:卷|章)[一二三四五六七八九十].*)
        [[nodiscard]] bool IsTitleHeading(std::u32string_view bare) noexcept;

        // Short heading candidate, buffer context not considered.
        [[nodiscard]] bool IsHeadingLike(std::u32string_view line, const ShortHeadingSettings &settings);
    } // namespace detail
} // namespace cjkreflow
