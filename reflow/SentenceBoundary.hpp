#pragma once
//
// SentenceBoundary.hpp
// -----------------------------------------------------------------------------
// Paragraph-end tests applied to the accumulated buffer.
//
// Sentence boundary levels (each level includes everything stricter):
//   3  strong end (。！？!?), or OCR '.' / ':' right after a CJK char
//   2  + closer after a strong end (。」 ！） .」), '：' in a mostly-CJK line,
//        ellipsis (… or "...") in a mostly-CJK line
//   1  + bare ；：;:
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "CjkText.hpp"
#include "PunctSets.hpp"

namespace cjkreflow::detail {
    inline constexpr int kStrictBoundaryLevel = 3;
    inline constexpr int kDefaultBoundaryLevel = 2;
    inline constexpr int kLenientBoundaryLevel = 1;

    [[nodiscard]]
    inline int ClampBoundaryLevel(const int level) noexcept {
        return std::clamp(level, kLenientBoundaryLevel, kStrictBoundaryLevel);
    }

    // After `index`, only whitespace and quote/bracket closers remain.
    [[nodiscard]]
    inline bool IsAtEndAllowingClosers(const std::u32string_view s, const std::size_t index) noexcept {
        for (std::size_t j = index + 1; j < s.size(); ++j) {
            const char32_t ch = s[j];

            if (text::IsWhitespace(ch))
                continue;

            if (text::punct::IsQuoteCloser(ch) || text::punct::IsBracketCloser(ch))
                continue;

            return false;
        }
        return true;
    }

    // ASCII punct is the last non-whitespace char, directly after a CJK char.
    [[nodiscard]]
    inline bool IsOcrCjkAsciiPunctAtLineEnd(const std::u32string_view s, const std::size_t lastNonWsIndex) noexcept {
        if (lastNonWsIndex == 0 || lastNonWsIndex >= s.size())
            return false;

        return text::IsCjk(s[lastNonWsIndex - 1]) && text::IsMostlyCjk(s);
    }

    // Same idea with closers allowed after the punct: CJK '.' then 」 or ）.
    [[nodiscard]]
    inline bool IsOcrCjkAsciiPunctBeforeClosers(const std::u32string_view s, const std::size_t index) noexcept {
        if (!IsAtEndAllowingClosers(s, index))
            return false;

        char32_t prev{};
        if (!text::TryGetPrevNonWhitespace(s, index, prev))
            return false;

        return text::IsCjk(prev) && text::IsMostlyCjk(s);
    }

    [[nodiscard]]
    inline bool EndsWithSentenceBoundary(const std::u32string_view s, int level = kDefaultBoundaryLevel) noexcept {
        using namespace text::punct;

        std::size_t lastIdx{};
        char32_t last{};
        if (!text::TryGetLastNonWhitespace(s, lastIdx, last))
            return false;

        level = ClampBoundaryLevel(level);

        // ---- strict ----
        if (IsStrongSentenceEnd(last))
            return true;

        if ((last == U'.' || last == U':') && IsOcrCjkAsciiPunctAtLineEnd(s, lastIdx))
            return true;

        if (level >= kStrictBoundaryLevel)
            return false;

        // ---- lenient (default) ----
        if (IsQuoteCloser(last) || IsAllowedPostfixCloser(last)) {
            std::size_t prevIdx{};
            char32_t prev{};
            if (text::TryGetPrevNonWhitespace(s, lastIdx, prevIdx, prev)) {
                if (IsStrongSentenceEnd(prev))
                    return true;

                // OCR: “.” where '.' stands in for '。'
                if (prev == U'.' && IsOcrCjkAsciiPunctBeforeClosers(s, prevIdx))
                    return true;
            }
        }

        // "他说：" then dialog on the next line
        if (last == U'：' && text::IsMostlyCjk(s))
            return true;

        if (text::EndsWithEllipsis(s))
            return true;

        if (level >= kDefaultBoundaryLevel)
            return false;

        // ---- very lenient ----
        return last == U'；' || last == U'：' || last == U';' || last == U':';
    }

    // Whole trimmed span is one bracket pair around mostly-CJK content,
    // e.g. （附录） 【組成】 《書名》.
    [[nodiscard]]
    inline bool EndsWithCjkBracketBoundary(std::u32string_view s) noexcept {
        using namespace text::punct;

        s = text::TrimView(s);
        if (s.size() < 2)
            return false;

        const char32_t open = s.front();
        if (!IsMatchingBracket(open, s.back()))
            return false;

        const auto inner = text::TrimView(s.substr(1, s.size() - 2));
        if (inner.empty())
            return false;

        // rejects "(test)", "[1.2]"
        if (!text::IsMostlyCjk(inner))
            return false;

        // ASCII bracket pairs need real CJK inside
        if ((open == U'(' || open == U'[') && !text::ContainsAnyCjk(inner))
            return false;

        return IsBracketTypeBalanced(s, open);
    }
} // namespace cjkreflow::detail
