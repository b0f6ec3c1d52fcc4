#pragma once
#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <utility>
#include <vector>

#include "CjkText.hpp"

namespace cjkreflow::text::punct {
    // Tier 2: clause-or-end-ish (looser heuristics, not always a true sentence end)
    inline constexpr std::u32string_view CLAUSE_OR_END_PUNCT =
            U"。！？；：…—”」’』）】》〗〕〉］｝＞.!?):?>";

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsClauseOrEndPunct(const char32_t ch) noexcept {
        return CLAUSE_OR_END_PUNCT.find(ch) != std::u32string_view::npos;
    }

    // Dialog quotes / corner brackets, including the vertical presentation forms.
    inline constexpr std::u32string_view DIALOG_OPENERS = U"“‘「『﹁﹃";
    inline constexpr std::u32string_view DIALOG_CLOSERS = U"”’」』﹂﹄";

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsDialogOpener(const char32_t ch) noexcept {
        return DIALOG_OPENERS.find(ch) != std::u32string_view::npos;
    }

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsDialogCloser(const char32_t ch) noexcept {
        return DIALOG_CLOSERS.find(ch) != std::u32string_view::npos;
    }

    /// Quote closer (alias of dialog closer).
    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsQuoteCloser(const char32_t ch) noexcept {
        return IsDialogCloser(ch);
    }

    /// Returns true if the line starts with a dialog opener
    /// after skipping leading whitespace and indentation.
    [[nodiscard]]
    [[gnu::always_inline]] inline bool BeginsWithDialogOpener(const std::u32string_view s) noexcept {
        for (const char32_t ch: s) {
            if (IsWhitespace(ch))
                continue;

            return IsDialogOpener(ch);
        }
        return false;
    }

    // Tier 1: hard sentence enders (safe for "flush now")
    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsStrongSentenceEnd(const char32_t ch) noexcept {
        switch (ch) {
            case U'。':
            case U'！':
            case U'？':
            case U'!':
            case U'?':
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]]
    inline bool ContainsStrongSentenceEnd(const std::u32string_view s) noexcept {
        return std::any_of(s.begin(), s.end(), IsStrongSentenceEnd);
    }

    [[nodiscard]]
    inline bool EndsWithStrongSentenceEnd(const std::u32string_view s) noexcept {
        char32_t ch{};
        return TryGetLastNonWhitespace(s, ch) && IsStrongSentenceEnd(ch);
    }

    // -------------------------
    // Soft continuation punctuation
    // -------------------------

    inline constexpr std::u32string_view COMMA_LIKE_CHARS = U"，,、";

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsCommaLike(const char32_t ch) noexcept {
        return COMMA_LIKE_CHARS.find(ch) != std::u32string_view::npos;
    }

    [[nodiscard]]
    inline bool ContainsAnyCommaLike(const std::u32string_view s) noexcept {
        return std::any_of(s.begin(), s.end(), IsCommaLike);
    }

    [[nodiscard]]
    inline bool EndsWithCommaLike(const std::u32string_view s) noexcept {
        char32_t last{};
        return TryGetLastNonWhitespace(s, last) && IsCommaLike(last);
    }

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsColonLike(const char32_t ch) noexcept {
        return ch == U'：' || ch == U':';
    }

    [[nodiscard]]
    inline bool EndsWithColonLike(const std::u32string_view s) noexcept {
        char32_t last{};
        return TryGetLastNonWhitespace(s, last) && IsColonLike(last);
    }

    /// Postfix closers allowed right after a strong end ("。）").
    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsAllowedPostfixCloser(const char32_t ch) noexcept {
        return ch == U'）' || ch == U')';
    }

    // -------------------------
    // Metadata separators: ":" "：" ideographic space, middle dots
    // -------------------------

    inline constexpr std::u32string_view METADATA_SEPARATORS = U":：　·・";

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsMetadataSeparator(const char32_t ch) noexcept {
        return METADATA_SEPARATORS.find(ch) != std::u32string_view::npos;
    }

    // -----------------------------------------------------------------------------
    // Bracket punctuation table (open → close)
    // -----------------------------------------------------------------------------

    inline constexpr std::pair<char32_t, char32_t> BRACKET_PAIRS[] = {
        // Parentheses
        {U'（', U'）'},
        {U'(', U')'},

        // Square brackets
        {U'［', U'］'},
        {U'[', U']'},

        // Curly braces
        {U'｛', U'｝'},
        {U'{', U'}'},

        // Angle brackets
        {U'＜', U'＞'},
        {U'<', U'>'},
        {U'⟨', U'⟩'},
        {U'〈', U'〉'},

        // CJK brackets
        {U'【', U'】'},
        {U'《', U'》'},
        {U'〔', U'〕'},
        {U'〖', U'〗'},
    };

    [[nodiscard]]
    inline bool IsBracketOpener(const char32_t ch) noexcept {
        return std::any_of(std::begin(BRACKET_PAIRS), std::end(BRACKET_PAIRS),
                           [ch](const auto &p) { return p.first == ch; });
    }

    [[nodiscard]]
    inline bool IsBracketCloser(const char32_t ch) noexcept {
        return std::any_of(std::begin(BRACKET_PAIRS), std::end(BRACKET_PAIRS),
                           [ch](const auto &p) { return p.second == ch; });
    }

    [[nodiscard]]
    inline bool IsMatchingBracket(const char32_t open, const char32_t close) noexcept {
        return std::any_of(std::begin(BRACKET_PAIRS), std::end(BRACKET_PAIRS),
                           [open, close](const auto &p) { return p.first == open && p.second == close; });
    }

    /// Looks up the closer for a known opener.
    [[nodiscard]]
    inline bool TryGetMatchingCloser(const char32_t open, char32_t &close) noexcept {
        for (const auto &[key, val]: BRACKET_PAIRS) {
            if (key == open) {
                close = val;
                return true;
            }
        }
        return false;
    }

    /// Depth check for a single bracket type. A closer that drives the depth
    /// negative, or a leftover opener, makes the span unbalanced.
    [[nodiscard]]
    inline bool IsBracketTypeBalanced(const std::u32string_view s, const char32_t open) noexcept {
        char32_t close{};
        if (!TryGetMatchingCloser(open, close))
            return true;

        int depth = 0;
        for (const char32_t ch: s) {
            if (ch == open) {
                ++depth;
            } else if (ch == close) {
                if (--depth < 0)
                    return false;
            }
        }

        return depth == 0;
    }

    // Stack walk over every bracket family. Stray closer, mismatched closer or
    // leftover opener all count as "unclosed".
    [[nodiscard]]
    inline bool HasUnclosedBracket(const std::u32string_view s) {
        if (s.empty())
            return false;

        std::array<char32_t, 16> small{};
        std::vector<char32_t> big; // only used once nesting exceeds 16
        std::size_t top = 0;

        auto push = [&](const char32_t ch) {
            if (top < small.size()) {
                small[top++] = ch;
                return;
            }
            if (big.empty())
                big.assign(small.begin(), small.end());
            big.push_back(ch);
            ++top;
        };

        auto pop = [&]() -> char32_t {
            if (top <= small.size())
                return small[--top];
            const char32_t ch = big.back();
            big.pop_back();
            --top;
            return ch;
        };

        for (const char32_t ch: s) {
            if (IsBracketOpener(ch)) {
                push(ch);
                continue;
            }

            if (!IsBracketCloser(ch))
                continue;

            if (top == 0)
                return true;

            if (const char32_t open = pop(); !IsMatchingBracket(open, ch))
                return true;
        }

        return top != 0;
    }

    // -------------------------
    // Visual dividers
    // -------------------------

    [[nodiscard]]
    inline bool IsDividerGlyph(const char32_t ch) noexcept {
        if (ch >= 0x2500 && ch <= 0x257F) // box drawing
            return true;

        switch (ch) {
            case U'-':
            case U'=':
            case U'_':
            case U'~':
            case U'～':
            case U'*':
            case U'＊':
            case U'★':
            case U'☆':
                return true;
            default:
                return false;
        }
    }

    // Only divider glyphs (whitespace ignored), at least three of them.
    [[nodiscard]]
    inline bool IsVisualDividerLine(const std::u32string_view s) noexcept {
        std::size_t total = 0;

        for (const char32_t ch: s) {
            if (IsWhitespace(ch))
                continue;
            if (!IsDividerGlyph(ch))
                return false;
            ++total;
        }

        return total >= 3;
    }
} // namespace cjkreflow::text::punct
