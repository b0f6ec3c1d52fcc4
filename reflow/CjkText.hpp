#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cjkreflow::text {
    // ---------- Unicode whitespace (deterministic; avoids locale-dependent iswspace) ----------

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsWhitespace(const char32_t ch) noexcept {
        if (ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'\f' || ch == U'\v')
            return true;

        switch (ch) {
            case 0x00A0: // NO-BREAK SPACE
            case 0x1680: // OGHAM SPACE MARK
            case 0x2000: // EN QUAD
            case 0x2001: // EM QUAD
            case 0x2002: // EN SPACE
            case 0x2003: // EM SPACE
            case 0x2004: // THREE-PER-EM SPACE
            case 0x2005: // FOUR-PER-EM SPACE
            case 0x2006: // SIX-PER-EM SPACE
            case 0x2007: // FIGURE SPACE
            case 0x2008: // PUNCTUATION SPACE
            case 0x2009: // THIN SPACE
            case 0x200A: // HAIR SPACE
            case 0x2028: // LINE SEPARATOR
            case 0x2029: // PARAGRAPH SEPARATOR
            case 0x202F: // NARROW NO-BREAK SPACE
            case 0x205F: // MEDIUM MATHEMATICAL SPACE
            case 0x3000: // IDEOGRAPHIC SPACE
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]]
    inline bool IsWhitespaceOnly(const std::u32string_view s) noexcept {
        return std::all_of(s.begin(), s.end(), IsWhitespace);
    }

    /// Full trim using the Unicode whitespace set above.
    [[nodiscard]]
    inline std::u32string_view TrimView(const std::u32string_view s) noexcept {
        std::size_t start = 0;
        std::size_t end = s.size();
        while (start < end && IsWhitespace(s[start]))
            ++start;
        while (end > start && IsWhitespace(s[end - 1]))
            --end;
        return s.substr(start, end - start);
    }

    // ---------- TryGet helpers ----------

    /// Last non-whitespace character and its index.
    [[nodiscard]]
    [[gnu::always_inline]] inline bool TryGetLastNonWhitespace(
        const std::u32string_view s,
        std::size_t &lastIdx,
        char32_t &last) noexcept {
        lastIdx = static_cast<std::size_t>(-1);
        last = U'\0';

        for (std::size_t i = s.size(); i-- > 0;) {
            const char32_t ch = s[i];
            if (IsWhitespace(ch))
                continue;

            lastIdx = i;
            last = ch;
            return true;
        }
        return false;
    }

    [[nodiscard]]
    [[gnu::always_inline]] inline bool TryGetLastNonWhitespace(
        const std::u32string_view s,
        char32_t &last) noexcept {
        std::size_t idx{};
        return TryGetLastNonWhitespace(s, idx, last);
    }

    /// Nearest non-whitespace character strictly before `index`.
    [[nodiscard]]
    inline bool TryGetPrevNonWhitespace(
        const std::u32string_view s,
        const std::size_t index,
        std::size_t &prevIdx,
        char32_t &prev) noexcept {
        prevIdx = static_cast<std::size_t>(-1);
        prev = U'\0';

        for (std::size_t i = std::min(index, s.size()); i-- > 0;) {
            if (IsWhitespace(s[i]))
                continue;

            prevIdx = i;
            prev = s[i];
            return true;
        }
        return false;
    }

    [[nodiscard]]
    inline bool TryGetPrevNonWhitespace(
        const std::u32string_view s,
        const std::size_t index,
        char32_t &prev) noexcept {
        std::size_t idx{};
        return TryGetPrevNonWhitespace(s, index, idx, prev);
    }

    // ---------- CJK / ASCII classifiers ----------

    [[nodiscard]] inline bool IsCjk(const char32_t ch) noexcept {
        const auto c = static_cast<uint32_t>(ch);

        // CJK Unified Ideographs Extension A: U+3400–U+4DBF
        if ((c - 0x3400u) <= (0x4DBFu - 0x3400u))
            return true;

        // CJK Unified Ideographs: U+4E00–U+9FFF
        if ((c - 0x4E00u) <= (0x9FFFu - 0x4E00u))
            return true;

        // CJK Compatibility Ideographs: U+F900–U+FAFF
        return (c - 0xF900u) <= (0xFAFFu - 0xF900u);
    }

    [[nodiscard]] inline bool ContainsAnyCjk(const std::u32string_view s) noexcept {
        return std::any_of(s.begin(), s.end(), IsCjk);
    }

    [[nodiscard]] inline bool IsAscii(const char32_t ch) noexcept {
        return ch <= 0x7F;
    }

    // Non-empty and every code point ASCII.
    [[nodiscard]] inline bool IsAllAscii(const std::u32string_view s) noexcept {
        return !s.empty() && std::all_of(s.begin(), s.end(), IsAscii);
    }

    [[nodiscard]] inline bool IsAsciiDigit(const char32_t ch) noexcept {
        return ch >= U'0' && ch <= U'9';
    }

    [[nodiscard]] inline bool IsAsciiLetter(const char32_t ch) noexcept {
        return (ch >= U'A' && ch <= U'Z') || (ch >= U'a' && ch <= U'z');
    }

    [[nodiscard]] inline bool IsAsciiLetterOrDigit(const char32_t ch) noexcept {
        return IsAsciiDigit(ch) || IsAsciiLetter(ch);
    }

    // Full-width digits: '０'..'９'
    [[nodiscard]] inline bool IsFullwidthDigit(const char32_t ch) noexcept {
        return ch >= U'０' && ch <= U'９';
    }

    // Digits only (ASCII or full-width); ASCII spaces are neutral. Needs at least one digit.
    [[nodiscard]] inline bool IsAllAsciiDigits(const std::u32string_view s) noexcept {
        bool hasDigit = false;
        for (const char32_t ch: s) {
            if (ch == U' ')
                continue;
            if (IsAsciiDigit(ch) || IsFullwidthDigit(ch)) {
                hasDigit = true;
                continue;
            }
            return false;
        }
        return hasDigit;
    }

    // Neutral ASCII allowed in "mixed CJK + ASCII" lines: space - / : .
    [[nodiscard]] inline bool IsNeutralAsciiForMixed(const char32_t ch) noexcept {
        return ch == U' ' || ch == U'-' || ch == U'/' || ch == U':' || ch == U'.';
    }

    // Mixed CJK + ASCII (like "第3章 Chapter 1"):
    // - neutral ASCII separators are skipped
    // - other ASCII must be letter/digit
    // - full-width digits count as ASCII content
    // - any other non-ASCII must be CJK
    // True only when both CJK and ASCII content appear.
    [[nodiscard]] inline bool IsMixedCjkAscii(const std::u32string_view s) noexcept {
        bool hasCjk = false;
        bool hasAscii = false;

        for (const char32_t ch: s) {
            if (IsNeutralAsciiForMixed(ch))
                continue;

            if (ch <= 0x7F) {
                if (!IsAsciiLetterOrDigit(ch))
                    return false;
                hasAscii = true;
                continue;
            }

            if (IsFullwidthDigit(ch)) {
                hasAscii = true;
                continue;
            }

            if (IsCjk(ch)) {
                hasCjk = true;
                continue;
            }

            return false;
        }

        return hasCjk && hasAscii;
    }

    // Every non-whitespace code point is CJK. Empty / whitespace-only → false.
    [[nodiscard]] inline bool IsAllCjk(const std::u32string_view s, const bool allowWhitespace) noexcept {
        bool seen = false;
        for (const char32_t ch: s) {
            if (IsWhitespace(ch)) {
                if (!allowWhitespace)
                    return false;
                continue;
            }
            seen = true;
            if (!IsCjk(ch))
                return false;
        }
        return seen;
    }

    [[nodiscard]] inline bool IsAllCjkIgnoringWhitespace(const std::u32string_view s) noexcept {
        return IsAllCjk(s, true);
    }

    [[nodiscard]] inline bool IsAllCjkNoWhitespace(const std::u32string_view s) noexcept {
        return IsAllCjk(s, false);
    }

    // Whitespace and digits (ASCII or full-width) are neutral, ASCII punctuation too;
    // only ASCII letters count against CJK.
    [[nodiscard]] inline bool IsMostlyCjk(const std::u32string_view s) noexcept {
        std::size_t cjk = 0;
        std::size_t ascii = 0;

        for (const char32_t ch: s) {
            if (IsWhitespace(ch))
                continue;

            if (IsAsciiDigit(ch) || IsFullwidthDigit(ch))
                continue;

            if (IsCjk(ch)) {
                ++cjk;
                continue;
            }

            if (IsAsciiLetter(ch))
                ++ascii;
        }

        return cjk > 0 && cjk >= ascii;
    }

    // "…" or an OCR "..." run at the end, only in a mostly-CJK span.
    [[nodiscard]] inline bool EndsWithEllipsis(const std::u32string_view s) noexcept {
        if (s.empty() || !IsMostlyCjk(s))
            return false;

        std::size_t i{};
        char32_t last{};
        if (!TryGetLastNonWhitespace(s, i, last))
            return false;

        if (last == U'…')
            return true;

        return i >= 2 && s[i] == U'.' && s[i - 1] == U'.' && s[i - 2] == U'.';
    }
} // namespace cjkreflow::text
