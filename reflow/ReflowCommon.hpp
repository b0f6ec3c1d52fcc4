#pragma once
//
// ReflowCommon.hpp
// -----------------------------------------------------------------------------
// Shared helpers for CJK paragraph reflow (UTF-8 in / UTF-8 out).
//
// - UTF-8 <-> UTF-32 conversion
// - trimming / "stripped" and "bare" line forms
// - style-layer repeat collapse
// - DialogState (per-paragraph quote counters)
//
// Classification lives in LineClassifier.hpp, orchestration in ReflowHelper.hpp.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/nowide/utf/convert.hpp>

#include "CjkText.hpp"
#include "PunctSets.hpp"

namespace cjkreflow::detail {
    using text::IsWhitespace;
    using text::TrimView;

    // ---------- UTF-8 <-> UTF-32 ----------

    // Malformed or truncated sequences become U+FFFD.
    inline std::u32string Utf8ToU32(const std::string_view s) {
        return boost::nowide::utf::convert_string<char32_t>(s.data(), s.data() + s.size());
    }

    inline std::string U32ToUtf8(const std::u32string_view s) {
        return boost::nowide::utf::convert_string<char>(s.data(), s.data() + s.size());
    }

    // Normalize CRLF / CR to LF and split. Always yields at least one line.
    inline std::vector<std::u32string> SplitLines(const std::string &utf8Text) {
        std::vector<std::u32string> lines;
        std::string current;

        for (std::size_t i = 0; i < utf8Text.size(); ++i) {
            const char c = utf8Text[i];
            if (c == '\r' || c == '\n') {
                if (c == '\r' && i + 1 < utf8Text.size() && utf8Text[i + 1] == '\n')
                    ++i;
                lines.push_back(Utf8ToU32(current));
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        lines.push_back(Utf8ToU32(current));

        return lines;
    }

    // ------------------------- Line forms -------------------------

    // Output form: trailing whitespace removed, leading half-width spaces removed,
    // full-width (U+3000) indentation kept.
    [[nodiscard]]
    inline std::u32string_view StrippedView(const std::u32string_view raw) noexcept {
        std::size_t end = raw.size();
        while (end > 0 && IsWhitespace(raw[end - 1]))
            --end;

        std::size_t start = 0;
        while (start < end && raw[start] == U' ')
            ++start;

        return raw.substr(start, end - start);
    }

    // Classification form: every leading ' ' and U+3000 removed.
    [[nodiscard]]
    inline std::u32string_view BareView(const std::u32string_view stripped) noexcept {
        std::size_t pos = 0;
        while (pos < stripped.size() && (stripped[pos] == U' ' || stripped[pos] == U'　'))
            ++pos;
        return stripped.substr(pos);
    }

    // Indentation: "^[\s　]{2,}" on the raw line.
    [[nodiscard]]
    inline bool IsIndented(const std::u32string_view rawLine) noexcept {
        int count = 0;
        for (const char32_t ch: rawLine) {
            if (!IsWhitespace(ch))
                break;
            if (++count >= 2)
                return true;
        }
        return false;
    }

    // "=== [Page x/y] ===" (any "=== ... ===" line of at least 7 code points)
    [[nodiscard]]
    inline bool IsPageMarker(const std::u32string_view s) noexcept {
        if (s.size() < 7)
            return false;
        return s.compare(0, 4, U"=== ") == 0 &&
               s.compare(s.size() - 3, 3, U"===") == 0;
    }

    [[nodiscard]]
    inline bool Contains(const std::u32string_view s, const char32_t ch) noexcept {
        return s.find(ch) != std::u32string_view::npos;
    }

    // ------------------------------------------------------------
    // Style-layer repeat collapse for PDF headings / title lines.
    //
    // Roughly (.{4,10}?)\1{2,} at token level, plus a phrase-level pass
    // over space-separated tokens. Targets highlighted/duplicated
    // heading text, not natural repetition like "哈哈哈哈哈哈".
    // ------------------------------------------------------------

    // A token made only of one 4..10 code point unit repeated >= 3 times
    // collapses to a single unit.
    inline std::u32string CollapseRepeatedToken(const std::u32string &token) {
        const std::size_t length = token.size();
        if (length < 4 || length > 200)
            return token;

        for (std::size_t unit_len = 4;
             unit_len <= 10 && unit_len <= length / 3;
             ++unit_len) {
            if (length % unit_len != 0)
                continue;

            bool all_match = true;
            for (std::size_t pos = unit_len; pos < length; pos += unit_len) {
                if (token.compare(pos, unit_len, token, 0, unit_len) != 0) {
                    all_match = false;
                    break;
                }
            }

            if (all_match)
                return token.substr(0, unit_len);
        }

        return token;
    }

    // Phrase-level: the first run of a 1..8 token phrase repeated >= 3 times
    // consecutively is reduced to one copy.
    //
    //   "背负着一切的麒麟 背负着一切的麒麟 背负着一切的麒麟" → "背负着一切的麒麟"
    inline std::vector<std::u32string>
    CollapseRepeatedWordSequences(const std::vector<std::u32string> &parts) {
        constexpr std::size_t minRepeats = 3;
        constexpr std::size_t maxPhraseLen = 8;

        const std::size_t n = parts.size();
        if (n < minRepeats)
            return parts;

        for (std::size_t start = 0; start < n; ++start) {
            for (std::size_t phraseLen = 1;
                 phraseLen <= maxPhraseLen && start + phraseLen <= n;
                 ++phraseLen) {
                std::size_t count = 1;

                while (true) {
                    const std::size_t nextStart = start + count * phraseLen;
                    if (nextStart + phraseLen > n)
                        break;

                    if (!std::equal(parts.begin() + static_cast<std::ptrdiff_t>(start),
                                    parts.begin() + static_cast<std::ptrdiff_t>(start + phraseLen),
                                    parts.begin() + static_cast<std::ptrdiff_t>(nextStart)))
                        break;

                    ++count;
                }

                if (count < minRepeats)
                    continue;

                std::vector<std::u32string> result;
                result.reserve(n - (count - 1) * phraseLen);
                result.insert(result.end(), parts.begin(),
                              parts.begin() + static_cast<std::ptrdiff_t>(start + phraseLen));
                result.insert(result.end(),
                              parts.begin() + static_cast<std::ptrdiff_t>(start + count * phraseLen),
                              parts.end());
                return result;
            }
        }

        return parts;
    }

    // Line-level wrapper. Lines without any repeat come back untouched
    // (spacing and indentation included).
    inline std::u32string CollapseRepeatedSegments(const std::u32string &line) {
        if (line.empty())
            return line;

        // Keep leading indentation as-is; only the content is tokenized.
        std::size_t lead = 0;
        while (lead < line.size() && (line[lead] == U' ' || line[lead] == U'\t' || line[lead] == U'　'))
            ++lead;

        std::vector<std::u32string> parts;
        {
            std::u32string current;
            for (std::size_t i = lead; i < line.size(); ++i) {
                if (const char32_t ch = line[i]; ch == U' ' || ch == U'\t') {
                    if (!current.empty()) {
                        parts.push_back(current);
                        current.clear();
                    }
                } else {
                    current.push_back(ch);
                }
            }
            if (!current.empty())
                parts.push_back(current);
        }

        if (parts.empty())
            return line;

        std::vector<std::u32string> collapsed = CollapseRepeatedWordSequences(parts);
        bool changed = collapsed.size() != parts.size();

        for (auto &tok: collapsed) {
            std::u32string single = CollapseRepeatedToken(tok);
            if (single.size() != tok.size()) {
                tok = std::move(single);
                changed = true;
            }
        }

        if (!changed)
            return line;

        std::u32string out = line.substr(0, lead);
        for (std::size_t i = 0; i < collapsed.size(); ++i) {
            if (i > 0)
                out.push_back(U' ');
            out += collapsed[i];
        }
        return out;
    }

    // ------------------------- DialogState -------------------------

    // One counter per quote family. Counters never go negative; a stray closer
    // is ignored. Lives for one paragraph buffer and is reset on every flush.
    struct DialogState {
        int double_quote = 0; // “ ”
        int single_quote = 0; // ‘ ’
        int corner = 0; // 「 」
        int corner_bold = 0; // 『 』
        int corner_top = 0; // ﹁ ﹂
        int corner_wide = 0; // ﹃ ﹄

        void reset() noexcept {
            *this = DialogState{};
        }

        // Scans only the new fragment; earlier text is never revisited.
        void update(const std::u32string_view s) noexcept {
            for (const char32_t ch: s) {
                switch (ch) {
                    case U'“': ++double_quote;
                        break;
                    case U'”': if (double_quote > 0) --double_quote;
                        break;
                    case U'‘': ++single_quote;
                        break;
                    case U'’': if (single_quote > 0) --single_quote;
                        break;
                    case U'「': ++corner;
                        break;
                    case U'」': if (corner > 0) --corner;
                        break;
                    case U'『': ++corner_bold;
                        break;
                    case U'』': if (corner_bold > 0) --corner_bold;
                        break;
                    case U'﹁': ++corner_top;
                        break;
                    case U'﹂': if (corner_top > 0) --corner_top;
                        break;
                    case U'﹃': ++corner_wide;
                        break;
                    case U'﹄': if (corner_wide > 0) --corner_wide;
                        break;
                    default: break;
                }
            }
        }

        [[nodiscard]] bool is_unclosed() const noexcept {
            return double_quote > 0 ||
                   single_quote > 0 ||
                   corner > 0 ||
                   corner_bold > 0 ||
                   corner_top > 0 ||
                   corner_wide > 0;
        }
    };
} // namespace cjkreflow::detail
