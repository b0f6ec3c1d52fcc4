#include "LineClassifier.hpp"

#include <algorithm>
#include <unordered_set>

#include "CjkText.hpp"
#include "PunctSets.hpp"
#include "ReflowCommon.hpp"
#include "SentenceBoundary.hpp"

namespace cjkreflow {
    namespace {
        using namespace text;
        using namespace text::punct;

        // Title words that open a heading line on their own.
        const std::u32string_view TITLE_WORDS[] = {
            U"前言", U"序章", U"楔子", U"终章", U"尾声", U"后记", U"尾聲", U"後記"
        };

        // Markers like 章 / 节 / 部 / 卷 / 回
        constexpr std::u32string_view CHAPTER_MARKERS = U"章节部卷節回";

        // A marker directly followed by one of these is prose ("第二部分", "第一回合", "第三部的").
        constexpr std::u32string_view EXCLUDED_AFTER_MARKER = U"分合的";

        // "卷一", "章三 xxx"
        constexpr std::u32string_view CJK_NUMERALS = U"一二三四五六七八九十";

        constexpr std::size_t kMaxTitleLen = 50;
        constexpr std::size_t kMaxCharsBeforeDi = 10;
        constexpr std::size_t kMaxCharsDiToMarker = 5;
        constexpr std::size_t kMaxTitleTail = 20;
        constexpr std::size_t kMaxMetadataLineLen = 30;

        // Metadata keys (書名 / 作者 / 出版時間 / 版權 / ISBN / etc.)
        const std::unordered_set<std::u32string> &MetadataKeys() {
            static const std::unordered_set<std::u32string> keys = {
                // 1. Title / Author / Publishing
                U"書名", U"书名",
                U"作者",
                U"原著",
                U"譯者", U"译者",
                U"校訂", U"校订",
                U"出版社",
                U"出版時間", U"出版时间",
                U"出版日期",

                // 2. Copyright / License
                U"版權", U"版权",
                U"版權頁", U"版权页",
                U"版權信息", U"版权信息",

                // 3. Editor / Pricing
                U"責任編輯", U"责任编辑",
                U"編輯", U"编辑",
                U"責編", U"责编",
                U"定價", U"定价",

                // 4. Descriptions / Forewords
                U"簡介", U"简介",
                U"前言",
                U"序章",
                U"終章", U"终章",
                U"尾聲", U"尾声",
                U"後記", U"后记",

                // 5. Digital publishing
                U"品牌方",
                U"出品方",
                U"授權方", U"授权方",
                U"電子版權", U"数字版权",
                U"掃描", U"扫描",
                U"發行", U"发行",
                U"OCR",

                // 6. CIP / Cataloging
                U"CIP",
                U"在版編目", U"在版编目",
                U"分類號", U"分类号",
                U"主題詞", U"主题词",
                U"類型", U"类型",
                U"標簽", U"标签",
                U"内容標簽", U"内容标签",
                U"系列",

                // 7. Publishing cycle
                U"發行日", U"发行日",
                U"初版",

                U"ISBN"
            };
            return keys;
        }

        [[nodiscard]] bool StartsWith(const std::u32string_view s, const std::u32string_view prefix) noexcept {
            return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
        }

        // Text before 第 when the marker closes the line: "Vol.1 第三章" is a
        // title, "他翻開了第一章" and "「他說第一章" are not.
        [[nodiscard]] bool IsPlainTitlePrefix(const std::u32string_view prefix) noexcept {
            return std::none_of(prefix.begin(), prefix.end(), [](const char32_t ch) {
                return IsCjk(ch) || IsDialogOpener(ch);
            });
        }

        [[nodiscard]] bool IsChapterPattern(const std::u32string_view s) noexcept {
            const std::size_t len = s.size();
            const std::size_t lastDi = std::min(kMaxCharsBeforeDi, len - 1);

            for (std::size_t di = 0; di <= lastDi; ++di) {
                if (s[di] != U'第')
                    continue;

                const std::size_t lastMarker = std::min(len - 1, di + 1 + kMaxCharsDiToMarker);
                for (std::size_t j = di + 1; j <= lastMarker; ++j) {
                    if (CHAPTER_MARKERS.find(s[j]) == std::u32string_view::npos)
                        continue;

                    if (j + 1 < len && EXCLUDED_AFTER_MARKER.find(s[j + 1]) != std::u32string_view::npos)
                        continue;

                    if (j + 1 == len && di > 0 && !IsPlainTitlePrefix(s.substr(0, di)))
                        continue;

                    if (len - j - 1 <= kMaxTitleTail)
                        return true;
                }
            }

            return false;
        }
    } // namespace

    const char *ToString(const LineKind kind) noexcept {
        switch (kind) {
            case LineKind::Empty: return "Empty";
            case LineKind::VisualDivider: return "VisualDivider";
            case LineKind::PageMarker: return "PageMarker";
            case LineKind::TitleHeading: return "TitleHeading";
            case LineKind::CustomTitleHeading: return "CustomTitleHeading";
            case LineKind::MetadataLine: return "MetadataLine";
            case LineKind::ShortHeading: return "ShortHeading";
            case LineKind::BracketStructural: return "BracketStructural";
            case LineKind::Prose: return "Prose";
        }
        return "Unknown";
    }

    namespace detail {
        std::size_t MaxMetadataKeyLength() {
            static const std::size_t maxLen = [] {
                std::size_t n = 0;
                for (const auto &key: MetadataKeys())
                    n = std::max(n, key.size());
                return n;
            }();
            return maxLen;
        }

        bool IsMetadataKey(const std::u32string_view key) {
            const auto trimmed = TrimView(key);
            if (trimmed.empty() || trimmed.size() > MaxMetadataKeyLength())
                return false;
            return MetadataKeys().count(std::u32string(trimmed)) != 0;
        }

        bool IsMetadataLine(const std::u32string_view line) {
            if (IsWhitespaceOnly(line) || line.size() > kMaxMetadataLineLen)
                return false;

            std::size_t firstNonWs = 0;
            while (firstNonWs < line.size() && IsWhitespace(line[firstNonWs]))
                ++firstNonWs;

            std::size_t sep = std::u32string_view::npos;
            for (std::size_t i = firstNonWs; i < line.size(); ++i) {
                if (IsMetadataSeparator(line[i])) {
                    sep = i;
                    break;
                }
            }

            if (sep == std::u32string_view::npos)
                return false;

            const std::size_t rawKeyLen = sep - firstNonWs;
            if (rawKeyLen == 0 || rawKeyLen > MaxMetadataKeyLength())
                return false;

            std::size_t value = sep + 1;
            while (value < line.size() && IsWhitespace(line[value]))
                ++value;

            if (value >= line.size())
                return false;

            if (!IsMetadataKey(line.substr(firstNonWs, rawKeyLen)))
                return false;

            // 作者：「…」 reads as dialog, not metadata
            return !IsDialogOpener(line[value]);
        }

        bool IsTitleHeading(const std::u32string_view bare) noexcept {
            const std::u32string_view s = TrimView(bare);
            if (s.empty() || s.size() > kMaxTitleLen)
                return false;

            if (s.find(U',') != std::u32string_view::npos || s.find(U'，') != std::u32string_view::npos)
                return false;

            for (const auto &w: TITLE_WORDS) {
                if (StartsWith(s, w))
                    return true;
            }

            if (StartsWith(s, U"番外"))
                return true;

            if (s.size() >= 2 && (s[0] == U'卷' || s[0] == U'章') &&
                CJK_NUMERALS.find(s[1]) != std::u32string_view::npos)
                return true;

            return IsChapterPattern(s);
        }

        bool IsHeadingLike(const std::u32string_view line, const ShortHeadingSettings &settings) {
            const std::u32string_view s = TrimView(line);
            if (s.empty())
                return false;

            // keep page markers intact
            if (IsPageMarker(s))
                return false;

            if (HasUnclosedBracket(s))
                return false;

            std::size_t lastIdx{};
            char32_t last{};
            if (!TryGetLastNonWhitespace(s, lastIdx, last))
                return false;

            const auto baseMax = static_cast<std::size_t>(settings.ClampedMaxLen());
            const std::size_t len = s.size();

            // Item title: "物品准备："
            if (IsColonLike(last) && len <= baseMax && lastIdx > 0 &&
                IsAllCjkNoWhitespace(s.substr(0, lastIdx)))
                return true;

            if (IsClauseOrEndPunct(last))
                return false;

            if (ContainsAnyCommaLike(s))
                return false;

            // ASCII and mixed headings may be longer
            std::size_t effectiveMax = baseMax;
            if ((settings.allAscii && IsAllAscii(s)) ||
                (settings.mixedCjkAscii && IsMixedCjkAscii(s))) {
                effectiveMax = std::clamp<std::size_t>(baseMax * 2, 10, 30);
            }

            if (len > effectiveMax)
                return false;

            if (ContainsStrongSentenceEnd(s))
                return false;

            return (settings.allAscii && IsAllAscii(s))
                   || (settings.allCjk && IsAllCjkNoWhitespace(s))
                   || (settings.allAsciiDigits && IsAllAsciiDigits(s))
                   || (settings.mixedCjkAscii && IsMixedCjkAscii(s));
        }
    } // namespace detail

    ClassifiedLine ClassifyLine(const std::u32string_view rawLine, const ReflowOptions &options) {
        ClassifiedLine line;
        line.indented = detail::IsIndented(rawLine);

        const std::u32string_view strippedView = detail::StrippedView(rawLine);

        // Dividers are tested before collapse so "＊＊＊＊＊＊＊＊＊＊＊＊" survives intact.
        if (IsVisualDividerLine(detail::BareView(strippedView))) {
            line.kind = LineKind::VisualDivider;
            line.stripped = std::u32string(strippedView);
            line.bare = std::u32string(detail::BareView(strippedView));
            return line;
        }

        line.stripped = detail::CollapseRepeatedSegments(std::u32string(strippedView));
        line.bare = std::u32string(detail::BareView(line.stripped));
        line.dialogStart = BeginsWithDialogOpener(line.bare);

        if (IsWhitespaceOnly(line.stripped)) {
            line.kind = LineKind::Empty;
            line.stripped.clear();
            line.bare.clear();
            return line;
        }

        if (detail::IsPageMarker(line.bare)) {
            line.kind = LineKind::PageMarker;
            return line;
        }

        // User intent wins over the built-in pattern.
        if (options.customTitle && options.customTitle->Matches(line.bare)) {
            line.kind = LineKind::CustomTitleHeading;
            return line;
        }

        if (detail::IsTitleHeading(line.bare)) {
            line.kind = LineKind::TitleHeading;
            return line;
        }

        if (detail::IsMetadataLine(line.bare)) {
            line.kind = LineKind::MetadataLine;
            return line;
        }

        if (detail::IsHeadingLike(line.bare, options.shortHeading)) {
            line.kind = LineKind::ShortHeading;
            return line;
        }

        if (detail::EndsWithCjkBracketBoundary(line.bare)) {
            line.kind = LineKind::BracketStructural;
            return line;
        }

        line.kind = LineKind::Prose;
        return line;
    }
} // namespace cjkreflow
