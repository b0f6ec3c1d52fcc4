#include "OverlayFilter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <string_view>
#include <utility>

#include "../reflow/CjkText.hpp"
#include "../reflow/ReflowCommon.hpp"

namespace cjkreflow::pdf {
    OverlayFilterOptions OverlayFilterOptions::Normalized() const noexcept {
        OverlayFilterOptions copy = *this;
        if (!(copy.bandStep > 0.0))
            copy.bandStep = 6.0;
        copy.repeatThreshold = std::max(2, copy.repeatThreshold);
        copy.tiledMinTokens = std::max(2, copy.tiledMinTokens);
        copy.tiledMaxTokenLength = std::max(1, copy.tiledMaxTokenLength);
        copy.lineGapTolerance = std::max(0, copy.lineGapTolerance);
        return copy;
    }

    std::u32string NormalizeFragmentKey(const std::u32string &text) {
        std::u32string key;
        key.reserve(text.size());

        bool pendingSpace = false;
        for (const char32_t ch: text) {
            if (cjkreflow::text::IsWhitespace(ch)) {
                pendingSpace = !key.empty();
                continue;
            }
            if (pendingSpace) {
                key.push_back(U' ');
                pendingSpace = false;
            }
            key.push_back(ch);
        }

        return key;
    }

    TextObjectFragment MakeFragment(const std::string &utf8Text,
                                    const double yMid,
                                    const OverlayFilterOptions &options) {
        const double step = options.bandStep > 0.0 ? options.bandStep : 6.0;

        TextObjectFragment fragment;
        fragment.text = utf8Text;
        fragment.key = NormalizeFragmentKey(cjkreflow::detail::Utf8ToU32(utf8Text));
        fragment.bucket = static_cast<long>(std::floor(yMid / step));
        return fragment;
    }

    bool IsTiledWatermark(const std::u32string &key, const OverlayFilterOptions &options) {
        std::vector<std::u32string_view> tokens;
        const std::u32string_view view(key);

        std::size_t start = 0;
        while (start <= view.size()) {
            const std::size_t space = view.find(U' ', start);
            const std::size_t end = space == std::u32string_view::npos ? view.size() : space;
            if (end > start)
                tokens.push_back(view.substr(start, end - start));
            if (space == std::u32string_view::npos)
                break;
            start = space + 1;
        }

        if (tokens.size() < static_cast<std::size_t>(options.tiledMinTokens))
            return false;

        std::map<std::u32string_view, std::size_t> counts;
        for (const auto &token: tokens) {
            if (token.size() <= static_cast<std::size_t>(options.tiledMaxTokenLength))
                ++counts[token];
        }

        std::size_t best = 0;
        for (const auto &[token, count]: counts)
            best = std::max(best, count);

        // all but at most one token identical
        return best + 1 >= tokens.size();
    }

    OverlayFilterResult FilterOverlayFragments(const std::vector<TextObjectFragment> &fragments,
                                               const OverlayFilterOptions &options) {
        const OverlayFilterOptions opts = options.Normalized();

        std::map<std::pair<std::u32string, long>, int> frequency;
        for (const auto &fragment: fragments) {
            if (!fragment.key.empty())
                ++frequency[{fragment.key, fragment.bucket}];
        }

        OverlayFilterResult result;
        result.kept.reserve(fragments.size());

        for (const auto &fragment: fragments) {
            if (fragment.key.empty()) {
                ++result.dropped;
                continue;
            }

            const bool repeated = frequency[{fragment.key, fragment.bucket}] >= opts.repeatThreshold;
            if (repeated || IsTiledWatermark(fragment.key, opts)) {
                ++result.dropped;
                continue;
            }

            result.kept.push_back(fragment);
        }

        return result;
    }

    std::string ComposePageText(const std::vector<TextObjectFragment> &kept,
                                const OverlayFilterOptions &options) {
        const OverlayFilterOptions opts = options.Normalized();

        std::string out;
        bool first = true;
        long prevBucket = 0;

        for (const auto &fragment: kept) {
            if (!first && std::labs(fragment.bucket - prevBucket) > opts.lineGapTolerance)
                out.push_back('\n');

            out += fragment.text;
            prevBucket = fragment.bucket;
            first = false;
        }

        return out;
    }
} // namespace cjkreflow::pdf
