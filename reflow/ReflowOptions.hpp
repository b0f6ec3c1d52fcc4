#pragma once
//
// ReflowOptions.hpp
// -----------------------------------------------------------------------------
// Per-call configuration for ReflowCjkParagraphs. Plain value types, built once
// per run and never mutated while a reflow is in progress.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/regex.hpp>

namespace cjkreflow {
    struct ShortHeadingSettings {
        int maxLen = 8;

        // Which character-pattern classes may become a short heading.
        bool allCjk = true;
        bool allAscii = true;
        bool allAsciiDigits = true;
        bool mixedCjkAscii = false;

        static constexpr int kMinLen = 3;
        static constexpr int kMaxLen = 30;

        [[nodiscard]] int ClampedMaxLen() const noexcept {
            return std::clamp(maxLen, kMinLen, kMaxLen);
        }

        [[nodiscard]] ShortHeadingSettings Normalized() const noexcept {
            ShortHeadingSettings copy = *this;
            copy.maxLen = ClampedMaxLen();
            return copy;
        }
    };

    /// User-supplied title heading pattern (ECMAScript syntax), matched with
    /// regex_search against the bare form of a line.
    class CustomTitlePattern {
    public:
        // Throws boost::regex_error on a bad pattern.
        explicit CustomTitlePattern(const std::string &utf8Pattern);

        [[nodiscard]] bool Matches(std::u32string_view bare) const;

        [[nodiscard]] const std::string &Source() const noexcept { return source_; }

    private:
        std::string source_;
        std::shared_ptr<const boost::wregex> regex_;
    };

    struct PatternResult {
        bool success = false;
        std::string message;
        std::optional<CustomTitlePattern> pattern;
    };

    // Blank pattern → success with no pattern.
    PatternResult CompileCustomTitlePattern(const std::string &utf8Pattern);

    struct ReflowOptions {
        bool addPdfPageHeader = false;
        bool compact = false;
        ShortHeadingSettings shortHeading{};
        int sentenceBoundaryLevel = 2;
        std::optional<CustomTitlePattern> customTitle;
    };
} // namespace cjkreflow
