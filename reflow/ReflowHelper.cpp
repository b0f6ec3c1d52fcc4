#include "ReflowHelper.hpp"

#include <utility>

#include "CjkText.hpp"
#include "PunctSets.hpp"
#include "ReflowCommon.hpp"
#include "SentenceBoundary.hpp"

namespace cjkreflow {
    namespace {
        using detail::DialogState;

        // The prose paragraph being assembled, with the dialog counters that
        // belong to it. Taking the segment out resets both.
        class ParagraphBuffer {
        public:
            [[nodiscard]] bool empty() const noexcept { return text_.empty(); }

            [[nodiscard]] const std::u32string &text() const noexcept { return text_; }

            [[nodiscard]] bool pendingHeading() const noexcept { return pendingHeading_; }

            [[nodiscard]] bool dialogUnclosed() const noexcept { return dialog_.is_unclosed(); }

            [[nodiscard]] bool hasUnclosedBracket() const {
                return text::punct::HasUnclosedBracket(text_);
            }

            // Dialog still open or a bracket left dangling: not a safe split point.
            [[nodiscard]] bool unsafeToSplit() const {
                return dialogUnclosed() || hasUnclosedBracket();
            }

            [[nodiscard]] bool lastNonWhitespace(char32_t &last) const noexcept {
                return text::TryGetLastNonWhitespace(text_, last);
            }

            void seed(const std::u32string &line, const bool pendingHeading) {
                text_ = line;
                pendingHeading_ = pendingHeading;
                dialog_.reset();
                dialog_.update(line);
            }

            void append(const std::u32string &line) {
                text_ += line;
                pendingHeading_ = false;
                dialog_.update(line);
            }

            Segment take() {
                Segment segment{pendingHeading_ ? LineKind::ShortHeading : LineKind::Prose, std::move(text_)};
                text_.clear();
                pendingHeading_ = false;
                dialog_.reset();
                return segment;
            }

        private:
            std::u32string text_;
            DialogState dialog_;
            bool pendingHeading_ = false;
        };

        // All-CJK short headings and "xxx：" headings may still be the first
        // half of a wrapped sentence ("今天天氣" / "很好。"). When they open a
        // paragraph they are held in the buffer and only stand alone if the
        // next line does not continue them.
        [[nodiscard]] bool IsSoftHeading(const ClassifiedLine &line) {
            return text::IsAllCjkIgnoringWhitespace(line.bare) ||
                   text::punct::EndsWithColonLike(line.bare);
        }

        // A paragraph opened by half-width indentation keeps it as a
        // full-width indent, so the break survives a second reflow.
        [[nodiscard]] std::u32string ParagraphOpening(const ClassifiedLine &line) {
            if (line.indented && !line.stripped.empty() && !text::IsWhitespace(line.stripped.front()))
                return U"\u3000\u3000" + line.stripped;
            return line.stripped;
        }

        class SegmentationEngine {
        public:
            explicit SegmentationEngine(const ReflowOptions &options)
                : options_(options),
                  level_(detail::ClampBoundaryLevel(options.sentenceBoundaryLevel)) {
                options_.shortHeading = options.shortHeading.Normalized();
            }

            void feed(const std::u32string &rawLine) {
                ClassifiedLine line = ClassifyLine(rawLine, options_);

                switch (line.kind) {
                    case LineKind::Empty:
                        onEmptyLine();
                        break;

                    case LineKind::PageMarker:
                        if (!options_.addPdfPageHeader)
                            break;
                        // Inside an open quote the marker waits for the paragraph.
                        if (buffer_.dialogUnclosed())
                            deferredMarkers_.push_back(std::move(line.stripped));
                        else
                            emitStructural(line);
                        break;

                    case LineKind::VisualDivider:
                    case LineKind::TitleHeading:
                    case LineKind::CustomTitleHeading:
                    case LineKind::MetadataLine:
                        if (buffer_.dialogUnclosed())
                            onProse(line);
                        else
                            emitStructural(line);
                        break;

                    case LineKind::ShortHeading:
                        onShortHeading(line);
                        break;

                    case LineKind::BracketStructural:
                        onBracketStructural(line);
                        break;

                    case LineKind::Prose:
                        onProse(line);
                        break;
                }
            }

            std::vector<Segment> finish() {
                flush();
                return std::move(segments_);
            }

        private:
            void flush() {
                if (!buffer_.empty())
                    segments_.push_back(buffer_.take());

                for (auto &marker: deferredMarkers_)
                    segments_.push_back(Segment{LineKind::PageMarker, std::move(marker)});
                deferredMarkers_.clear();
            }

            // The buffer ends a sentence (at the configured level) or is a
            // whole bracketed CJK line.
            [[nodiscard]] bool bufferAtBoundary() const {
                const std::u32string &text = buffer_.text();
                return (detail::EndsWithSentenceBoundary(text, level_) && !buffer_.hasUnclosedBracket()) ||
                       detail::EndsWithCjkBracketBoundary(text);
            }

            void emitStructural(ClassifiedLine &line) {
                flush();
                segments_.push_back(Segment{line.kind, std::move(line.stripped)});
            }

            void onEmptyLine() {
                if (buffer_.empty())
                    return;

                // A held heading followed by a blank line is a real heading.
                if (buffer_.pendingHeading()) {
                    flush();
                    return;
                }

                // Never split an open quote on a blank line (cross-page artifact).
                if (buffer_.unsafeToSplit())
                    return;

                // Without page headers a blank line is usually a page gap:
                // only a finished sentence ends the paragraph here.
                if (!options_.addPdfPageHeader && !bufferAtBoundary())
                    return;

                flush();
            }

            // Short heading versus continuation, judged from the buffer's
            // trailing character only.
            [[nodiscard]] bool shortHeadingContinues(const ClassifiedLine &line) const {
                if (buffer_.unsafeToSplit())
                    return true;

                char32_t last{};
                if (!buffer_.lastNonWhitespace(last))
                    return false;

                if (text::punct::IsCommaLike(last))
                    return true;

                return IsSoftHeading(line) && !text::punct::IsClauseOrEndPunct(last);
            }

            void onShortHeading(ClassifiedLine &line) {
                // Consecutive short lines (cast lists, contents) each stand alone.
                if (buffer_.pendingHeading() && !buffer_.unsafeToSplit())
                    flush();

                if (!buffer_.empty() && shortHeadingContinues(line)) {
                    onProse(line);
                    return;
                }

                flush();

                if (IsSoftHeading(line)) {
                    buffer_.seed(line.stripped, true);
                    return;
                }

                segments_.push_back(Segment{LineKind::ShortHeading, std::move(line.stripped)});
            }

            void onBracketStructural(ClassifiedLine &line) {
                if (!buffer_.empty()) {
                    char32_t last{};
                    const bool midSentence = buffer_.lastNonWhitespace(last) &&
                                             !text::punct::IsClauseOrEndPunct(last);
                    if (buffer_.unsafeToSplit() || midSentence) {
                        onProse(line);
                        return;
                    }
                }

                emitStructural(line);
            }

            void onProse(const ClassifiedLine &line) {
                if (buffer_.empty()) {
                    buffer_.seed(ParagraphOpening(line), false);
                    return;
                }

                char32_t last{};
                const bool hasLast = buffer_.lastNonWhitespace(last);

                // "他說：" + "「你好」" always stays together.
                if (hasLast && text::punct::IsColonLike(last) && line.dialogStart) {
                    buffer_.append(line.stripped);
                    return;
                }

                if (line.dialogStart) {
                    const bool midSentence = hasLast && text::punct::IsCommaLike(last);
                    if (midSentence || buffer_.unsafeToSplit()) {
                        buffer_.append(line.stripped);
                    } else {
                        flush();
                        buffer_.seed(ParagraphOpening(line), false);
                    }
                    return;
                }

                // Dialog safety gate: no split while a quote is open.
                if (buffer_.dialogUnclosed()) {
                    buffer_.append(line.stripped);
                    return;
                }

                if (bufferAtBoundary() || line.indented) {
                    flush();
                    buffer_.seed(ParagraphOpening(line), false);
                    return;
                }

                // soft line break
                buffer_.append(line.stripped);
            }

            ReflowOptions options_;
            int level_;
            ParagraphBuffer buffer_;
            std::vector<std::u32string> deferredMarkers_;
            std::vector<Segment> segments_;
        };
    } // namespace

    std::vector<Segment> ReflowSegments(const std::string &utf8Text, const ReflowOptions &options) {
        const std::vector<std::u32string> lines = detail::SplitLines(utf8Text);

        SegmentationEngine engine(options);
        for (const auto &line: lines)
            engine.feed(line);

        return engine.finish();
    }

    std::string JoinSegments(const std::vector<Segment> &segments, const bool compact) {
        std::u32string result32;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            if (i > 0)
                result32 += compact ? U"\n" : U"\n\n";
            result32 += segments[i].text;
        }
        return detail::U32ToUtf8(result32);
    }

    std::string ReflowCjkParagraphs(const std::string &utf8Text, const ReflowOptions &options) {
        return JoinSegments(ReflowSegments(utf8Text, options), options.compact);
    }

    std::string ReflowCjkParagraphs(const std::string &utf8Text,
                                    const bool addPdfPageHeader,
                                    const bool compact) {
        ReflowOptions options;
        options.addPdfPageHeader = addPdfPageHeader;
        options.compact = compact;
        return ReflowCjkParagraphs(utf8Text, options);
    }
} // namespace cjkreflow
