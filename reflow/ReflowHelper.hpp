#pragma once
//
// ReflowHelper.hpp
// -----------------------------------------------------------------------------
// CJK paragraph reflow (UTF-8 in / UTF-8 out).
//
// Rebuilds paragraphs from line-wrapped extracted text (PDF / EPUB / Office
// text layers): soft line breaks are merged, headings, page markers,
// metadata and dividers stay on their own, and dialog is never split while a
// quote is open. PDF-backend agnostic; the extractors in pdfium/ feed it.
//
// Public API:
//   std::string cjkreflow::ReflowCjkParagraphs(const std::string& utf8Text,
//                                              const ReflowOptions& options);
//   std::string cjkreflow::ReflowCjkParagraphs(const std::string& utf8Text,
//                                              bool addPdfPageHeader,
//                                              bool compact);
// -----------------------------------------------------------------------------

#include <string>
#include <vector>

#include "LineClassifier.hpp"
#include "ReflowOptions.hpp"

namespace cjkreflow {
    /// One unit of output. Structural lines keep their LineKind, flushed
    /// paragraphs are Prose (or ShortHeading when a pending heading was
    /// never continued).
    struct Segment {
        LineKind kind = LineKind::Prose;
        std::u32string text;
    };

    /// Ordered segments for the input. Empty / whitespace-only input → none.
    [[nodiscard]] std::vector<Segment> ReflowSegments(const std::string &utf8Text,
                                                      const ReflowOptions &options);

    /// compact → "p1\np2", novel → "p1\n\np2"
    [[nodiscard]] std::string JoinSegments(const std::vector<Segment> &segments, bool compact);

    [[nodiscard]] std::string ReflowCjkParagraphs(const std::string &utf8Text,
                                                  const ReflowOptions &options);

    [[nodiscard]] std::string ReflowCjkParagraphs(const std::string &utf8Text,
                                                  bool addPdfPageHeader,
                                                  bool compact);
} // namespace cjkreflow
