#pragma once
//
// PdfOptions.hpp
// -----------------------------------------------------------------------------
// User-facing PDF / reflow options, as stored in the settings file under
// "pdfOptions". Converts to the per-call option structs of the reflow engine
// and the extractor.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <string>
#include <utility>

#include "../reflow/ReflowOptions.hpp"
#include "../reflow/SentenceBoundary.hpp"
#include "OverlayFilter.hpp"

namespace cjkreflow::pdf {
    struct PdfOptions {
        bool addPdfPageHeader = false;
        bool compactPdfText = false;
        bool autoReflowPdfText = true;

        // 1 = pdfium text layer, 2 = page objects + overlay filter
        int extractMode = 1;

        ShortHeadingSettings shortHeading{};
        std::string customTitleHeadingRegex;
        int sentenceBoundaryLevel = cjkreflow::detail::kDefaultBoundaryLevel;

        OverlayFilterOptions overlayFilter{};

        [[nodiscard]] PdfOptions Normalized() const {
            PdfOptions copy = *this;
            if (copy.extractMode != 1 && copy.extractMode != 2)
                copy.extractMode = 1;
            copy.shortHeading = copy.shortHeading.Normalized();
            copy.sentenceBoundaryLevel = cjkreflow::detail::ClampBoundaryLevel(copy.sentenceBoundaryLevel);
            copy.overlayFilter = copy.overlayFilter.Normalized();
            return copy;
        }
    };

    // Compiles the custom title regex; a bad pattern fails the whole run
    // rather than silently reflowing without it.
    struct ReflowOptionsResult {
        bool success = false;
        std::string message;
        ReflowOptions options;
    };

    inline ReflowOptionsResult MakeReflowOptions(const PdfOptions &pdfOptions) {
        const PdfOptions opts = pdfOptions.Normalized();

        ReflowOptionsResult result;
        result.options.addPdfPageHeader = opts.addPdfPageHeader;
        result.options.compact = opts.compactPdfText;
        result.options.shortHeading = opts.shortHeading;
        result.options.sentenceBoundaryLevel = opts.sentenceBoundaryLevel;

        auto compiled = CompileCustomTitlePattern(opts.customTitleHeadingRegex);
        if (!compiled.success) {
            result.message = std::move(compiled.message);
            return result;
        }

        result.options.customTitle = std::move(compiled.pattern);
        result.success = true;
        return result;
    }
} // namespace cjkreflow::pdf
