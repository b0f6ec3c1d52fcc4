#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/nowide/utf/convert.hpp>

// PDFium public headers.
#include "fpdfview.h"
#include "fpdf_edit.h"
#include "fpdf_text.h"

#include "ExtractProgress.hpp"
#include "OverlayFilter.hpp"

namespace cjkreflow::pdf {
    // ============================================================
    //  PdfiumLibrary (process-wide RAII + global mutex)
    // ============================================================
    class PdfiumLibrary {
    public:
        PdfiumLibrary(const PdfiumLibrary &) = delete;

        PdfiumLibrary &operator=(const PdfiumLibrary &) = delete;

        static PdfiumLibrary &Instance() {
            static PdfiumLibrary instance;
            return instance;
        }

        std::mutex &Mutex() noexcept { return mutex_; }

    private:
        PdfiumLibrary() {
            FPDF_InitLibrary();
        }

        ~PdfiumLibrary() {
            FPDF_DestroyLibrary();
        }

        std::mutex mutex_;
    };

    inline const char *DescribeLoadError(const unsigned long err) noexcept {
        switch (err) {
            case FPDF_ERR_SUCCESS: return "no error";
            case FPDF_ERR_FILE: return "file not found or could not be opened";
            case FPDF_ERR_FORMAT: return "not a PDF or corrupted";
            case FPDF_ERR_PASSWORD: return "password required or incorrect";
            case FPDF_ERR_SECURITY: return "unsupported security scheme";
            case FPDF_ERR_PAGE: return "page not found or content error";
            default: return "unknown error";
        }
    }

    // ============================================================
    //  RAII wrappers: Document, Page & TextPage
    //  Callers hold PdfiumLibrary::Mutex() while using the handles.
    // ============================================================
    class Document {
    public:
        Document() = default;

        explicit Document(const std::string &path,
                          const std::string &password = {}) {
            Open(path, password);
        }

        ~Document() {
            Reset();
        }

        Document(const Document &) = delete;

        Document &operator=(const Document &) = delete;

        Document(Document &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Document &operator=(Document &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(const std::string &path,
                  const std::string &password = {}) {
            Reset();

            handle_ = FPDF_LoadDocument(
                path.c_str(),
                password.empty() ? nullptr : password.c_str());

            if (!handle_) {
                const unsigned long err = FPDF_GetLastError();
                throw std::runtime_error("Failed to open PDF (" + std::string(DescribeLoadError(err)) +
                                         ", error = " + std::to_string(err) + ")");
            }
        }

        void Reset() noexcept {
            if (handle_) {
                FPDF_CloseDocument(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_DOCUMENT Get() const noexcept { return handle_; }

        [[nodiscard]] int GetPageCount() const {
            return handle_ ? FPDF_GetPageCount(handle_) : 0;
        }

    private:
        FPDF_DOCUMENT handle_ = nullptr;
    };

    class Page {
    public:
        Page() = default;

        Page(FPDF_DOCUMENT doc, const int index) {
            Open(doc, index);
        }

        ~Page() {
            Reset();
        }

        Page(const Page &) = delete;

        Page &operator=(const Page &) = delete;

        Page(Page &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Page &operator=(Page &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(FPDF_DOCUMENT doc, const int index) {
            Reset();
            if (!doc)
                throw std::runtime_error("Page::Open: null document handle");

            handle_ = FPDF_LoadPage(doc, index);
            if (!handle_)
                throw std::runtime_error("FPDF_LoadPage failed at index " +
                                         std::to_string(index));
        }

        void Reset() noexcept {
            if (handle_) {
                FPDF_ClosePage(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_PAGE Get() const noexcept { return handle_; }

    private:
        FPDF_PAGE handle_ = nullptr;
    };

    // Pdfium handles (FPDF_PAGE, FPDF_TEXTPAGE, FPDF_DOCUMENT, etc.) must
    // never be declared const: they are opaque pointers pdfium mutates.
    class TextPage {
    public:
        explicit TextPage(FPDF_PAGE page)
            : handle_(page ? FPDFText_LoadPage(page) : nullptr) {
        }

        ~TextPage() {
            if (handle_)
                FPDFText_ClosePage(handle_);
        }

        TextPage(const TextPage &) = delete;

        TextPage &operator=(const TextPage &) = delete;

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_TEXTPAGE Get() const noexcept { return handle_; }

    private:
        FPDF_TEXTPAGE handle_ = nullptr;
    };

    // ============================================================
    //  Internal helpers: page text, page objects
    // ============================================================

    namespace detail {
        // Unpaired surrogates become U+FFFD.
        inline std::string Utf16ToUtf8(const std::u16string &src) {
            return boost::nowide::utf::convert_string<char>(src.data(), src.data() + src.size());
        }

        inline void NormalizeNewlinesInPlace(std::string &s) {
            std::string out;
            out.reserve(s.size());

            for (std::size_t i = 0; i < s.size(); ++i) {
                if (const char c = s[i]; c == '\r') {
                    if (i + 1 < s.size() && s[i + 1] == '\n')
                        ++i;
                    out.push_back('\n');
                } else {
                    out.push_back(c);
                }
            }

            s.swap(out);
        }

        inline std::string TrimCopy(const std::string &s) {
            std::size_t start = 0;
            std::size_t end = s.size();

            while (start < end && std::isspace(static_cast<unsigned char>(s[start])))
                ++start;
            while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
                --end;

            return s.substr(start, end - start);
        }

        // Plain text layer of a page (UTF-8).
        inline std::string ExtractPageText(FPDF_PAGE page) {
            const TextPage textPage(page);
            if (!textPage.IsValid())
                return {};

            const int nChars = FPDFText_CountChars(textPage.Get());
            if (nChars <= 0)
                return {};

            std::u16string buffer(static_cast<std::size_t>(nChars) + 1, u'\0');

            int written = FPDFText_GetText(
                textPage.Get(),
                0,
                nChars,
                reinterpret_cast<unsigned short *>(buffer.data()));

            if (written <= 0)
                return {};

            // |written| includes terminating NUL
            if (written > nChars)
                written = nChars;

            buffer.resize(static_cast<std::size_t>(written));
            return Utf16ToUtf8(buffer);
        }

        inline std::string TextObjectText(FPDF_PAGEOBJECT object, FPDF_TEXTPAGE textPage) {
            // First call reports the byte length including the UTF-16 NUL.
            const unsigned long bytes = FPDFTextObj_GetText(object, textPage, nullptr, 0);
            if (bytes <= sizeof(char16_t))
                return {};

            std::u16string buffer(bytes / sizeof(char16_t), u'\0');
            const unsigned long got = FPDFTextObj_GetText(
                object,
                textPage,
                reinterpret_cast<FPDF_WCHAR *>(buffer.data()),
                bytes);

            if (got <= sizeof(char16_t))
                return {};

            buffer.resize(got / sizeof(char16_t) - 1);
            return Utf16ToUtf8(buffer);
        }

        // Text page objects in content-stream order → overlay fragments.
        inline std::vector<TextObjectFragment> CollectTextFragments(FPDF_PAGE page,
                                                                    const OverlayFilterOptions &options) {
            std::vector<TextObjectFragment> fragments;

            const TextPage textPage(page);
            if (!textPage.IsValid())
                return fragments;

            const int count = FPDFPage_CountObjects(page);
            fragments.reserve(static_cast<std::size_t>(std::max(0, count)));

            for (int i = 0; i < count; ++i) {
                FPDF_PAGEOBJECT object = FPDFPage_GetObject(page, i);
                if (!object || FPDFPageObj_GetType(object) != FPDF_PAGEOBJ_TEXT)
                    continue;

                float left = 0, bottom = 0, right = 0, top = 0;
                if (!FPDFPageObj_GetBounds(object, &left, &bottom, &right, &top))
                    continue;

                std::string text = TextObjectText(object, textPage.Get());
                NormalizeNewlinesInPlace(text);

                const double yMid = (static_cast<double>(bottom) + static_cast<double>(top)) / 2.0;
                fragments.push_back(MakeFragment(text, yMid, options));
            }

            return fragments;
        }
    } // namespace detail

    // ============================================================
    //  High-level text extraction API
    // ============================================================

    enum class ExtractMode {
        PlainText = 1, // pdfium text layer
        PageObjects = 2 // text page objects + overlay filter
    };

    struct ExtractOptions {
        bool addPageHeader = true;
        ExtractMode mode = ExtractMode::PlainText;
        OverlayFilterOptions overlay{};
    };

    struct ExtractResult {
        bool success = false;
        std::string message;
        std::string text; // UTF-8; partial when cancelled
        int pageCount = 0;
        bool cancelled = false;
        std::size_t overlayDropped = 0;
    };

    // Progress callback:
    //   pageIndex  : 0-based page index
    //   pageCount  : total pages
    //   percent    : completion percentage (0..100)
    //   bar        : emoji progress bar (🟩⬜⬜...)
    using ProgressCallback =
    std::function<void(int pageIndex,
                       int pageCount,
                       int percent,
                       const std::string &bar)>;

    // Synchronous extraction. Throws std::runtime_error when the document
    // or a page cannot be loaded; cancellation is not an error.
    inline ExtractResult ExtractText(const std::string &path,
                                     const ExtractOptions &options = {},
                                     const ProgressCallback &progress = nullptr,
                                     const std::atomic<bool> *cancelFlag = nullptr) {
        auto &lib = PdfiumLibrary::Instance();

        ExtractResult result;
        std::unique_lock lock(lib.Mutex());

        const Document doc(path);
        const int pageCount = doc.GetPageCount();
        result.pageCount = pageCount;

        if (pageCount <= 0) {
            result.success = true;
            return result;
        }

        result.text.reserve(16 * 1024);

        const auto onPage = [&](const int i) {
            const Page page(doc.Get(), i);

            if (options.addPageHeader) {
                // Example: === [Page 1/220] ===
                result.text += "=== [Page ";
                result.text += std::to_string(i + 1);
                result.text += "/";
                result.text += std::to_string(pageCount);
                result.text += "] ===\n\n";
            }

            std::string pageText;
            if (options.mode == ExtractMode::PageObjects) {
                const auto filtered = FilterOverlayFragments(
                    detail::CollectTextFragments(page.Get(), options.overlay),
                    options.overlay);
                result.overlayDropped += filtered.dropped;
                pageText = ComposePageText(filtered.kept, options.overlay);
            } else {
                pageText = detail::ExtractPageText(page.Get());
                detail::NormalizeNewlinesInPlace(pageText);
            }

            // Blank pages keep their slot as an empty line.
            result.text += detail::TrimCopy(pageText);
            result.text += "\n\n";
        };

        const auto onReport = [&](const int i, const int percent, const std::string &bar) {
            if (!progress)
                return;
            lock.unlock();
            progress(i, pageCount, percent, bar);
            lock.lock();
        };

        result.cancelled = RunPageLoop(pageCount, cancelFlag, onPage, onReport).cancelled;

        result.success = !result.cancelled;
        if (result.cancelled)
            result.message = "Extraction cancelled";
        return result;
    }
} // namespace cjkreflow::pdf
