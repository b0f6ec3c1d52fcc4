// PdfExtractWorker.cpp

#include "PdfExtractWorker.h"

#include <QDebug>
#include <QString>
#include <atomic>

#include "../reflow/ReflowHelper.hpp"

namespace cjkreflow::pdf {
    namespace {
        QString FromUtf8(const std::string &s) {
            return QString::fromUtf8(s.c_str(), static_cast<qsizetype>(s.size()));
        }

        ExtractOptions MakeExtractOptions(const PdfOptions &options) {
            ExtractOptions extract;
            extract.addPageHeader = options.addPdfPageHeader;
            extract.mode = options.extractMode == 2 ? ExtractMode::PageObjects : ExtractMode::PlainText;
            extract.overlay = options.overlayFilter;
            return extract;
        }
    } // namespace

    void PdfExtractWorker::process() {
        const ProgressCallback progressCb =
                [this](const int pageIndex,
                       const int pageCount,
                       const int percent,
                       const std::string &barUtf8) {
            if (m_cancelFlag->load(std::memory_order_relaxed))
                return;

            emit progressChanged(percent, FromUtf8(barUtf8), pageIndex, pageCount);
        };

        const PdfTextResult result = extractPdfTextBlocking(
            m_filePath,
            m_options,
            m_cancelFlag.get(),
            progressCb);

        if (result.cancelled) {
            emit cancelled(result.text);
            return;
        }

        if (!result.success) {
            emit errorOccurred(result.message);
            return;
        }

        emit finished(result.text);
    }

    PdfTextResult PdfExtractWorker::extractPdfTextBlocking(
        const QString &filePath,
        const PdfOptions &options,
        const std::atomic<bool> *cancelFlag,
        const ProgressCallback &progress) {
        const PdfOptions opts = options.Normalized();
        PdfTextResult out;

        // Compile the title regex before touching the document.
        ReflowOptionsResult reflow = MakeReflowOptions(opts);
        if (opts.autoReflowPdfText && !reflow.success) {
            out.message = FromUtf8(reflow.message);
            qWarning() << "PDF reflow options:" << out.message;
            return out;
        }

        ExtractResult extracted;
        try {
            extracted = ExtractText(filePath.toUtf8().toStdString(),
                                    MakeExtractOptions(opts),
                                    progress,
                                    cancelFlag);
        } catch (const std::exception &ex) {
            out.message = QString::fromUtf8(ex.what());
            qWarning() << "PDF extract error:" << filePath << out.message;
            return out;
        }

        out.pageCount = extracted.pageCount;

        if (extracted.overlayDropped > 0) {
            qInfo().noquote() << QString("%1: dropped %2 overlay text object(s).")
                    .arg(filePath)
                    .arg(static_cast<qulonglong>(extracted.overlayDropped));
        }

        // Never reflow a cancelled run's partial text.
        if (extracted.cancelled || (cancelFlag && cancelFlag->load(std::memory_order_relaxed))) {
            out.cancelled = true;
            out.message = QStringLiteral("Cancelled during PDF extraction.");
            out.text = FromUtf8(extracted.text);
            return out;
        }

        std::string textUtf8 = std::move(extracted.text);

        if (opts.autoReflowPdfText && !textUtf8.empty())
            textUtf8 = ReflowCjkParagraphs(textUtf8, reflow.options);

        out.success = true;
        out.text = FromUtf8(textUtf8);
        return out;
    }
} // namespace cjkreflow::pdf
