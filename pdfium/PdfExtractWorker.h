// PdfExtractWorker.h
#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <atomic>
#include <utility>

#include "PdfOptions.hpp"
#include "PdfiumHelper.hpp"

namespace cjkreflow::pdf {
    // Outcome of a blocking extract (+ optional reflow) of one PDF.
    struct PdfTextResult {
        bool success = false;
        bool cancelled = false;
        QString message;
        QString text;
        int pageCount = 0;
    };

    class PdfExtractWorker final : public QObject {
        Q_OBJECT

    public:
        explicit PdfExtractWorker(QString filePath,
                                  PdfOptions options = {},
                                  QObject *parent = nullptr)
            : QObject(parent)
              , m_filePath(std::move(filePath))
              , m_options(options.Normalized())
              , m_cancelFlag(std::make_shared<std::atomic<bool> >(false)) {
        }

        // Synchronous helper for BatchWorker: extract, then reflow when
        // autoReflowPdfText is set. cancelFlag is polled before every page.
        // Never throws.
        static PdfTextResult extractPdfTextBlocking(const QString &filePath,
                                                    const PdfOptions &options,
                                                    const std::atomic<bool> *cancelFlag,
                                                    const ProgressCallback &progress = nullptr);

    public slots:
        // Entry point for the worker thread
        void process();

        // Called from another thread to request cancellation
        void requestCancel() const {
            m_cancelFlag->store(true, std::memory_order_relaxed);
        }

    signals:
        // percent: 0–100
        // bar: emoji progress bar (🟩🟩⬜⬜…)
        // pageIndex: 0-based
        // pageCount: total pages
        void progressChanged(int percent,
                             const QString &bar,
                             int pageIndex,
                             int pageCount);

        // Emitted when extraction (and reflow) finished normally
        void finished(const QString &text);

        // Emitted when cancelled, with the raw partial text
        void cancelled(const QString &partialText);

        // Emitted on error
        void errorOccurred(const QString &message);

    private:
        QString m_filePath;
        PdfOptions m_options;
        std::shared_ptr<std::atomic<bool> > m_cancelFlag;
    };
} // namespace cjkreflow::pdf
