// BatchWorker.cpp
#include "batchworker.h"
#include "PdfExtractWorker.h"

#include <QFileInfo>
#include <QFile>
#include <QTextStream>
#include <utility>

#include "filetype_utils.h"
#include "../reflow/ReflowHelper.hpp"

namespace cjkreflow::pdf {
    BatchWorker::BatchWorker(const QStringList &files,
                             const QString &outDir,
                             const PdfOptions &options,
                             QObject *parent)
        : QObject(parent),
          m_files(files),
          m_outDir(outDir),
          m_options(options.Normalized()) {
    }

    void BatchWorker::requestCancel() {
        m_cancelRequested.store(true, std::memory_order_relaxed);
    }

    void BatchWorker::process() {
        const qsizetype total = m_files.size();
        if (total == 0) {
            emit finished(false, 0);
            return;
        }

        // One compile per batch; a bad custom title regex fails every file.
        ReflowOptionsResult reflow = MakeReflowOptions(m_options);
        if (!reflow.success) {
            emit error(QString::fromStdString(reflow.message));
            emit finished(false, static_cast<int>(total));
            return;
        }
        m_reflowOptions = std::move(reflow.options);

        if (const QDir dir(m_outDir); !dir.exists() && !dir.mkpath(".")) {
            emit error(QString("Cannot create output directory: %1").arg(m_outDir));
            emit finished(false, static_cast<int>(total));
            return;
        }

        int failed = 0;

        for (qsizetype i = 0; i < m_files.size(); ++i) {
            const qsizetype idx = i + 1;

            if (m_cancelRequested.load(std::memory_order_relaxed)) {
                emit log(QStringLiteral("Batch cancelled."));
                emit finished(true, failed);
                return;
            }

            const QString path = m_files.at(i);
            if (QFileInfo fi(path); !fi.exists()) {
                emit log(QString("%1: %2 -> ❌ File not found.")
                    .arg(idx)
                    .arg(path));
                emit progress(static_cast<int>(idx),
                              static_cast<int>(total));
                ++failed;
                continue;
            }

            try {
                if (!processOneFile(static_cast<int>(idx), path))
                    ++failed;
            } catch (const std::exception &e) {
                emit error(QString("%1: %2 -> Error: %3")
                    .arg(idx)
                    .arg(path, QString::fromUtf8(e.what())));
                ++failed;
            }

            emit progress(static_cast<int>(idx),
                          static_cast<int>(total));
        }

        emit finished(m_cancelRequested.load(std::memory_order_relaxed), failed);
    }

    bool BatchWorker::processOneFile(const int idx, const QString &path) {
        const QFileInfo fi(path);
        const QString extLower = fi.suffix().toLower();
        const QString baseName = fi.completeBaseName();

        if (isPdfExt(extLower))
            return processPdf(idx, path, baseName);

        // --- Text-like route (includes NO extension) ---
        if (!isAllowedTextLike(extLower)) {
            emit log(QString("%1: %2 -> ❌ Skip: Unsupported file type.")
                .arg(idx)
                .arg(path));
            return false;
        }

        return processText(idx, path, baseName, extLower);
    }

    bool BatchWorker::processText(const int idx,
                                  const QString &path,
                                  const QString &baseName,
                                  const QString &extLower) {
        const QString outPath = makeOutputPath(m_outDir, baseName, extLower);

        if (QFileInfo(path).absoluteFilePath() == QFileInfo(outPath).absoluteFilePath()) {
            emit log(QString("%1: %2 -> ❌ Skip: Output Path = Source Path.")
                .arg(idx)
                .arg(outPath));
            return false;
        }

        QFile inFile(path);
        if (!inFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
            emit log(QString("%1: %2 -> ❌ Error opening for read.")
                .arg(idx)
                .arg(path));
            return false;
        }

        QTextStream in(&inFile);
        in.setEncoding(QStringConverter::Utf8);
        const QString inputText = in.readAll();
        inFile.close();

        const std::string reflowed =
                ReflowCjkParagraphs(inputText.toStdString(), m_reflowOptions);

        if (!writeUtf8(idx, outPath, QString::fromStdString(reflowed)))
            return false;

        if (extLower.isEmpty()) {
            emit log(QString("%1: %2 -> ✅ Done (treated as text: no extension).")
                .arg(idx)
                .arg(outPath));
        } else {
            emit log(QString("%1: %2 -> ✅ Done.")
                .arg(idx)
                .arg(outPath));
        }
        return true;
    }

    bool BatchWorker::processPdf(const int idx,
                                 const QString &path,
                                 const QString &baseName) {
        // PDF output is always .txt
        const QString outPath = makeOutputPath(m_outDir, baseName, QStringLiteral("txt"));

        emit log(QString("%1: %2 -> Extracting PDF text...")
            .arg(idx)
            .arg(path));

        const PdfTextResult result = PdfExtractWorker::extractPdfTextBlocking(
            path,
            m_options,
            &m_cancelRequested);

        if (result.cancelled) {
            emit log(QString("%1: %2 -> ❌ Cancelled during PDF extraction.")
                .arg(idx)
                .arg(path));
            return false;
        }

        if (!result.success) {
            emit log(QString("%1: %2 -> ❌ %3")
                .arg(idx)
                .arg(path, result.message));
            return false;
        }

        if (result.text.trimmed().isEmpty()) {
            emit log(QString("%1: %2 -> ❌ Empty or non-text PDF.")
                .arg(idx)
                .arg(path));
            return false;
        }

        if (!writeUtf8(idx, outPath, result.text))
            return false;

        emit log(QString("%1: %2 -> ✅ Done (%3 pages).")
            .arg(idx)
            .arg(outPath)
            .arg(result.pageCount));
        return true;
    }

    bool BatchWorker::writeUtf8(const int idx, const QString &outPath, const QString &text) {
        QFile outFile(outPath);
        if (!outFile.open(QIODevice::WriteOnly | QIODevice::Text)) {
            emit log(QString("%1: %2 -> ❌ Error opening for write: %3")
                .arg(idx)
                .arg(outPath, outFile.errorString()));
            return false;
        } {
            QTextStream ts(&outFile);
            ts.setEncoding(QStringConverter::Utf8); // Qt 6
            ts << text;
        }
        outFile.close();
        return true;
    }
} // namespace cjkreflow::pdf
