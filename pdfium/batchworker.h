#pragma once

#include <QObject>
#include <QStringList>
#include <QDir>
#include <atomic>

#include "PdfOptions.hpp"

namespace cjkreflow::pdf {
    class BatchWorker : public QObject
    {
        Q_OBJECT

    public:
        BatchWorker(const QStringList &files,
                    const QString &outDir,
                    const PdfOptions &options,
                    QObject *parent = nullptr);

    public slots:
        void process();
        void requestCancel();

    signals:
        void log(const QString &line);
        void progress(int current, int total); // (idx, total)
        void finished(bool cancelled, int failed);
        void error(const QString &msg);

    private:
        // false → the file counts as failed
        bool processOneFile(int idx, const QString &path);
        bool processText(int idx, const QString &path, const QString &baseName, const QString &extLower);
        bool processPdf(int idx, const QString &path, const QString &baseName);

        bool writeUtf8(int idx, const QString &outPath, const QString &text);

        QStringList m_files;
        QString     m_outDir;
        PdfOptions  m_options;
        ReflowOptions m_reflowOptions;

        std::atomic<bool> m_cancelRequested{false};
    };
} // namespace cjkreflow::pdf
