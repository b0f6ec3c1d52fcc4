// cjkreflow command-line front end.
//
//   cjkreflow [options] <file>...
//
// Text-like inputs are reflowed to <out-dir>/<name>_reflow.<ext>, PDFs are
// extracted (and reflowed) to <out-dir>/<name>_reflow.txt. With --stdout a
// single input is written to standard output instead.

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QThread>
#include <QTimer>
#include <QDebug>

#include <atomic>
#include <csignal>
#include <cstdio>

#include "ReflowSettings.h"
#include "filetype_utils.h"
#include "batchworker.h"
#include "PdfExtractWorker.h"
#include "ReflowHelper.hpp"

using cjkreflow::pdf::BatchWorker;
using cjkreflow::pdf::PdfExtractWorker;
using cjkreflow::pdf::PdfOptions;

namespace {
    constexpr int kExitOk = 0;
    constexpr int kExitFailed = 1;
    constexpr int kExitUsage = 2;
    constexpr int kExitCancelled = 130;

    std::atomic<bool> g_interrupted{false};

    void onInterrupt(int) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }

    // Polls the SIGINT flag from the event loop and forwards it to a worker.
    template<typename Worker>
    void forwardInterrupt(QCoreApplication &app, Worker *worker) {
        auto *timer = new QTimer(&app);
        QObject::connect(timer, &QTimer::timeout, &app, [worker, timer] {
            if (g_interrupted.load(std::memory_order_relaxed)) {
                worker->requestCancel();
                timer->stop();
            }
        });
        timer->start(100);
    }

    void writeStdout(const QString &text) {
        QTextStream out(stdout);
        out.setEncoding(QStringConverter::Utf8);
        out << text;
        if (!text.endsWith('\n'))
            out << '\n';
        out.flush();
    }

    // Command-line flags override the settings file.
    bool applyOverrides(const QCommandLineParser &parser, PdfOptions &options, QString &error) {
        if (parser.isSet("page-header"))
            options.addPdfPageHeader = true;
        if (parser.isSet("compact"))
            options.compactPdfText = true;
        if (parser.isSet("no-reflow"))
            options.autoReflowPdfText = false;
        if (parser.isSet("mixed-heading"))
            options.shortHeading.mixedCjkAscii = true;
        if (parser.isSet("overlay-filter"))
            options.extractMode = 2;
        if (parser.isSet("title-regex"))
            options.customTitleHeadingRegex = parser.value("title-regex").toStdString();

        if (parser.isSet("level")) {
            bool ok = false;
            const int level = parser.value("level").toInt(&ok);
            if (!ok || level < 1 || level > 3) {
                error = QString("Invalid --level '%1' (expected 1, 2 or 3).").arg(parser.value("level"));
                return false;
            }
            options.sentenceBoundaryLevel = level;
        }

        if (parser.isSet("max-len")) {
            bool ok = false;
            const int maxLen = parser.value("max-len").toInt(&ok);
            if (!ok || maxLen <= 0) {
                error = QString("Invalid --max-len '%1'.").arg(parser.value("max-len"));
                return false;
            }
            options.shortHeading.maxLen = maxLen;
        }

        options = options.Normalized();
        return true;
    }

    int runSingleText(const QString &path, const PdfOptions &options) {
        const auto reflow = cjkreflow::pdf::MakeReflowOptions(options);
        if (!reflow.success) {
            qCritical().noquote() << QString::fromStdString(reflow.message);
            return kExitFailed;
        }

        QFile inFile(path);
        if (!inFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qCritical().noquote() << QString("%1 -> ❌ Error opening for read: %2").arg(path, inFile.errorString());
            return kExitFailed;
        }

        QTextStream in(&inFile);
        in.setEncoding(QStringConverter::Utf8);
        const std::string text = in.readAll().toStdString();

        writeStdout(QString::fromStdString(cjkreflow::ReflowCjkParagraphs(text, reflow.options)));
        return kExitOk;
    }

    int runSinglePdf(QCoreApplication &app, const QString &path, const PdfOptions &options) {
        auto *thread = new QThread(&app);
        auto *worker = new PdfExtractWorker(path, options);
        worker->moveToThread(thread);

        int exitCode = kExitOk;

        QObject::connect(thread, &QThread::started,
                         worker, &PdfExtractWorker::process);

        QObject::connect(worker, &PdfExtractWorker::progressChanged,
                         &app, [](const int percent, const QString &bar, const int pageIndex, const int pageCount) {
                             QTextStream err(stderr);
                             err << '\r' << bar << "  " << percent << "%  ("
                                     << (pageIndex + 1) << "/" << pageCount << ")";
                             err.flush();
                         });

        QObject::connect(worker, &PdfExtractWorker::finished,
                         &app, [&exitCode, thread](const QString &text) {
                             QTextStream(stderr) << '\n';
                             writeStdout(text);
                             exitCode = kExitOk;
                             thread->quit();
                         });

        QObject::connect(worker, &PdfExtractWorker::cancelled,
                         &app, [&exitCode, thread](const QString &) {
                             qWarning().noquote() << "\nPDF extraction cancelled.";
                             exitCode = kExitCancelled;
                             thread->quit();
                         });

        QObject::connect(worker, &PdfExtractWorker::errorOccurred,
                         &app, [&exitCode, thread, path](const QString &message) {
                             qCritical().noquote() << QString("%1 -> ❌ %2").arg(path, message);
                             exitCode = kExitFailed;
                             thread->quit();
                         });

        QObject::connect(thread, &QThread::finished,
                         worker, &QObject::deleteLater);
        QObject::connect(thread, &QThread::finished,
                         &app, &QCoreApplication::quit);

        forwardInterrupt(app, worker);

        thread->start();
        QCoreApplication::exec();
        thread->wait();
        return exitCode;
    }

    int runBatch(QCoreApplication &app, const QStringList &files, const QString &outDir, const PdfOptions &options) {
        auto *thread = new QThread(&app);
        auto *worker = new BatchWorker(files, outDir, options);
        worker->moveToThread(thread);

        int exitCode = kExitOk;

        QObject::connect(thread, &QThread::started,
                         worker, &BatchWorker::process);

        QObject::connect(worker, &BatchWorker::log,
                         &app, [](const QString &line) { qInfo().noquote() << line; });

        QObject::connect(worker, &BatchWorker::error,
                         &app, [](const QString &msg) { qWarning().noquote() << msg; });

        QObject::connect(worker, &BatchWorker::finished,
                         &app, [&exitCode, thread](const bool cancelled, const int failed) {
                             if (cancelled)
                                 exitCode = kExitCancelled;
                             else
                                 exitCode = failed > 0 ? kExitFailed : kExitOk;
                             qInfo().noquote() << QString("Batch finished: %1 failed%2.")
                                     .arg(failed)
                                     .arg(cancelled ? QStringLiteral(", cancelled") : QString());
                             thread->quit();
                         });

        QObject::connect(thread, &QThread::finished,
                         worker, &QObject::deleteLater);
        QObject::connect(thread, &QThread::finished,
                         &app, &QCoreApplication::quit);

        forwardInterrupt(app, worker);

        thread->start();
        QCoreApplication::exec();
        thread->wait();
        return exitCode;
    }
} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("cjkreflow"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    qSetMessagePattern(QStringLiteral("%{if-warning}warning: %{endif}%{if-critical}error: %{endif}%{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Reflow line-wrapped CJK text and extract PDF text into paragraphs."));
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOptions({
        {"settings", "JSON settings file.", "file"},
        {"write-settings", "Write the effective settings to <file> and exit.", "file"},
        {{"o", "out-dir"}, "Output directory (default: current directory).", "dir"},
        {"stdout", "Write the result of a single input to standard output."},
        {"page-header", "Keep / emit \"=== [Page x/y] ===\" page markers."},
        {"compact", "Join paragraphs with a single newline."},
        {"no-reflow", "PDF: extract only, do not reflow."},
        {"level", "Sentence boundary level: 1 lenient, 2 default, 3 strict.", "1|2|3"},
        {"max-len", "Short heading max length (clamped 3..30).", "n"},
        {"mixed-heading", "Allow mixed CJK/ASCII short headings."},
        {"title-regex", "Custom title heading regex (ECMAScript).", "pattern"},
        {"overlay-filter", "PDF: extract page objects and drop watermark/overlay text."},
    });
    parser.addPositionalArgument("files", "Input files (.pdf or text).", "<file>...");

    parser.process(app);

    PdfOptions options;
    if (parser.isSet("settings")) {
        const SettingsLoadResult loaded = loadSettings(parser.value("settings"));
        if (!loaded.success) {
            qCritical().noquote() << loaded.message;
            return kExitUsage;
        }
        if (!loaded.message.isEmpty())
            qInfo().noquote() << loaded.message;
        options = loaded.options;
    }

    if (QString error; !applyOverrides(parser, options, error)) {
        qCritical().noquote() << error;
        return kExitUsage;
    }

    if (const auto check = cjkreflow::pdf::MakeReflowOptions(options); !check.success) {
        qCritical().noquote() << QString::fromStdString(check.message);
        return kExitUsage;
    }

    if (parser.isSet("write-settings")) {
        if (QString error; !saveSettings(parser.value("write-settings"), options, &error)) {
            qCritical().noquote() << QString("Cannot write settings: %1").arg(error);
            return kExitFailed;
        }
        qInfo().noquote() << QString("Settings written: %1").arg(parser.value("write-settings"));
        return kExitOk;
    }

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        qCritical().noquote() << "No input files.";
        parser.showHelp(kExitUsage);
    }

    std::signal(SIGINT, onInterrupt);

    if (parser.isSet("stdout")) {
        if (files.size() != 1) {
            qCritical().noquote() << "--stdout takes exactly one input file.";
            return kExitUsage;
        }

        const QString &path = files.front();
        const QFileInfo fi(path);
        if (!fi.exists()) {
            qCritical().noquote() << QString("%1 -> ❌ File not found.").arg(path);
            return kExitFailed;
        }

        const QString extLower = fi.suffix().toLower();
        if (isPdfExt(extLower))
            return runSinglePdf(app, path, options);
        if (isAllowedTextLike(extLower))
            return runSingleText(path, options);

        qCritical().noquote() << QString("%1 -> ❌ Skip: Unsupported file type.").arg(path);
        return kExitFailed;
    }

    const QString outDir = parser.isSet("out-dir") ? parser.value("out-dir") : QDir::currentPath();
    return runBatch(app, files, outDir, options);
}
