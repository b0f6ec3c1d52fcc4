#include "ReflowSettings.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

using cjkreflow::ShortHeadingSettings;
using cjkreflow::pdf::OverlayFilterOptions;
using cjkreflow::pdf::PdfOptions;

namespace {
    const QString kPdfOptionsKey = QStringLiteral("pdfOptions");
    const QString kShortHeadingKey = QStringLiteral("shortHeadingSettings");
    const QString kOverlayKey = QStringLiteral("overlayFilter");

    ShortHeadingSettings shortHeadingFromJson(const QJsonObject &obj, const ShortHeadingSettings &defaults) {
        ShortHeadingSettings s = defaults;
        s.maxLen = obj.value("maxLen").toInt(s.maxLen);
        s.allCjk = obj.value("allCjk").toBool(s.allCjk);
        s.allAscii = obj.value("allAscii").toBool(s.allAscii);
        s.allAsciiDigits = obj.value("allAsciiDigits").toBool(s.allAsciiDigits);
        s.mixedCjkAscii = obj.value("mixedCjkAscii").toBool(s.mixedCjkAscii);
        return s;
    }

    OverlayFilterOptions overlayFromJson(const QJsonObject &obj) {
        OverlayFilterOptions o;
        o.bandStep = obj.value("bandStep").toDouble(o.bandStep);
        o.repeatThreshold = obj.value("repeatThreshold").toInt(o.repeatThreshold);
        o.tiledMinTokens = obj.value("tiledMinTokens").toInt(o.tiledMinTokens);
        o.tiledMaxTokenLength = obj.value("tiledMaxTokenLength").toInt(o.tiledMaxTokenLength);
        o.lineGapTolerance = obj.value("lineGapTolerance").toInt(o.lineGapTolerance);
        return o;
    }
} // namespace

PdfOptions pdfOptionsFromJson(const QJsonObject &obj) {
    PdfOptions o;
    o.addPdfPageHeader = obj.value("addPdfPageHeader").toBool(o.addPdfPageHeader);
    o.compactPdfText = obj.value("compactPdfText").toBool(o.compactPdfText);
    o.autoReflowPdfText = obj.value("autoReflowPdfText").toBool(o.autoReflowPdfText);
    o.extractMode = obj.value("extractMode").toInt(o.extractMode);
    o.sentenceBoundaryLevel = obj.value("sentenceBoundaryLevel").toInt(o.sentenceBoundaryLevel);

    const QJsonObject heading = obj.value(kShortHeadingKey).toObject();
    o.shortHeading = shortHeadingFromJson(heading, o.shortHeading);
    o.customTitleHeadingRegex = heading.value("customTitleHeadingRegex").toString().toStdString();

    o.overlayFilter = overlayFromJson(obj.value(kOverlayKey).toObject());

    return o.Normalized();
}

QJsonObject pdfOptionsToJson(const PdfOptions &options) {
    const PdfOptions o = options.Normalized();

    QJsonObject heading;
    heading["maxLen"] = o.shortHeading.maxLen;
    heading["allCjk"] = o.shortHeading.allCjk;
    heading["allAscii"] = o.shortHeading.allAscii;
    heading["allAsciiDigits"] = o.shortHeading.allAsciiDigits;
    heading["mixedCjkAscii"] = o.shortHeading.mixedCjkAscii;
    heading["customTitleHeadingRegex"] = QString::fromStdString(o.customTitleHeadingRegex);

    QJsonObject overlay;
    overlay["bandStep"] = o.overlayFilter.bandStep;
    overlay["repeatThreshold"] = o.overlayFilter.repeatThreshold;
    overlay["tiledMinTokens"] = o.overlayFilter.tiledMinTokens;
    overlay["tiledMaxTokenLength"] = o.overlayFilter.tiledMaxTokenLength;
    overlay["lineGapTolerance"] = o.overlayFilter.lineGapTolerance;

    QJsonObject obj;
    obj["addPdfPageHeader"] = o.addPdfPageHeader;
    obj["compactPdfText"] = o.compactPdfText;
    obj["autoReflowPdfText"] = o.autoReflowPdfText;
    obj["extractMode"] = o.extractMode;
    obj["sentenceBoundaryLevel"] = o.sentenceBoundaryLevel;
    obj[kShortHeadingKey] = heading;
    obj[kOverlayKey] = overlay;
    return obj;
}

QJsonObject migrateLegacySettings(const QJsonObject &root) {
    if (root.contains(kPdfOptionsKey))
        return root;

    QJsonObject migrated = root;
    QJsonObject pdf;

    for (const char *key: {"addPdfPageHeader", "compactPdfText", "autoReflowPdfText"}) {
        const QString k = QString::fromLatin1(key);
        if (migrated.contains(k)) {
            pdf[k] = migrated.value(k);
            migrated.remove(k);
        }
    }

    if (migrated.contains("shortHeadingMaxLen")) {
        QJsonObject heading;
        heading["maxLen"] = migrated.value("shortHeadingMaxLen");
        pdf[kShortHeadingKey] = heading;
        migrated.remove("shortHeadingMaxLen");
    }

    migrated[kPdfOptionsKey] = pdf;
    return migrated;
}

SettingsLoadResult loadSettings(const QString &path) {
    SettingsLoadResult result;

    if (!QFileInfo::exists(path)) {
        result.success = true;
        result.message = QString("Settings file not found, using defaults: %1").arg(path);
        return result;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        result.message = QString("Cannot read settings file %1: %2").arg(path, file.errorString());
        return result;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.message = QString("Malformed settings file %1: %2")
                .arg(path, parseError.error != QJsonParseError::NoError
                               ? parseError.errorString()
                               : QStringLiteral("top-level value is not an object"));
        return result;
    }

    const QJsonObject root = migrateLegacySettings(doc.object());
    result.options = pdfOptionsFromJson(root.value(kPdfOptionsKey).toObject());
    result.success = true;
    return result;
}

bool saveSettings(const QString &path, const PdfOptions &options, QString *errorMessage) {
    QJsonObject root;
    root[kPdfOptionsKey] = pdfOptionsToJson(options);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));

    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return false;
    }
    return true;
}
