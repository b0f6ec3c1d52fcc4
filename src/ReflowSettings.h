#pragma once

#include <QJsonObject>
#include <QString>

#include "PdfOptions.hpp"

// Settings file layout (JSON):
//
// {
//   "pdfOptions": {
//     "addPdfPageHeader": false,
//     "compactPdfText": false,
//     "autoReflowPdfText": true,
//     "extractMode": 1,
//     "sentenceBoundaryLevel": 2,
//     "shortHeadingSettings": {
//       "maxLen": 8, "allCjk": true, "allAscii": true,
//       "allAsciiDigits": true, "mixedCjkAscii": false,
//       "customTitleHeadingRegex": ""
//     },
//     "overlayFilter": {
//       "bandStep": 6.0, "repeatThreshold": 4, "tiledMinTokens": 6,
//       "tiledMaxTokenLength": 12, "lineGapTolerance": 1
//     }
//   }
// }
//
// Older files keep these flat at the top level:
//   addPdfPageHeader, compactPdfText, autoReflowPdfText, shortHeadingMaxLen

struct SettingsLoadResult {
    bool success = false;
    QString message;
    cjkreflow::pdf::PdfOptions options;
};

cjkreflow::pdf::PdfOptions pdfOptionsFromJson(const QJsonObject &obj);

QJsonObject pdfOptionsToJson(const cjkreflow::pdf::PdfOptions &options);

// Moves legacy flat keys into "pdfOptions" when that object is absent.
QJsonObject migrateLegacySettings(const QJsonObject &root);

// Missing file → defaults (success). Unreadable / malformed → failure.
SettingsLoadResult loadSettings(const QString &path);

bool saveSettings(const QString &path,
                  const cjkreflow::pdf::PdfOptions &options,
                  QString *errorMessage = nullptr);
