#pragma once

#include <QString>

bool isPdfExt(const QString &extLower);
bool isTextExt(const QString &extLower);
bool isAllowedTextLike(const QString &extLower);

// <outDir>/<baseName>_reflow[.ext]
QString makeOutputPath(const QString &outDir,
                       const QString &baseName,
                       const QString &extLower);
