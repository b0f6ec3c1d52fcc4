#include "filetype_utils.h"

#include <QDir>
#include <unordered_set>
#include <string>

namespace {

    inline const std::unordered_set<std::string> TEXTFILE_EXTENSIONS = {
        "txt", "md", "rst", "text",
        "html", "htm", "xhtml", "xml",
        "csv", "tsv",
        "tex", "log",
        "srt", "vtt", "ass"
    };

    inline const QString OUTPUT_SUFFIX = QStringLiteral("_reflow");

} // anonymous namespace (internal constants only)

bool isPdfExt(const QString &extLower)
{
    return extLower == QLatin1String("pdf");
}

bool isTextExt(const QString &extLower)
{
    return TEXTFILE_EXTENSIONS.count(extLower.toStdString()) != 0;
}

bool isAllowedTextLike(const QString &extLower)
{
    // allow files with NO extension as text
    return extLower.isEmpty() || isTextExt(extLower);
}

QString makeOutputPath(const QString &outDir,
                       const QString &baseName,
                       const QString &extLower)
{
    const QString fileName =
        baseName + OUTPUT_SUFFIX +
        (extLower.isEmpty() ? QString() : "." + extLower);

    return QDir(outDir).filePath(fileName);
}
