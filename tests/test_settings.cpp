#include <gtest/gtest.h>

#include <QByteArray>
#include <QFile>
#include <QJsonObject>
#include <QString>
#include <QTemporaryDir>

#include "ReflowSettings.h"

using cjkreflow::pdf::PdfOptions;

namespace {
    class SettingsFile : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_TRUE(dir.isValid());
        }

        QString write(const QByteArray &json) const {
            const QString path = dir.filePath(QStringLiteral("settings.json"));
            QFile file(path);
            EXPECT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
            file.write(json);
            file.close();
            return path;
        }

        QTemporaryDir dir;
    };
}

TEST_F(SettingsFile, MissingFileGivesDefaults) {
    const SettingsLoadResult loaded = loadSettings(dir.filePath(QStringLiteral("absent.json")));
    ASSERT_TRUE(loaded.success);

    const PdfOptions defaults;
    EXPECT_EQ(loaded.options.addPdfPageHeader, defaults.addPdfPageHeader);
    EXPECT_EQ(loaded.options.autoReflowPdfText, defaults.autoReflowPdfText);
    EXPECT_EQ(loaded.options.extractMode, 1);
    EXPECT_EQ(loaded.options.sentenceBoundaryLevel, 2);
    EXPECT_EQ(loaded.options.shortHeading.maxLen, 8);
}

TEST_F(SettingsFile, NestedPdfOptions) {
    const QString path = write(R"({
        "pdfOptions": {
            "addPdfPageHeader": true,
            "compactPdfText": true,
            "autoReflowPdfText": false,
            "extractMode": 2,
            "sentenceBoundaryLevel": 3,
            "shortHeadingSettings": {
                "maxLen": 12,
                "mixedCjkAscii": true,
                "customTitleHeadingRegex": "^Part \\d+$"
            },
            "overlayFilter": { "bandStep": 8.5, "repeatThreshold": 5 }
        }
    })");

    const SettingsLoadResult loaded = loadSettings(path);
    ASSERT_TRUE(loaded.success) << loaded.message.toStdString();

    const PdfOptions &o = loaded.options;
    EXPECT_TRUE(o.addPdfPageHeader);
    EXPECT_TRUE(o.compactPdfText);
    EXPECT_FALSE(o.autoReflowPdfText);
    EXPECT_EQ(o.extractMode, 2);
    EXPECT_EQ(o.sentenceBoundaryLevel, 3);
    EXPECT_EQ(o.shortHeading.maxLen, 12);
    EXPECT_TRUE(o.shortHeading.mixedCjkAscii);
    EXPECT_TRUE(o.shortHeading.allCjk);
    EXPECT_EQ(o.customTitleHeadingRegex, "^Part \\d+$");
    EXPECT_DOUBLE_EQ(o.overlayFilter.bandStep, 8.5);
    EXPECT_EQ(o.overlayFilter.repeatThreshold, 5);
    EXPECT_EQ(o.overlayFilter.tiledMinTokens, 6);
}

TEST_F(SettingsFile, LegacyFlatKeysAreMigrated) {
    const QString path = write(R"({
        "addPdfPageHeader": true,
        "compactPdfText": true,
        "autoReflowPdfText": false,
        "shortHeadingMaxLen": 10
    })");

    const SettingsLoadResult loaded = loadSettings(path);
    ASSERT_TRUE(loaded.success);
    EXPECT_TRUE(loaded.options.addPdfPageHeader);
    EXPECT_TRUE(loaded.options.compactPdfText);
    EXPECT_FALSE(loaded.options.autoReflowPdfText);
    EXPECT_EQ(loaded.options.shortHeading.maxLen, 10);
}

TEST_F(SettingsFile, NestedObjectWinsOverFlatKeys) {
    const QString path = write(R"({
        "addPdfPageHeader": true,
        "pdfOptions": { "addPdfPageHeader": false }
    })");

    const SettingsLoadResult loaded = loadSettings(path);
    ASSERT_TRUE(loaded.success);
    EXPECT_FALSE(loaded.options.addPdfPageHeader);
}

TEST_F(SettingsFile, ValuesAreNormalizedAfterLoad) {
    const QString path = write(R"({
        "pdfOptions": {
            "extractMode": 9,
            "sentenceBoundaryLevel": 0,
            "shortHeadingSettings": { "maxLen": 100 },
            "overlayFilter": { "repeatThreshold": 0, "bandStep": -1 }
        }
    })");

    const SettingsLoadResult loaded = loadSettings(path);
    ASSERT_TRUE(loaded.success);
    EXPECT_EQ(loaded.options.extractMode, 1);
    EXPECT_EQ(loaded.options.sentenceBoundaryLevel, 1);
    EXPECT_EQ(loaded.options.shortHeading.maxLen, 30);
    EXPECT_EQ(loaded.options.overlayFilter.repeatThreshold, 2);
    EXPECT_DOUBLE_EQ(loaded.options.overlayFilter.bandStep, 6.0);
}

TEST_F(SettingsFile, MalformedFileFails) {
    const SettingsLoadResult broken = loadSettings(write("{ \"pdfOptions\": "));
    EXPECT_FALSE(broken.success);
    EXPECT_FALSE(broken.message.isEmpty());

    const SettingsLoadResult array = loadSettings(write("[1, 2, 3]"));
    EXPECT_FALSE(array.success);
    EXPECT_TRUE(array.message.contains(QStringLiteral("not an object")));
}

TEST_F(SettingsFile, SaveThenLoad) {
    PdfOptions options;
    options.addPdfPageHeader = true;
    options.extractMode = 2;
    options.sentenceBoundaryLevel = 1;
    options.shortHeading.maxLen = 15;
    options.customTitleHeadingRegex = "^卷";
    options.overlayFilter.lineGapTolerance = 3;

    const QString path = dir.filePath(QStringLiteral("saved.json"));
    QString error;
    ASSERT_TRUE(saveSettings(path, options, &error)) << error.toStdString();

    const SettingsLoadResult loaded = loadSettings(path);
    ASSERT_TRUE(loaded.success);
    EXPECT_TRUE(loaded.options.addPdfPageHeader);
    EXPECT_EQ(loaded.options.extractMode, 2);
    EXPECT_EQ(loaded.options.sentenceBoundaryLevel, 1);
    EXPECT_EQ(loaded.options.shortHeading.maxLen, 15);
    EXPECT_EQ(loaded.options.customTitleHeadingRegex, "^卷");
    EXPECT_EQ(loaded.options.overlayFilter.lineGapTolerance, 3);
}

TEST(SettingsMigration, FlatKeysMoveUnderPdfOptions) {
    QJsonObject root;
    root["addPdfPageHeader"] = true;
    root["shortHeadingMaxLen"] = 12;
    root["unrelated"] = QStringLiteral("kept");

    const QJsonObject migrated = migrateLegacySettings(root);
    EXPECT_FALSE(migrated.contains("addPdfPageHeader"));
    EXPECT_FALSE(migrated.contains("shortHeadingMaxLen"));
    EXPECT_EQ(migrated.value("unrelated").toString(), QStringLiteral("kept"));

    const QJsonObject pdf = migrated.value("pdfOptions").toObject();
    EXPECT_TRUE(pdf.value("addPdfPageHeader").toBool());
    EXPECT_EQ(pdf.value("shortHeadingSettings").toObject().value("maxLen").toInt(), 12);
}
