#pragma once

#include <QString>
#include <QJsonObject>

struct ExportConfig {
    QString ffmpegPath;
    QString scratchDir;
    int toolTimeoutMs = 0;
    int killGraceMs = 0;

    // ffmpeg from PATH, <system temp>/clipforge, 30 min watchdog
    static ExportConfig defaults();

    static QJsonObject toJson(const ExportConfig& config);
    // Missing keys keep their default value
    static ExportConfig fromJson(const QJsonObject& obj);

    static bool load(const QString& filePath, ExportConfig& config, QString* error = nullptr);
    bool save(const QString& filePath, QString* error = nullptr) const;

    // Creates the scratch dir if needed
    bool ensureScratchDir(QString* error = nullptr) const;
};
