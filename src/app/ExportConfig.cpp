#include "ExportConfig.h"
#include "AppConstants.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

ExportConfig ExportConfig::defaults() {
    ExportConfig c;
    c.ffmpegPath = AppConstants::DefaultFfmpegProgram;
    c.scratchDir = QDir(QDir::tempPath()).filePath(AppConstants::ScratchDirName);
    c.toolTimeoutMs = AppConstants::DefaultToolTimeoutMs;
    c.killGraceMs = AppConstants::DefaultKillGraceMs;
    return c;
}

QJsonObject ExportConfig::toJson(const ExportConfig& config) {
    QJsonObject obj;
    obj["ffmpegPath"] = config.ffmpegPath;
    obj["scratchDir"] = config.scratchDir;
    obj["toolTimeoutMs"] = config.toolTimeoutMs;
    obj["killGraceMs"] = config.killGraceMs;
    return obj;
}

ExportConfig ExportConfig::fromJson(const QJsonObject& obj) {
    ExportConfig c = defaults();
    c.ffmpegPath = obj["ffmpegPath"].toString(c.ffmpegPath);
    c.scratchDir = obj["scratchDir"].toString(c.scratchDir);
    c.toolTimeoutMs = obj["toolTimeoutMs"].toInt(c.toolTimeoutMs);
    c.killGraceMs = obj["killGraceMs"].toInt(c.killGraceMs);
    return c;
}

bool ExportConfig::load(const QString& filePath, ExportConfig& config, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        if (error) *error = QString("Invalid config format: %1").arg(parseError.errorString());
        return false;
    }

    config = fromJson(doc.object());
    return true;
}

bool ExportConfig::save(const QString& filePath, QString* error) const {
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(toJson(*this)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error) *error = QString("Cannot commit: %1").arg(filePath);
        return false;
    }
    return true;
}

bool ExportConfig::ensureScratchDir(QString* error) const {
    if (!QDir().mkpath(scratchDir)) {
        if (error) *error = QString("Failed to create temp directory: %1").arg(scratchDir);
        return false;
    }
    return true;
}
