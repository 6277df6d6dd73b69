#pragma once

#include <QJsonObject>
#include <QString>
#include "Clip.h"
#include "ExportTypes.h"

// JSON form of export requests and of everything reported back to a host.
// Keys are snake_case to match the request files the CLI reads.
namespace ExportRequestIO {

QJsonObject clipToJson(const Clip& clip);
// Fails when a required key is missing or has the wrong type; index is 0-based
bool clipFromJson(const QJsonObject& obj, int index, Clip& clip, QString* error = nullptr);

QJsonObject settingsToJson(const ExportSettings& settings);
// Missing keys fall back to source/medium/mp4/h264
bool settingsFromJson(const QJsonObject& obj, ExportSettings& settings, QString* error = nullptr);

QJsonObject requestToJson(const ExportRequest& request);
bool requestFromJson(const QJsonObject& obj, ExportRequest& request, QString* error = nullptr);
bool loadRequest(const QString& filePath, ExportRequest& request, QString* error = nullptr);

QJsonObject resultToJson(const ExportResult& result);
QJsonObject progressToJson(const ExportProgress& progress);
QJsonObject estimateToJson(const ExportEstimate& estimate);

} // namespace ExportRequestIO
