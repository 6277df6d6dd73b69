#include "ExportRequestIO.h"
#include "TimeUtil.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace ExportRequestIO {

namespace {

bool readNumber(const QJsonObject& obj, const char* key, double& out, int index, QString* error) {
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble()) {
        if (error) *error = QString("Clip %1: missing or non-numeric '%2'").arg(index + 1).arg(QLatin1String(key));
        return false;
    }
    out = v.toDouble();
    return true;
}

bool readString(const QJsonObject& obj, const char* key, QString& out, int index, QString* error) {
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isString()) {
        if (error) *error = QString("Clip %1: missing or non-string '%2'").arg(index + 1).arg(QLatin1String(key));
        return false;
    }
    out = v.toString();
    return true;
}

} // anonymous namespace

QJsonObject clipToJson(const Clip& clip) {
    QJsonObject obj;
    obj["file_path"] = clip.filePath;
    obj["start_time"] = clip.startTime;
    obj["duration"] = clip.duration;
    obj["trim_start"] = clip.trimStart;
    obj["trim_end"] = clip.trimEnd;
    obj["track_id"] = clip.trackId;
    if (clip.hasSourceDuration()) {
        obj["source_duration"] = clip.sourceDuration;
    }
    if (!clip.trimmedFilePath.isEmpty()) {
        obj["trimmed_file_path"] = clip.trimmedFilePath;
    }
    return obj;
}

bool clipFromJson(const QJsonObject& obj, int index, Clip& clip, QString* error) {
    Clip c;
    if (!readString(obj, "file_path", c.filePath, index, error)) return false;
    if (!readNumber(obj, "start_time", c.startTime, index, error)) return false;
    if (!readNumber(obj, "duration", c.duration, index, error)) return false;
    if (!readNumber(obj, "trim_start", c.trimStart, index, error)) return false;
    if (!readNumber(obj, "trim_end", c.trimEnd, index, error)) return false;
    if (!readString(obj, "track_id", c.trackId, index, error)) return false;

    // Optional; the pipeline probes the source when absent
    c.sourceDuration = obj["source_duration"].toDouble(0.0);

    clip = c;
    return true;
}

QJsonObject settingsToJson(const ExportSettings& settings) {
    QJsonObject obj;
    obj["resolution"] = ExportSettings::resolutionName(settings.resolution);
    obj["quality"] = ExportSettings::qualityName(settings.quality);
    obj["format"] = settings.format;
    obj["codec"] = settings.codec;
    return obj;
}

bool settingsFromJson(const QJsonObject& obj, ExportSettings& settings, QString* error) {
    const ExportSettings defaults;
    return ExportSettings::fromStrings(
        obj["resolution"].toString(ExportSettings::resolutionName(defaults.resolution)),
        obj["quality"].toString(ExportSettings::qualityName(defaults.quality)),
        obj["format"].toString(defaults.format),
        obj["codec"].toString(defaults.codec),
        settings, error);
}

QJsonObject requestToJson(const ExportRequest& request) {
    QJsonObject root;
    QJsonArray clipsArray;
    for (const Clip& clip : request.clips) {
        clipsArray.append(clipToJson(clip));
    }
    root["clips"] = clipsArray;
    root["output_dir"] = request.outputDir;
    root["filename"] = request.filename;
    root["settings"] = settingsToJson(request.settings);
    return root;
}

bool requestFromJson(const QJsonObject& obj, ExportRequest& request, QString* error) {
    if (!obj["clips"].isArray()) {
        if (error) *error = "Request has no 'clips' array";
        return false;
    }

    ExportRequest r;
    const QJsonArray clipsArray = obj["clips"].toArray();
    for (int i = 0; i < clipsArray.size(); ++i) {
        if (!clipsArray[i].isObject()) {
            if (error) *error = QString("Clip %1: not an object").arg(i + 1);
            return false;
        }
        Clip clip;
        if (!clipFromJson(clipsArray[i].toObject(), i, clip, error)) return false;
        r.clips.push_back(clip);
    }

    r.outputDir = obj["output_dir"].toString();
    r.filename = obj["filename"].toString();
    if (r.outputDir.isEmpty()) {
        if (error) *error = "Request has no 'output_dir'";
        return false;
    }
    if (r.filename.isEmpty()) {
        if (error) *error = "No filename provided";
        return false;
    }

    if (!settingsFromJson(obj["settings"].toObject(), r.settings, error)) return false;

    request = r;
    return true;
}

bool loadRequest(const QString& filePath, ExportRequest& request, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        if (error) *error = QString("Invalid request format: %1").arg(parseError.errorString());
        return false;
    }
    return requestFromJson(doc.object(), request, error);
}

QJsonObject resultToJson(const ExportResult& result) {
    QJsonObject obj;
    obj["success"] = result.success;
    if (result.outputPath) {
        obj["output_path"] = *result.outputPath;
    }
    if (result.errorMessage) {
        obj["error_message"] = *result.errorMessage;
        obj["error_kind"] = ExportError::kindName(result.errorKind);
    }
    return obj;
}

QJsonObject progressToJson(const ExportProgress& progress) {
    QJsonObject obj;
    obj["progress"] = progress.progress;
    obj["current_step"] = exportStepName(progress.currentStep);
    obj["estimated_time_remaining"] = progress.estimatedTimeRemaining;
    if (progress.error) obj["error"] = *progress.error;
    if (progress.frame) obj["frame"] = *progress.frame;
    if (progress.fps) obj["fps"] = *progress.fps;
    if (progress.bitrateKbps) obj["bitrate"] = *progress.bitrateKbps;
    if (progress.elapsedTime) obj["elapsed_time"] = *progress.elapsedTime;
    if (progress.speed) obj["speed"] = *progress.speed;
    return obj;
}

QJsonObject estimateToJson(const ExportEstimate& estimate) {
    QJsonObject obj;
    obj["estimated_time_seconds"] = estimate.estimatedTimeSeconds;
    obj["estimated_time"] = TimeUtil::formatEstimatedTime(estimate.estimatedTimeSeconds);
    obj["estimated_file_size_bytes"] = static_cast<qint64>(estimate.estimatedFileSizeBytes);
    obj["estimated_file_size"] = TimeUtil::formatFileSize(estimate.estimatedFileSizeBytes);
    obj["total_duration_seconds"] = estimate.totalDurationSeconds;
    obj["total_duration"] = TimeUtil::formatDuration(estimate.totalDurationSeconds);
    obj["clip_count"] = estimate.clipCount;
    return obj;
}

} // namespace ExportRequestIO
