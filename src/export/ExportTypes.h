#pragma once

#include <QString>
#include <QStringList>
#include <QMetaType>
#include <optional>
#include <vector>
#include "Clip.h"
#include "ExportError.h"

enum class ExportResolution {
    Source,
    P1080,
    P720
};

enum class ExportQuality {
    High,
    Medium,
    Low
};

struct ExportSettings {
    ExportResolution resolution = ExportResolution::Source;
    ExportQuality quality = ExportQuality::Medium;
    QString format = "mp4";
    QString codec = "h264";

    // Parses the string form used by requests. Unknown values fail with a
    // message listing the accepted ones.
    static bool fromStrings(const QString& resolution, const QString& quality,
                            const QString& format, const QString& codec,
                            ExportSettings& out, QString* error = nullptr);

    // Rejects any format/codec other than the fixed pair
    bool validate(QString* error = nullptr) const;

    static QString resolutionName(ExportResolution r);
    static QString qualityName(ExportQuality q);
    static QStringList availableResolutions();
    static QStringList availableQualities();
};

enum class ExportStep {
    Idle,
    Preparing,
    Exporting,
    Completed,
    Failed,
    Cancelled
};

QString exportStepName(ExportStep step);

struct ExportProgress {
    double progress = 0.0;                 // 0..100
    ExportStep currentStep = ExportStep::Idle;
    double estimatedTimeRemaining = 0.0;   // seconds
    std::optional<QString> error;

    // Telemetry from the tool's status line
    std::optional<qint64> frame;
    std::optional<double> fps;
    std::optional<double> bitrateKbps;
    std::optional<double> elapsedTime;
    std::optional<double> speed;
};

struct ExportRequest {
    std::vector<Clip> clips;
    QString outputDir;
    QString filename;
    ExportSettings settings;
};

struct ExportResult {
    bool success = false;
    std::optional<QString> outputPath;
    std::optional<QString> errorMessage;
    ExportError::Kind errorKind = ExportError::Kind::None;

    static ExportResult succeeded(const QString& path) {
        ExportResult r;
        r.success = true;
        r.outputPath = path;
        return r;
    }

    static ExportResult failed(const ExportError& error) {
        ExportResult r;
        r.errorMessage = error.message;
        r.errorKind = error.kind;
        return r;
    }
};

struct ExportEstimate {
    double estimatedTimeSeconds = 0.0;
    quint64 estimatedFileSizeBytes = 0;
    double totalDurationSeconds = 0.0;
    int clipCount = 0;
};

Q_DECLARE_METATYPE(ExportProgress)
Q_DECLARE_METATYPE(ExportResult)
