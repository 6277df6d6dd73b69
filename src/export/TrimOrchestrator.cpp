#include "TrimOrchestrator.h"
#include "AppConstants.h"
#include "FfmpegRunner.h"
#include "TempResourceTracker.h"
#include "TimelineValidator.h"
#include "TimeUtil.h"

#include <QFileInfo>
#include <QLoggingCategory>
#include <cmath>

Q_LOGGING_CATEGORY(cfTrim, "clipforge.trim")

TrimOrchestrator::TrimOrchestrator(FfmpegRunner& runner, TempResourceTracker& tracker)
    : m_runner(runner), m_tracker(tracker) {}

TrimOrchestrator::~TrimOrchestrator() = default;

bool TrimOrchestrator::needsTrim(double trimStart, double trimEnd, double sourceDuration) {
    return std::abs(trimStart) > AppConstants::TrimTolerance
        || std::abs(trimEnd - sourceDuration) > AppConstants::TrimTolerance;
}

double TrimOrchestrator::trimmedDuration(double trimStart, double trimEnd) {
    return trimEnd - trimStart;
}

QStringList TrimOrchestrator::copySafeSuffixes() {
    return {"mp4", "mov", "m4v", "mkv", "webm", "ts"};
}

bool TrimOrchestrator::isCopySafe(const QString& suffix) {
    return copySafeSuffixes().contains(suffix.toLower());
}

QStringList TrimOrchestrator::buildTrimArgs(const Clip& clip, const QString& outputPath, bool streamCopy) {
    QStringList args;
    args << "-hide_banner"
         << "-ss" << TimeUtil::secondsToHMSms(clip.trimStart)
         << "-i" << clip.filePath
         << "-t" << TimeUtil::secondsToHMSms(trimmedDuration(clip.trimStart, clip.trimEnd));

    if (streamCopy) {
        // Cut lands on the nearest keyframe; not frame accurate
        args << "-c" << "copy"
             << "-avoid_negative_ts" << "make_zero";
    } else {
        args << "-c:v" << AppConstants::ReencodeVideoCodec
             << "-c:a" << AppConstants::ReencodeAudioCodec;
    }

    args << "-y" << outputPath;
    return args;
}

bool TrimOrchestrator::trimAll(const std::vector<Clip>& clips, std::vector<Clip>& out) {
    m_error = ExportError();

    std::vector<Clip> result;
    result.reserve(clips.size());

    for (size_t i = 0; i < clips.size(); ++i) {
        const Clip& clip = clips[i];

        if (!needsTrim(clip.trimStart, clip.trimEnd, clip.sourceDuration)) {
            result.push_back(clip);
            continue;
        }

        if (m_cancel.isCancelled()) {
            m_error = ExportError::cancelled("Export cancelled by user");
            return false;
        }

        Clip trimmed;
        if (!trimClip(clip, static_cast<int>(i), trimmed)) {
            return false;
        }
        result.push_back(trimmed);
    }

    out = std::move(result);
    return true;
}

bool TrimOrchestrator::trimClip(const Clip& clip, int index, Clip& trimmed) {
    QString suffix = QFileInfo(clip.filePath).suffix().toLower();
    if (suffix.isEmpty()) suffix = AppConstants::OutputFormat;

    const bool streamCopy = isCopySafe(suffix);
    const QString outputPath = m_tracker.allocateFile("trim", suffix);

    qCInfo(cfTrim, "Trimming %s [%.3f, %.3f) -> %s (%s)",
           qPrintable(clip.filePath), clip.trimStart, clip.trimEnd,
           qPrintable(outputPath), streamCopy ? "stream copy" : "re-encode");

    if (!m_runner.run(buildTrimArgs(clip, outputPath, streamCopy))) {
        const QString who = TimelineValidator::describeClip(clip, index);
        switch (m_runner.outcome()) {
        case FfmpegRunner::Outcome::Cancelled:
            m_error = ExportError::cancelled("Export cancelled by user");
            break;
        case FfmpegRunner::Outcome::TimedOut:
            m_error = ExportError::timeout(QString("Trimming %1 timed out").arg(who));
            break;
        default:
            m_error = ExportError::externalTool(
                QString("Failed to trim %1: %2").arg(who, m_runner.errorString()));
            break;
        }
        return false;
    }

    const double length = trimmedDuration(clip.trimStart, clip.trimEnd);
    trimmed = clip;
    trimmed.duration = length;
    trimmed.trimStart = 0.0;
    trimmed.trimEnd = length;
    trimmed.sourceDuration = length;
    trimmed.trimmedFilePath = outputPath;
    return true;
}
