#include "ExportExecutor.h"
#include "ConcatManifestBuilder.h"
#include "ExportEstimator.h"
#include "ExportPaths.h"
#include "FfmpegRunner.h"
#include "ProgressParser.h"
#include "SourceDurationOracle.h"
#include "TempResourceTracker.h"
#include "TimelineValidator.h"
#include "TrimOrchestrator.h"

#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cfExport, "clipforge.export")

namespace {
const char* CancelledMessage = "Export cancelled by user";
}

ExportExecutor::ExportExecutor(const ExportConfig& config, SourceDurationOracle* oracle,
                               QObject* parent)
    : QObject(parent), m_config(config), m_oracle(oracle) {}

ExportExecutor::~ExportExecutor() = default;

QStringList ExportExecutor::buildConcatArgs(const QString& manifestPath, const QString& outputPath) {
    QStringList args;
    args << "-hide_banner"
         << "-f" << "concat"
         << "-safe" << "0"
         << "-i" << manifestPath
         << "-c" << "copy"
         << "-y" << outputPath;
    return args;
}

ExportResult ExportExecutor::run(const ExportRequest& request) {
    return run(request.clips,
               ExportPaths::buildOutputPath(request.outputDir, request.filename),
               request.settings);
}

ExportResult ExportExecutor::run(const std::vector<Clip>& clips, const QString& outputPath,
                                 const ExportSettings& settings) {
    setState(ExportStep::Idle);

    // Nothing below may spawn a process or create a file until validation passes
    ExportError error;
    std::vector<Clip> working = clips;
    if (!checkPreconditions(working, outputPath, settings, error)) {
        return fail(error);
    }
    if (!resolveSourceDurations(working, error)) {
        return fail(error);
    }

    TimelineValidator validator;
    if (!validator.validate(working)) {
        return fail(ExportError::validation(validator.errorString()));
    }

    if (m_cancel.isCancelled()) {
        return fail(ExportError::cancelled(CancelledMessage));
    }

    QString scratchError;
    if (!m_config.ensureScratchDir(&scratchError)) {
        return fail(ExportError::io(scratchError));
    }

    qCInfo(cfExport, "Exporting %d clips to %s", static_cast<int>(working.size()),
           qPrintable(outputPath));
    setState(ExportStep::Preparing);
    emitStep(ExportStep::Preparing, 0.0);

    const bool outputExisted = QFileInfo::exists(outputPath);

    TempResourceTracker tracker(m_config.scratchDir);
    FfmpegRunner runner(m_config.ffmpegPath);
    runner.setTimeoutMs(m_config.toolTimeoutMs);
    runner.setKillGraceMs(m_config.killGraceMs);
    runner.setCancellationToken(m_cancel);

    ExportResult result = runPipeline(working, outputPath, runner, tracker);

    const int failures = tracker.cleanupAll();
    if (failures > 0) {
        qCWarning(cfExport, "%d temp resources could not be removed", failures);
    }

    if (!result.success && !outputExisted && QFileInfo::exists(outputPath)) {
        if (!QFile::remove(outputPath)) {
            qCWarning(cfExport, "Failed to remove partial output: %s", qPrintable(outputPath));
        }
    }
    return result;
}

ExportResult ExportExecutor::runPipeline(const std::vector<Clip>& clips, const QString& outputPath,
                                         FfmpegRunner& runner, TempResourceTracker& tracker) {
    TrimOrchestrator trimmer(runner, tracker);
    trimmer.setCancellationToken(m_cancel);

    std::vector<Clip> trimmed;
    if (!trimmer.trimAll(clips, trimmed)) {
        return fail(trimmer.error());
    }
    if (m_cancel.isCancelled()) {
        return fail(ExportError::cancelled(CancelledMessage));
    }

    ConcatManifestBuilder builder(tracker);
    const QString manifestPath = builder.build(trimmed);
    if (manifestPath.isEmpty()) {
        return fail(builder.error());
    }
    if (m_cancel.isCancelled()) {
        return fail(ExportError::cancelled(CancelledMessage));
    }

    const double totalDuration = ExportEstimator::totalDuration(trimmed);
    setState(ExportStep::Exporting);
    emitStep(ExportStep::Exporting, 0.0);

    auto onLine = [this, totalDuration](const QString& line) {
        auto update = ProgressParser::parseLine(line, totalDuration);
        if (update) {
            emit progressChanged(*update);
        }
    };

    if (!runner.run(buildConcatArgs(manifestPath, outputPath), onLine)) {
        switch (runner.outcome()) {
        case FfmpegRunner::Outcome::Cancelled:
            return fail(ExportError::cancelled(CancelledMessage));
        case FfmpegRunner::Outcome::TimedOut:
            return fail(ExportError::timeout(QString("FFmpeg export timed out after %1 ms")
                                                 .arg(m_config.toolTimeoutMs)));
        default:
            return fail(ExportError::externalTool(
                QString("FFmpeg export failed: %1").arg(runner.errorString())));
        }
    }

    if (!QFileInfo::exists(outputPath)) {
        return fail(ExportError::io(QString("FFmpeg finished but wrote no output: %1").arg(outputPath)));
    }

    setState(ExportStep::Completed);
    emitStep(ExportStep::Completed, 100.0);
    qCInfo(cfExport, "Export completed: %s", qPrintable(outputPath));
    return ExportResult::succeeded(outputPath);
}

bool ExportExecutor::checkPreconditions(const std::vector<Clip>& clips, const QString& outputPath,
                                        const ExportSettings& settings, ExportError& error) {
    QString message;
    if (!settings.validate(&message)) {
        error = ExportError::validation(message);
        return false;
    }
    if (clips.empty()) {
        error = ExportError::validation("No clips to export");
        return false;
    }

    QFileInfo out(outputPath);
    if (outputPath.isEmpty() || out.fileName().isEmpty()) {
        error = ExportError::validation("Invalid output path");
        return false;
    }
    QFileInfo dir(out.absolutePath());
    if (!dir.exists() || !dir.isDir()) {
        error = ExportError::validation("Output directory does not exist");
        return false;
    }
    return true;
}

bool ExportExecutor::resolveSourceDurations(std::vector<Clip>& clips, ExportError& error) {
    for (size_t i = 0; i < clips.size(); ++i) {
        Clip& clip = clips[i];
        if (clip.hasSourceDuration() || clip.filePath.isEmpty()) continue;

        const QString who = TimelineValidator::describeClip(clip, static_cast<int>(i));
        if (!m_oracle) {
            error = ExportError::validation(QString("%1 has unknown source duration").arg(who));
            return false;
        }

        double seconds = 0.0;
        QString probeError;
        if (!m_oracle->sourceDuration(clip.filePath, seconds, &probeError)) {
            error = ExportError::validation(QString("Cannot determine source duration of %1: %2")
                                                .arg(who, probeError));
            return false;
        }
        clip.sourceDuration = seconds;
    }
    return true;
}

ExportResult ExportExecutor::fail(const ExportError& error) {
    const bool cancelled = error.kind == ExportError::Kind::Cancelled;
    setState(cancelled ? ExportStep::Cancelled : ExportStep::Failed);

    if (cancelled) {
        qCInfo(cfExport, "%s", qPrintable(error.message));
    } else {
        qCWarning(cfExport, "Export failed (%s): %s",
                  qPrintable(ExportError::kindName(error.kind)), qPrintable(error.message));
    }

    ExportProgress p;
    p.currentStep = m_state;
    p.error = error.message;
    emit progressChanged(p);

    return ExportResult::failed(error);
}

void ExportExecutor::emitStep(ExportStep step, double progress) {
    ExportProgress p;
    p.currentStep = step;
    p.progress = progress;
    emit progressChanged(p);
}

void ExportExecutor::setState(ExportStep step) {
    if (m_state != step) {
        qCDebug(cfExport, "State %s -> %s", qPrintable(exportStepName(m_state)),
                qPrintable(exportStepName(step)));
        m_state = step;
    }
}
