#pragma once

#include <QObject>
#include <QString>
#include <vector>
#include "Clip.h"
#include "ExportConfig.h"
#include "ExportTypes.h"
#include "CancellationToken.h"

class FfmpegRunner;
class SourceDurationOracle;
class TempResourceTracker;

// Drives one export attempt end to end:
//   validate -> trim -> concat manifest -> concat with stream copy -> cleanup
//
// Runs synchronously in the calling thread and always returns a result;
// scratch artifacts are removed on every path. Progress goes out through
// progressChanged: one Preparing event, optional Exporting ticks, then
// exactly one of Completed, Failed or Cancelled. A request rejected before
// any side effect (preconditions, source durations, timeline validation)
// emits only the terminal Failed event; Preparing marks the start of work.
class ExportExecutor : public QObject {
    Q_OBJECT
public:
    // The oracle fills in source durations the clips do not carry; it may
    // be null when every clip already has one.
    ExportExecutor(const ExportConfig& config, SourceDurationOracle* oracle,
                   QObject* parent = nullptr);
    ~ExportExecutor();

    void setCancellationToken(const CancellationToken& token) { m_cancel = token; }

    ExportResult run(const std::vector<Clip>& clips, const QString& outputPath,
                     const ExportSettings& settings);
    ExportResult run(const ExportRequest& request);

    ExportStep state() const { return m_state; }

    static QStringList buildConcatArgs(const QString& manifestPath, const QString& outputPath);

signals:
    void progressChanged(const ExportProgress& progress);

private:
    bool checkPreconditions(const std::vector<Clip>& clips, const QString& outputPath,
                            const ExportSettings& settings, ExportError& error);
    bool resolveSourceDurations(std::vector<Clip>& clips, ExportError& error);
    ExportResult runPipeline(const std::vector<Clip>& clips, const QString& outputPath,
                             FfmpegRunner& runner, TempResourceTracker& tracker);
    ExportResult fail(const ExportError& error);
    void emitStep(ExportStep step, double progress);
    void setState(ExportStep step);

    ExportConfig m_config;
    SourceDurationOracle* m_oracle;
    CancellationToken m_cancel;
    ExportStep m_state = ExportStep::Idle;
};
