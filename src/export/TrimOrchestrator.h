#pragma once

#include <QString>
#include <QStringList>
#include <vector>
#include "Clip.h"
#include "ExportError.h"
#include "CancellationToken.h"

class FfmpegRunner;
class TempResourceTracker;

// Extracts the trim window of every clip that needs one into a scratch file.
// Output paths are registered with the tracker before the tool writes them,
// so a failure part way through leaves nothing the tracker does not know about.
class TrimOrchestrator {
public:
    TrimOrchestrator(FfmpegRunner& runner, TempResourceTracker& tracker);
    ~TrimOrchestrator();

    void setCancellationToken(const CancellationToken& token) { m_cancel = token; }

    // Returns a collection of the same size and order; clips that needed a
    // trim are replaced by their trimmed counterpart.
    bool trimAll(const std::vector<Clip>& clips, std::vector<Clip>& out);

    const ExportError& error() const { return m_error; }
    QString errorString() const { return m_error.message; }

    // True unless the window covers the whole source within the tolerance
    static bool needsTrim(double trimStart, double trimEnd, double sourceDuration);
    static double trimmedDuration(double trimStart, double trimEnd);

    // Containers that can be cut without re-encoding
    static bool isCopySafe(const QString& suffix);
    static QStringList copySafeSuffixes();

    static QStringList buildTrimArgs(const Clip& clip, const QString& outputPath, bool streamCopy);

private:
    bool trimClip(const Clip& clip, int index, Clip& trimmed);

    FfmpegRunner& m_runner;
    TempResourceTracker& m_tracker;
    CancellationToken m_cancel;
    ExportError m_error;
};
