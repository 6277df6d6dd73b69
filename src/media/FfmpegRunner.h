#pragma once

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <functional>
#include "CancellationToken.h"

// Runs one invocation of the external media tool in the calling thread.
// The diagnostic pipe (stderr) is read while the process runs and handed
// to the line handler one line at a time; '\r'-terminated status updates
// count as lines. The run is stopped on cancellation or when the watchdog
// timeout elapses: terminate first, kill after the grace period.
class FfmpegRunner {
public:
    enum class Outcome {
        NotRun,
        Succeeded,
        FailedToStart,
        Crashed,
        NonZeroExit,
        Cancelled,
        TimedOut
    };

    using LineHandler = std::function<void(const QString& line)>;

    explicit FfmpegRunner(const QString& program);
    ~FfmpegRunner();

    void setTimeoutMs(int ms) { m_timeoutMs = ms; }         // <= 0 disables the watchdog
    void setKillGraceMs(int ms) { m_killGraceMs = ms; }
    void setCancellationToken(const CancellationToken& token) { m_cancel = token; }

    bool run(const QStringList& args, const LineHandler& onLine = LineHandler());

    Outcome outcome() const { return m_outcome; }
    int exitCode() const { return m_exitCode; }
    QString program() const { return m_program; }

    // Last lines the tool wrote to its diagnostic pipe
    QString diagnostics() const { return m_diagnostics.join('\n'); }
    QString errorString() const { return m_error; }

    static constexpr int MaxDiagnosticLines = 50;

private:
    void consume(const QByteArray& data, const LineHandler& onLine);
    void emitLine(const QString& line, const LineHandler& onLine);

    QString m_program;
    int m_timeoutMs = 0;
    int m_killGraceMs = 5000;
    CancellationToken m_cancel;

    Outcome m_outcome = Outcome::NotRun;
    int m_exitCode = -1;
    QByteArray m_pending;
    QStringList m_diagnostics;
    QString m_error;
};
