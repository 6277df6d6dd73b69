#include "FfmpegRunner.h"

#include <QElapsedTimer>
#include <QLoggingCategory>
#include <QProcess>

Q_LOGGING_CATEGORY(cfFfmpeg, "clipforge.ffmpeg")

namespace {

constexpr int StartTimeoutMs = 5000;
constexpr int PollIntervalMs = 100;

void stopProcess(QProcess& proc, int graceMs) {
    proc.terminate();
    if (!proc.waitForFinished(graceMs)) {
        qCWarning(cfFfmpeg, "Process ignored terminate, killing pid %lld",
                  static_cast<long long>(proc.processId()));
        proc.kill();
        proc.waitForFinished(graceMs);
    }
}

} // anonymous namespace

FfmpegRunner::FfmpegRunner(const QString& program) : m_program(program) {}

FfmpegRunner::~FfmpegRunner() = default;

bool FfmpegRunner::run(const QStringList& args, const LineHandler& onLine) {
    m_outcome = Outcome::NotRun;
    m_exitCode = -1;
    m_pending.clear();
    m_diagnostics.clear();
    m_error.clear();

    if (m_cancel.isCancelled()) {
        m_outcome = Outcome::Cancelled;
        m_error = "Cancelled before start";
        return false;
    }

    QProcess proc;
    proc.setProgram(m_program);
    proc.setArguments(args);
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.setStandardInputFile(QProcess::nullDevice());
    proc.setStandardOutputFile(QProcess::nullDevice());

    qCDebug(cfFfmpeg, "%s %s", qPrintable(m_program), qPrintable(args.join(' ')));
    proc.start();

    if (!proc.waitForStarted(StartTimeoutMs)) {
        m_outcome = Outcome::FailedToStart;
        m_error = QString("Failed to execute %1: %2").arg(m_program, proc.errorString());
        qCWarning(cfFfmpeg, "%s", qPrintable(m_error));
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    while (proc.state() != QProcess::NotRunning) {
        if (m_cancel.isCancelled()) {
            stopProcess(proc, m_killGraceMs);
            consume(proc.readAllStandardError(), onLine);
            m_outcome = Outcome::Cancelled;
            m_error = QString("%1 was cancelled").arg(m_program);
            qCInfo(cfFfmpeg, "%s", qPrintable(m_error));
            return false;
        }
        if (m_timeoutMs > 0 && timer.elapsed() > m_timeoutMs) {
            stopProcess(proc, m_killGraceMs);
            consume(proc.readAllStandardError(), onLine);
            m_outcome = Outcome::TimedOut;
            m_error = QString("%1 timed out after %2 ms").arg(m_program).arg(m_timeoutMs);
            qCWarning(cfFfmpeg, "%s", qPrintable(m_error));
            return false;
        }

        proc.waitForReadyRead(PollIntervalMs);
        consume(proc.readAllStandardError(), onLine);
    }

    consume(proc.readAllStandardError(), onLine);
    if (!m_pending.isEmpty()) {
        emitLine(QString::fromUtf8(m_pending), onLine);
        m_pending.clear();
    }

    if (proc.exitStatus() == QProcess::CrashExit) {
        m_outcome = Outcome::Crashed;
        m_error = QString("%1 crashed: %2").arg(m_program, diagnostics());
        qCWarning(cfFfmpeg, "%s crashed", qPrintable(m_program));
        return false;
    }

    m_exitCode = proc.exitCode();
    if (m_exitCode != 0) {
        m_outcome = Outcome::NonZeroExit;
        m_error = QString("%1 exited with code %2: %3")
                      .arg(m_program).arg(m_exitCode).arg(diagnostics());
        qCWarning(cfFfmpeg, "%s exited with code %d", qPrintable(m_program), m_exitCode);
        return false;
    }

    m_outcome = Outcome::Succeeded;
    return true;
}

void FfmpegRunner::consume(const QByteArray& data, const LineHandler& onLine) {
    if (data.isEmpty()) return;
    m_pending.append(data);

    int start = 0;
    for (int i = 0; i < m_pending.size(); ++i) {
        const char c = m_pending.at(i);
        if (c == '\n' || c == '\r') {
            if (i > start) {
                emitLine(QString::fromUtf8(m_pending.constData() + start, i - start), onLine);
            }
            start = i + 1;
        }
    }
    m_pending.remove(0, start);
}

void FfmpegRunner::emitLine(const QString& line, const LineHandler& onLine) {
    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty()) return;

    m_diagnostics.append(trimmed);
    while (m_diagnostics.size() > MaxDiagnosticLines) {
        m_diagnostics.removeFirst();
    }
    if (onLine) onLine(trimmed);
}
