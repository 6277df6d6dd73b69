#pragma once

#include <QObject>
#include <QThread>
#include <QMutex>
#include <QMap>
#include <QDateTime>
#include <climits>
#include <memory>
#include <optional>
#include "ExportConfig.h"
#include "ExportTypes.h"
#include "CancellationToken.h"

class SourceDurationOracle;

struct ExportJobStatus {
    QString id;
    ExportStep step = ExportStep::Idle;
    double progress = 0.0;
    QString outputPath;
    QString errorMessage;
    QDateTime createdAt;    // UTC
};

// Worker thread for a single export attempt. The executor lives inside run()
// so its events are emitted from this thread.
class ExportThread : public QThread {
    Q_OBJECT
public:
    ExportThread(const ExportConfig& config, SourceDurationOracle* oracle,
                 const ExportRequest& request, const CancellationToken& token,
                 QObject* parent = nullptr);

    const ExportResult& result() const { return m_result; }

signals:
    void progressChanged(const ExportProgress& progress);
    void exportFinished(const ExportResult& result);

protected:
    void run() override;

private:
    ExportConfig m_config;
    SourceDurationOracle* m_oracle;
    ExportRequest m_request;
    CancellationToken m_cancel;
    ExportResult m_result;
};

// Job registry for export attempts. Each startExport() runs on its own
// ExportThread; status is kept per job id until removeJob() or until the
// service is destroyed.
// The destructor cancels outstanding jobs and joins their threads.
class ExportService : public QObject {
    Q_OBJECT
public:
    // A null oracle makes the service probe sources with libavformat
    explicit ExportService(const ExportConfig& config, SourceDurationOracle* oracle = nullptr,
                           QObject* parent = nullptr);
    ~ExportService();

    QString startExport(const ExportRequest& request);

    // False for unknown jobs and jobs that already reached a terminal step
    bool cancel(const QString& jobId);

    std::optional<ExportJobStatus> status(const QString& jobId) const;
    std::optional<ExportResult> result(const QString& jobId) const;
    QStringList jobIds() const;

    // Blocks until the job's thread has finished; false for unknown ids or on timeout
    bool waitForFinished(const QString& jobId, unsigned long timeoutMs = ULONG_MAX);

    // Drops a finished job, its status and its thread. False for unknown
    // ids and for jobs that have not produced a result yet.
    bool removeJob(const QString& jobId);

    const ExportConfig& config() const { return m_config; }

signals:
    void progress(const QString& jobId, const ExportProgress& progress);
    void finished(const QString& jobId, const ExportResult& result);

private:
    struct Job {
        ExportJobStatus status;
        CancellationToken token;
        std::unique_ptr<ExportThread> thread;
        std::optional<ExportResult> result;
    };

    void onProgress(const QString& jobId, const ExportProgress& p);
    void onFinished(const QString& jobId, const ExportResult& r);

    ExportConfig m_config;
    SourceDurationOracle* m_oracle;
    std::unique_ptr<SourceDurationOracle> m_ownedOracle;

    mutable QMutex m_mutex;
    QMap<QString, std::shared_ptr<Job>> m_jobs;
};
