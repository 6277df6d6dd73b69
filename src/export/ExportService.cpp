#include "ExportService.h"
#include "ExportExecutor.h"
#include "SourceDurationOracle.h"

#include <QLoggingCategory>
#include <QMutexLocker>
#include <QUuid>

Q_LOGGING_CATEGORY(cfService, "clipforge.service")

// --- ExportThread ---

ExportThread::ExportThread(const ExportConfig& config, SourceDurationOracle* oracle,
                           const ExportRequest& request, const CancellationToken& token,
                           QObject* parent)
    : QThread(parent), m_config(config), m_oracle(oracle), m_request(request), m_cancel(token) {}

void ExportThread::run() {
    ExportExecutor executor(m_config, m_oracle);
    executor.setCancellationToken(m_cancel);
    connect(&executor, &ExportExecutor::progressChanged,
            this, &ExportThread::progressChanged, Qt::DirectConnection);

    m_result = executor.run(m_request);
    emit exportFinished(m_result);
}

// --- ExportService ---

ExportService::ExportService(const ExportConfig& config, SourceDurationOracle* oracle,
                             QObject* parent)
    : QObject(parent), m_config(config), m_oracle(oracle)
{
    qRegisterMetaType<ExportProgress>();
    qRegisterMetaType<ExportResult>();

    if (!m_oracle) {
        m_ownedOracle = std::make_unique<ProbeDurationOracle>();
        m_oracle = m_ownedOracle.get();
    }
}

ExportService::~ExportService() {
    QList<std::shared_ptr<Job>> jobs;
    {
        QMutexLocker lock(&m_mutex);
        jobs = m_jobs.values();
    }
    for (const auto& job : jobs) {
        job->token.cancel();
    }
    for (const auto& job : jobs) {
        if (job->thread) {
            job->thread->wait();
        }
    }
}

QString ExportService::startExport(const ExportRequest& request) {
    const QString jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);

    auto job = std::make_shared<Job>();
    job->status.id = jobId;
    job->status.step = ExportStep::Idle;
    job->status.createdAt = QDateTime::currentDateTimeUtc();
    job->thread = std::make_unique<ExportThread>(m_config, m_oracle, request, job->token);

    connect(job->thread.get(), &ExportThread::progressChanged, this,
            [this, jobId](const ExportProgress& p) { onProgress(jobId, p); },
            Qt::DirectConnection);
    connect(job->thread.get(), &ExportThread::exportFinished, this,
            [this, jobId](const ExportResult& r) { onFinished(jobId, r); },
            Qt::DirectConnection);

    {
        QMutexLocker lock(&m_mutex);
        m_jobs.insert(jobId, job);
    }

    qCInfo(cfService, "Starting export job %s (%d clips)", qPrintable(jobId),
           static_cast<int>(request.clips.size()));
    job->thread->start();
    return jobId;
}

bool ExportService::cancel(const QString& jobId) {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return false;

    const auto& job = it.value();
    switch (job->status.step) {
    case ExportStep::Completed:
    case ExportStep::Failed:
    case ExportStep::Cancelled:
        return false;
    default:
        break;
    }
    if (job->result) return false;

    job->token.cancel();
    qCInfo(cfService, "Cancellation requested for job %s", qPrintable(jobId));
    return true;
}

std::optional<ExportJobStatus> ExportService::status(const QString& jobId) const {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.constFind(jobId);
    if (it == m_jobs.constEnd()) return std::nullopt;
    return it.value()->status;
}

std::optional<ExportResult> ExportService::result(const QString& jobId) const {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.constFind(jobId);
    if (it == m_jobs.constEnd()) return std::nullopt;
    return it.value()->result;
}

QStringList ExportService::jobIds() const {
    QMutexLocker lock(&m_mutex);
    return m_jobs.keys();
}

bool ExportService::waitForFinished(const QString& jobId, unsigned long timeoutMs) {
    std::shared_ptr<Job> job;
    {
        QMutexLocker lock(&m_mutex);
        job = m_jobs.value(jobId);
    }
    if (!job || !job->thread) return false;
    return job->thread->wait(timeoutMs);
}

bool ExportService::removeJob(const QString& jobId) {
    std::shared_ptr<Job> job;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_jobs.find(jobId);
        if (it == m_jobs.end() || !it.value()->result) return false;
        job = it.value();
        m_jobs.erase(it);
    }
    // The result is set just before run() returns
    if (job->thread) {
        job->thread->wait();
    }
    qCDebug(cfService, "Removed job %s", qPrintable(jobId));
    return true;
}

void ExportService::onProgress(const QString& jobId, const ExportProgress& p) {
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_jobs.find(jobId);
        if (it == m_jobs.end()) return;

        ExportJobStatus& s = it.value()->status;
        s.step = p.currentStep;
        s.progress = p.progress;
        if (p.error) {
            s.errorMessage = *p.error;
        }
    }
    emit progress(jobId, p);
}

void ExportService::onFinished(const QString& jobId, const ExportResult& r) {
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_jobs.find(jobId);
        if (it == m_jobs.end()) return;

        Job& job = *it.value();
        job.result = r;
        if (r.success) {
            job.status.step = ExportStep::Completed;
            job.status.progress = 100.0;
            job.status.outputPath = r.outputPath.value_or(QString());
        } else {
            job.status.step = r.errorKind == ExportError::Kind::Cancelled
                ? ExportStep::Cancelled : ExportStep::Failed;
            job.status.errorMessage = r.errorMessage.value_or(QString());
        }
    }

    if (r.success) {
        qCInfo(cfService, "Job %s completed: %s", qPrintable(jobId),
               qPrintable(r.outputPath.value_or(QString())));
    } else {
        qCInfo(cfService, "Job %s ended (%s): %s", qPrintable(jobId),
               qPrintable(ExportError::kindName(r.errorKind)),
               qPrintable(r.errorMessage.value_or(QString())));
    }
    emit finished(jobId, r);
}
