#pragma once

#include <QString>
#include <QHash>
#include <QMutex>

// Answers "how long is this source file". Injected into the export
// pipeline so tests and hosts can supply durations they already know.
class SourceDurationOracle {
public:
    virtual ~SourceDurationOracle() = default;

    // Returns false and fills error when the duration cannot be determined
    virtual bool sourceDuration(const QString& filePath, double& seconds, QString* error) = 0;
};

// Probes with libavformat; results are cached per path.
class ProbeDurationOracle : public SourceDurationOracle {
public:
    bool sourceDuration(const QString& filePath, double& seconds, QString* error) override;

private:
    QMutex m_mutex;
    QHash<QString, double> m_cache;
};
