#include "SourceDurationOracle.h"
#include "MediaProbe.h"

bool ProbeDurationOracle::sourceDuration(const QString& filePath, double& seconds, QString* error) {
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_cache.constFind(filePath);
        if (it != m_cache.constEnd()) {
            seconds = it.value();
            return true;
        }
    }

    MediaProbe probe;
    if (!probe.probe(filePath)) {
        if (error) *error = probe.errorString();
        return false;
    }

    seconds = probe.info().duration;
    QMutexLocker lock(&m_mutex);
    m_cache.insert(filePath, seconds);
    return true;
}
