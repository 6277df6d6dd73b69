#include "TempResourceTracker.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <atomic>

Q_LOGGING_CATEGORY(cfTempTracker, "clipforge.temp")

namespace {
std::atomic<quint64> s_nameCounter{0};
}

TempResourceTracker::TempResourceTracker(const QString& scratchDir)
    : m_scratchDir(scratchDir) {}

TempResourceTracker::~TempResourceTracker() {
    if (!isEmpty()) {
        qCWarning(cfTempTracker, "Tracker destroyed with %lld live resources, cleaning up",
                  static_cast<long long>(m_files.size() + m_directories.size()));
        cleanupAll();
    }
}

void TempResourceTracker::addFile(const QString& path) {
    if (!m_files.contains(path)) {
        m_files.append(path);
    }
}

void TempResourceTracker::addDirectory(const QString& path) {
    if (!m_directories.contains(path)) {
        m_directories.append(path);
    }
}

QString TempResourceTracker::uniqueName(const QString& prefix) {
    const qint64 millis = QDateTime::currentMSecsSinceEpoch();
    const quint64 n = s_nameCounter.fetch_add(1);
    return QString("%1_%2_%3").arg(prefix).arg(millis).arg(n);
}

QString TempResourceTracker::allocateFile(const QString& prefix, const QString& suffix) {
    QString name = uniqueName(prefix);
    if (!suffix.isEmpty()) {
        name += '.' + suffix;
    }
    const QString path = QDir(m_scratchDir).filePath(name);
    addFile(path);
    return path;
}

bool TempResourceTracker::createAndTrackFile(const QString& path, const QByteArray& contents) {
    addFile(path);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1 (%2)").arg(path, file.errorString());
        return false;
    }
    if (file.write(contents) != contents.size()) {
        m_error = QString("Short write to: %1 (%2)").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        m_error = QString("Cannot commit: %1 (%2)").arg(path, file.errorString());
        return false;
    }
    return true;
}

bool TempResourceTracker::createAndTrackDirectory(const QString& path) {
    addDirectory(path);
    if (!QDir().mkpath(path)) {
        m_error = QString("Cannot create directory: %1").arg(path);
        return false;
    }
    return true;
}

int TempResourceTracker::cleanupAll() {
    int failures = 0;

    for (const QString& path : m_files) {
        QFileInfo fi(path);
        if (!fi.exists() && !fi.isSymLink()) continue;
        if (!QFile::remove(path)) {
            qCWarning(cfTempTracker, "Failed to delete temp file: %s", qPrintable(path));
            ++failures;
        } else {
            qCDebug(cfTempTracker, "Deleted temp file: %s", qPrintable(path));
        }
    }

    // Innermost first: later registrations may be nested in earlier ones
    for (auto it = m_directories.crbegin(); it != m_directories.crend(); ++it) {
        QDir dir(*it);
        if (!dir.exists()) continue;
        if (!dir.removeRecursively()) {
            qCWarning(cfTempTracker, "Failed to delete temp directory: %s", qPrintable(*it));
            ++failures;
        } else {
            qCDebug(cfTempTracker, "Deleted temp directory: %s", qPrintable(*it));
        }
    }

    m_files.clear();
    m_directories.clear();
    return failures;
}
