#pragma once

#include <QString>
#include <QByteArray>
#include <QStringList>

// Owns every scratch file and directory created during one export attempt.
// Nothing else may delete a tracked path. cleanupAll() is best-effort and
// idempotent; the destructor runs it as a last resort.
class TempResourceTracker {
public:
    explicit TempResourceTracker(const QString& scratchDir);
    ~TempResourceTracker();

    TempResourceTracker(const TempResourceTracker&) = delete;
    TempResourceTracker& operator=(const TempResourceTracker&) = delete;

    void addFile(const QString& path);
    void addDirectory(const QString& path);

    // Reserves a unique path inside the scratch dir and registers it before
    // anything is written there. "prefix_<timestamp>_<n>.<suffix>"
    QString allocateFile(const QString& prefix, const QString& suffix);

    // Registers then writes. On failure the path stays tracked so cleanup
    // removes any partial write.
    bool createAndTrackFile(const QString& path, const QByteArray& contents);
    bool createAndTrackDirectory(const QString& path);

    // Files first, then directories innermost-first. Returns the number of
    // deletion failures, which are logged but never abort the sweep.
    int cleanupAll();

    QString scratchDir() const { return m_scratchDir; }
    const QStringList& files() const { return m_files; }
    const QStringList& directories() const { return m_directories; }
    bool isEmpty() const { return m_files.isEmpty() && m_directories.isEmpty(); }

    QString errorString() const { return m_error; }

    // "<prefix>_<utc millis>_<counter>" unique within the process
    static QString uniqueName(const QString& prefix);

private:
    QString m_scratchDir;
    QStringList m_files;
    QStringList m_directories;
    QString m_error;
};
