#include "ExportPaths.h"
#include "AppConstants.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cfPaths, "clipforge.paths")

namespace ExportPaths {

QString buildOutputPath(const QString& outputDir, const QString& filename) {
    const QString ext = QString(".") + AppConstants::OutputFormat;
    QString name = filename;
    if (!name.endsWith(ext, Qt::CaseInsensitive)) {
        name += ext;
    }
    return QDir(outputDir).filePath(name);
}

QStringList validateOutputPath(const QString& outputPath) {
    QStringList errors;
    QFileInfo fi(outputPath);

    if (outputPath.isEmpty() || fi.fileName().isEmpty()) {
        errors << "No filename provided";
        return errors;
    }

    QFileInfo parent(fi.absolutePath());
    if (!parent.exists()) {
        errors << "Output directory does not exist";
    } else if (!parent.isDir()) {
        errors << "Output path is not a directory";
    }

    if (fi.exists()) {
        errors << "Output file already exists";
    }

    const QString name = fi.fileName();
    if (name.contains('\\')) {
        errors << "Filename cannot contain path separators";
    }
    return errors;
}

int cleanupStaleScratchFiles(const QString& scratchDir, qint64 minAgeMs) {
    QDir dir(scratchDir);
    if (!dir.exists()) return 0;

    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addMSecs(-minAgeMs);
    int removed = 0;
    const QFileInfoList candidates = dir.entryInfoList({"concat_*.txt", "trim_*"}, QDir::Files);
    for (const QFileInfo& fi : candidates) {
        if (fi.lastModified().toUTC() > cutoff) {
            qCDebug(cfPaths, "Keeping recent scratch file: %s", qPrintable(fi.fileName()));
            continue;
        }
        if (QFile::remove(fi.filePath())) {
            ++removed;
        } else {
            qCWarning(cfPaths, "Failed to delete stale temp file: %s", qPrintable(fi.filePath()));
        }
    }
    if (removed > 0) {
        qCInfo(cfPaths, "Removed %d stale temp files from %s", removed, qPrintable(scratchDir));
    }
    return removed;
}

qint64 staleScratchAge(int toolTimeoutMs) {
    return qMax(AppConstants::StaleScratchAgeMs, 2LL * toolTimeoutMs);
}

} // namespace ExportPaths
