#include "ConcatManifestBuilder.h"
#include "TempResourceTracker.h"
#include "TimelineModel.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cfManifest, "clipforge.manifest")

ConcatManifestBuilder::ConcatManifestBuilder(TempResourceTracker& tracker)
    : m_tracker(tracker) {}

ConcatManifestBuilder::~ConcatManifestBuilder() = default;

std::vector<Clip> ConcatManifestBuilder::orderClips(const std::vector<Clip>& clips) {
    return TimelineModel(clips).orderedClips();
}

QString ConcatManifestBuilder::manifestEntry(const QString& path) {
    QString escaped = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    escaped.replace("'", "'\\''");
    return QString("file '%1'").arg(escaped);
}

QByteArray ConcatManifestBuilder::manifestContents(const std::vector<Clip>& clips) {
    QByteArray contents;
    for (const auto& clip : orderClips(clips)) {
        contents.append(manifestEntry(clip.exportPath()).toUtf8());
        contents.append('\n');
    }
    return contents;
}

QString ConcatManifestBuilder::build(const std::vector<Clip>& clips) {
    m_error = ExportError();

    if (clips.empty()) {
        m_error = ExportError::validation("No clips to concatenate");
        return QString();
    }

    const QString path = m_tracker.allocateFile("concat", "txt");
    if (!m_tracker.createAndTrackFile(path, manifestContents(clips))) {
        m_error = ExportError::io(QString("Failed to write concat file: %1")
                                      .arg(m_tracker.errorString()));
        return QString();
    }

    qCDebug(cfManifest, "Wrote concat manifest with %d entries: %s",
            static_cast<int>(clips.size()), qPrintable(path));
    return path;
}
