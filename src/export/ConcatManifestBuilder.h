#pragma once

#include <QString>
#include <QByteArray>
#include <vector>
#include "Clip.h"
#include "ExportError.h"

class TempResourceTracker;

// Writes the file list consumed by the tool's concat demuxer:
//
//   file '/abs/path/a.mp4'
//   file '/tmp/clipforge/trim_1718000000000_0.mp4'
//
// Clips are ordered by (trackId, startTime), so every track is played back
// after the previous one. Tracks are linearized, not composited.
class ConcatManifestBuilder {
public:
    explicit ConcatManifestBuilder(TempResourceTracker& tracker);
    ~ConcatManifestBuilder();

    // Writes a tracked manifest and returns its path, or an empty string
    QString build(const std::vector<Clip>& clips);

    const ExportError& error() const { return m_error; }
    QString errorString() const { return m_error.message; }

    static std::vector<Clip> orderClips(const std::vector<Clip>& clips);
    static QByteArray manifestContents(const std::vector<Clip>& clips);

    // file '<path>' with embedded quotes written as '\''
    static QString manifestEntry(const QString& path);

private:
    TempResourceTracker& m_tracker;
    ExportError m_error;
};
