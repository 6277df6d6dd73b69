#pragma once

#include <QString>

struct MediaInfo {
    QString filePath;
    QString containerFormat;   // short demuxer name, e.g. "mov,mp4,m4a,3gp,3g2,mj2"
    double duration = 0.0;     // seconds
    bool hasVideo = false;
    bool hasAudio = false;
    QString videoCodec;
    QString audioCodec;
};

// Reads container-level facts with libavformat. No decoding.
class MediaProbe {
public:
    MediaProbe();
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};
