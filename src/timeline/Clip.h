#pragma once

#include <QString>

struct Clip {
    QString filePath;          // externally owned source media
    double startTime = 0.0;    // position on timeline (seconds)
    double duration = 0.0;     // length on timeline
    double trimStart = 0.0;    // in point in source
    double trimEnd = 0.0;      // out point in source
    QString trackId;
    double sourceDuration = 0.0;  // true source length, <= 0 when not yet probed

    // Scratch artifact produced by the trim stage, empty until then
    QString trimmedFilePath;

    double endTime() const { return startTime + duration; }
    double trimmedLength() const { return trimEnd - trimStart; }
    bool hasSourceDuration() const { return sourceDuration > 0.0; }
    bool isTrimmed() const { return !trimmedFilePath.isEmpty(); }

    // File the concat stage should read
    const QString& exportPath() const { return isTrimmed() ? trimmedFilePath : filePath; }
};
