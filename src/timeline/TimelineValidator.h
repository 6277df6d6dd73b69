#pragma once

#include <QString>
#include <vector>
#include "Clip.h"

// Checks clip geometry and per-track ordering before anything is exported.
// Clips must already carry their source duration.
//
// Overlap is only checked within a track. Clips on different tracks may
// overlap in time even though export later plays the tracks back to back.
class TimelineValidator {
public:
    bool validate(const std::vector<Clip>& clips);
    QString errorString() const { return m_error; }

    // Geometry and trim window of a single clip; index is 0-based
    static bool validateClip(const Clip& clip, int index, QString* error);

    // "Clip 3 (name.mp4)"
    static QString describeClip(const Clip& clip, int index);

private:
    bool validateTrackOrder(const std::vector<Clip>& clips);

    QString m_error;
};
