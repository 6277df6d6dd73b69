#pragma once

#include <QString>
#include <vector>
#include <memory>
#include "Track.h"

// Groups a flat clip list into tracks keyed by trackId.
// Tracks are kept in ascending id order so iteration is deterministic.
class TimelineModel {
public:
    explicit TimelineModel(const std::vector<Clip>& clips);
    ~TimelineModel();

    void addClip(const Clip& clip);
    Track* findTrack(const QString& id);

    // Clips ordered by (trackId, startTime): the linear export order
    std::vector<Clip> orderedClips() const;

private:
    std::vector<std::unique_ptr<Track>> m_tracks;
};
