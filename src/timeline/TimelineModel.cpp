#include "TimelineModel.h"
#include <algorithm>

TimelineModel::TimelineModel(const std::vector<Clip>& clips) {
    for (const auto& c : clips) {
        addClip(c);
    }
}

TimelineModel::~TimelineModel() = default;

void TimelineModel::addClip(const Clip& clip) {
    Track* t = findTrack(clip.trackId);
    if (!t) {
        // Insert keeping ascending id order
        auto pos = std::lower_bound(m_tracks.begin(), m_tracks.end(), clip.trackId,
            [](const std::unique_ptr<Track>& track, const QString& id) {
                return track->id() < id;
            });
        pos = m_tracks.insert(pos, std::make_unique<Track>(clip.trackId));
        t = pos->get();
    }
    t->addClip(clip);
}

Track* TimelineModel::findTrack(const QString& id) {
    for (auto& t : m_tracks) {
        if (t->id() == id) return t.get();
    }
    return nullptr;
}

std::vector<Clip> TimelineModel::orderedClips() const {
    std::vector<Clip> result;
    for (const auto& t : m_tracks) {
        std::vector<Clip> lane = t->clips();
        std::stable_sort(lane.begin(), lane.end(), [](const Clip& a, const Clip& b) {
            return a.startTime < b.startTime;
        });
        result.insert(result.end(), lane.begin(), lane.end());
    }
    return result;
}
