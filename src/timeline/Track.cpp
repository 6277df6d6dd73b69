#include "Track.h"

Track::Track(const QString& id) : m_id(id) {}

Track::~Track() = default;

void Track::addClip(const Clip& clip) {
    m_clips.push_back(clip);
}
