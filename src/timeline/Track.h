#pragma once

#include <QString>
#include <vector>
#include "Clip.h"

// A named lane of clips that must not overlap in time.
class Track {
public:
    explicit Track(const QString& id);
    ~Track();

    QString id() const { return m_id; }

    void addClip(const Clip& clip);
    const std::vector<Clip>& clips() const { return m_clips; }

private:
    QString m_id;
    std::vector<Clip> m_clips;
};
