#include "TimelineValidator.h"
#include "AppConstants.h"

#include <QFileInfo>
#include <QHash>
#include <QStringList>
#include <algorithm>

namespace {

struct IndexedClip {
    const Clip* clip;
    int index;
};

bool fail(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

// Preformatted so a '%' in a file name is never substituted by a later arg
QString num(double value) {
    return QString::number(value);
}

} // anonymous namespace

QString TimelineValidator::describeClip(const Clip& clip, int index) {
    return QString("Clip %1 (%2)").arg(QString::number(index + 1), QFileInfo(clip.filePath).fileName());
}

bool TimelineValidator::validateClip(const Clip& clip, int index, QString* error) {
    const QString who = describeClip(clip, index);

    if (clip.filePath.isEmpty()) {
        return fail(error, QString("Clip %1 has empty file path").arg(index + 1));
    }
    if (clip.startTime < 0.0) {
        return fail(error, QString("%1 has negative start time: %2").arg(who, num(clip.startTime)));
    }
    if (clip.duration <= 0.0) {
        return fail(error, QString("%1 has invalid duration: %2").arg(who, num(clip.duration)));
    }
    if (clip.trackId.isEmpty()) {
        return fail(error, QString("%1 has no track id").arg(who));
    }

    if (clip.trimStart < 0.0) {
        return fail(error, QString("%1 has negative trim start: %2").arg(who, num(clip.trimStart)));
    }
    if (clip.trimEnd <= clip.trimStart) {
        return fail(error, QString("%1 has invalid trim range: %2 to %3")
                               .arg(who, num(clip.trimStart), num(clip.trimEnd)));
    }
    if (clip.trimmedLength() + AppConstants::TrimLengthEpsilon < AppConstants::MinTrimLength) {
        return fail(error, QString("%1 trim range is shorter than %2 s: %3 to %4")
                               .arg(who, num(AppConstants::MinTrimLength),
                                    num(clip.trimStart), num(clip.trimEnd)));
    }
    if (!clip.hasSourceDuration()) {
        return fail(error, QString("%1 has unknown source duration").arg(who));
    }
    if (clip.trimEnd > clip.sourceDuration + AppConstants::TrimTolerance) {
        return fail(error, QString("%1 trim end %2 exceeds source duration %3")
                               .arg(who, num(clip.trimEnd), num(clip.sourceDuration)));
    }
    return true;
}

bool TimelineValidator::validate(const std::vector<Clip>& clips) {
    m_error.clear();

    if (clips.empty()) {
        m_error = "No clips to export";
        return false;
    }

    for (size_t i = 0; i < clips.size(); ++i) {
        if (!validateClip(clips[i], static_cast<int>(i), &m_error)) {
            return false;
        }
    }

    return validateTrackOrder(clips);
}

bool TimelineValidator::validateTrackOrder(const std::vector<Clip>& clips) {
    QHash<QString, std::vector<IndexedClip>> lanes;
    for (size_t i = 0; i < clips.size(); ++i) {
        lanes[clips[i].trackId].push_back({&clips[i], static_cast<int>(i)});
    }

    QStringList trackIds = lanes.keys();
    trackIds.sort();

    for (const QString& trackId : trackIds) {
        std::vector<IndexedClip>& lane = lanes[trackId];
        std::stable_sort(lane.begin(), lane.end(), [](const IndexedClip& a, const IndexedClip& b) {
            return a.clip->startTime < b.clip->startTime;
        });

        for (size_t i = 1; i < lane.size(); ++i) {
            const IndexedClip& prev = lane[i - 1];
            const IndexedClip& next = lane[i];

            if (next.clip->startTime < prev.clip->startTime) {
                m_error = QString("%1 on track '%2' starts before %3")
                              .arg(describeClip(*next.clip, next.index), trackId,
                                   describeClip(*prev.clip, prev.index));
                return false;
            }
            if (next.clip->startTime < prev.clip->endTime()) {
                m_error = QString("%1 on track '%2' overlaps %3: starts at %4, previous ends at %5")
                              .arg(describeClip(*next.clip, next.index), trackId,
                                   describeClip(*prev.clip, prev.index),
                                   num(next.clip->startTime), num(prev.clip->endTime()));
                return false;
            }
        }
    }
    return true;
}
