#include "ExportEstimator.h"

namespace ExportEstimator {

namespace {
// Simple concatenation runs at roughly a tenth of real time
constexpr double BaseTimeFactor = 0.1;
}

double resolutionMultiplier(ExportResolution resolution) {
    switch (resolution) {
    case ExportResolution::P1080:  return 1.2;
    case ExportResolution::P720:   return 0.8;
    case ExportResolution::Source: return 1.0;
    }
    return 1.0;
}

double qualityMultiplier(ExportQuality quality) {
    switch (quality) {
    case ExportQuality::High:   return 1.5;
    case ExportQuality::Medium: return 1.0;
    case ExportQuality::Low:    return 0.7;
    }
    return 1.0;
}

double bitrate(ExportResolution resolution, ExportQuality quality) {
    double base = 5000000.0;
    switch (resolution) {
    case ExportResolution::P1080:  base = 8000000.0; break;
    case ExportResolution::P720:   base = 3000000.0; break;
    case ExportResolution::Source: base = 5000000.0; break;
    }
    return base * qualityMultiplier(quality);
}

double totalDuration(const std::vector<Clip>& clips) {
    double total = 0.0;
    for (const auto& c : clips) {
        total += c.duration;
    }
    return total;
}

double estimateTime(const std::vector<Clip>& clips, const ExportSettings& settings) {
    return totalDuration(clips) * BaseTimeFactor
         * resolutionMultiplier(settings.resolution)
         * qualityMultiplier(settings.quality);
}

quint64 estimateSize(const std::vector<Clip>& clips, const ExportSettings& settings) {
    const double bytes = totalDuration(clips) * bitrate(settings.resolution, settings.quality) / 8.0;
    return bytes > 0.0 ? static_cast<quint64>(bytes) : 0;
}

ExportEstimate estimate(const std::vector<Clip>& clips, const ExportSettings& settings) {
    ExportEstimate e;
    e.estimatedTimeSeconds = estimateTime(clips, settings);
    e.estimatedFileSizeBytes = estimateSize(clips, settings);
    e.totalDurationSeconds = totalDuration(clips);
    e.clipCount = static_cast<int>(clips.size());
    return e;
}

} // namespace ExportEstimator
