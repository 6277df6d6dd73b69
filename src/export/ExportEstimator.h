#pragma once

#include <vector>
#include "Clip.h"
#include "ExportTypes.h"

// Pre-flight heuristics. Pure functions: no file or process access.
namespace ExportEstimator {

double resolutionMultiplier(ExportResolution resolution);
double qualityMultiplier(ExportQuality quality);

// Bits per second for the settings
double bitrate(ExportResolution resolution, ExportQuality quality);

double totalDuration(const std::vector<Clip>& clips);

// Seconds: total duration * 0.1 * resolution * quality
double estimateTime(const std::vector<Clip>& clips, const ExportSettings& settings);

// Bytes: total duration * bitrate / 8
quint64 estimateSize(const std::vector<Clip>& clips, const ExportSettings& settings);

ExportEstimate estimate(const std::vector<Clip>& clips, const ExportSettings& settings);

} // namespace ExportEstimator
