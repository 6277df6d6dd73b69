#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include "timeline/Clip.h"
#include "export/ExportEstimator.h"

static std::vector<Clip> clipsOf(double seconds) {
    Clip a;
    a.filePath = "/m/a.mp4";
    a.duration = seconds / 2.0;
    a.trimEnd = a.duration;
    a.trackId = "V1";
    Clip b = a;
    b.startTime = a.duration;
    return {a, b};
}

static ExportSettings settingsOf(ExportResolution r, ExportQuality q) {
    ExportSettings s;
    s.resolution = r;
    s.quality = q;
    return s;
}

void test_baseline_estimate() {
    ExportEstimate e = ExportEstimator::estimate(clipsOf(60.0), ExportSettings());
    assert(std::abs(e.totalDurationSeconds - 60.0) < 1e-9);
    assert(std::abs(e.estimatedTimeSeconds - 6.0) < 1e-9);
    // 60 s at 5 Mbit/s
    assert(e.estimatedFileSizeBytes == 37500000ull);
    assert(e.clipCount == 2);
    printf("PASS: test_baseline_estimate\n");
}

void test_multipliers() {
    assert(ExportEstimator::resolutionMultiplier(ExportResolution::P1080) == 1.2);
    assert(ExportEstimator::resolutionMultiplier(ExportResolution::P720) == 0.8);
    assert(ExportEstimator::qualityMultiplier(ExportQuality::High) == 1.5);
    assert(ExportEstimator::qualityMultiplier(ExportQuality::Low) == 0.7);
    assert(ExportEstimator::bitrate(ExportResolution::P1080, ExportQuality::High) == 12000000.0);
    printf("PASS: test_multipliers\n");
}

void test_monotonic_in_quality() {
    auto clips = clipsOf(120.0);
    for (ExportResolution r : {ExportResolution::Source, ExportResolution::P1080, ExportResolution::P720}) {
        auto low = settingsOf(r, ExportQuality::Low);
        auto medium = settingsOf(r, ExportQuality::Medium);
        auto high = settingsOf(r, ExportQuality::High);
        assert(ExportEstimator::estimateTime(clips, low) < ExportEstimator::estimateTime(clips, medium));
        assert(ExportEstimator::estimateTime(clips, medium) < ExportEstimator::estimateTime(clips, high));
        assert(ExportEstimator::estimateSize(clips, low) < ExportEstimator::estimateSize(clips, medium));
        assert(ExportEstimator::estimateSize(clips, medium) < ExportEstimator::estimateSize(clips, high));
    }
    printf("PASS: test_monotonic_in_quality\n");
}

void test_monotonic_in_resolution() {
    auto clips = clipsOf(120.0);
    for (ExportQuality q : {ExportQuality::Low, ExportQuality::Medium, ExportQuality::High}) {
        auto p720 = settingsOf(ExportResolution::P720, q);
        auto source = settingsOf(ExportResolution::Source, q);
        auto p1080 = settingsOf(ExportResolution::P1080, q);
        assert(ExportEstimator::estimateTime(clips, p720) < ExportEstimator::estimateTime(clips, source));
        assert(ExportEstimator::estimateTime(clips, source) < ExportEstimator::estimateTime(clips, p1080));
        assert(ExportEstimator::estimateSize(clips, p720) < ExportEstimator::estimateSize(clips, source));
        assert(ExportEstimator::estimateSize(clips, source) < ExportEstimator::estimateSize(clips, p1080));
    }
    printf("PASS: test_monotonic_in_resolution\n");
}

void test_monotonic_in_duration() {
    const std::vector<double> durations = {0.2, 1.0, 1.5, 30.0, 59.9, 60.0, 600.0, 3600.0, 7200.5};
    for (ExportResolution r : {ExportResolution::Source, ExportResolution::P1080, ExportResolution::P720}) {
        for (ExportQuality q : {ExportQuality::Low, ExportQuality::Medium, ExportQuality::High}) {
            const ExportSettings s = settingsOf(r, q);
            double prevTime = 0.0;
            quint64 prevSize = 0;
            for (double d : durations) {
                auto clips = clipsOf(d);
                const double t = ExportEstimator::estimateTime(clips, s);
                const quint64 size = ExportEstimator::estimateSize(clips, s);
                assert(t >= prevTime);
                assert(size >= prevSize);
                prevTime = t;
                prevSize = size;
            }
            assert(prevTime > 0.0);
            assert(prevSize > 0);
        }
    }
    printf("PASS: test_monotonic_in_duration\n");
}

void test_empty_timeline() {
    ExportEstimate e = ExportEstimator::estimate({}, ExportSettings());
    assert(e.estimatedTimeSeconds == 0.0);
    assert(e.estimatedFileSizeBytes == 0);
    assert(e.clipCount == 0);
    printf("PASS: test_empty_timeline\n");
}

int main() {
    test_baseline_estimate();
    test_multipliers();
    test_monotonic_in_quality();
    test_monotonic_in_resolution();
    test_monotonic_in_duration();
    test_empty_timeline();
    printf("All export estimator tests passed.\n");
    return 0;
}
