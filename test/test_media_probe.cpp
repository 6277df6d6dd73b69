#include <cassert>
#include <cstdio>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "media/MediaProbe.h"
#include "media/SourceDurationOracle.h"

// Optional real clip, e.g. CLIPFORGE_TEST_MEDIA=../testdata/sample.mp4
static QString testMedia() {
    return qEnvironmentVariable("CLIPFORGE_TEST_MEDIA");
}

void test_probe_missing_file() {
    MediaProbe probe;
    assert(!probe.probe("/nonexistent/clipforge/clip.mp4"));
    assert(probe.errorString().startsWith("Cannot open"));
    printf("PASS: test_probe_missing_file\n");
}

void test_probe_not_media() {
    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("notes.mp4");
    {
        QFile f(path);
        bool ok = f.open(QIODevice::WriteOnly);
        assert(ok);
        f.write("this is not a video\n");
    }

    MediaProbe probe;
    assert(!probe.probe(path));
    assert(!probe.errorString().isEmpty());

    ProbeDurationOracle oracle;
    double seconds = -1.0;
    QString error;
    assert(!oracle.sourceDuration(path, seconds, &error));
    assert(!error.isEmpty());
    assert(seconds == -1.0);
    printf("PASS: test_probe_not_media\n");
}

void test_probe_real_media() {
    const QString path = testMedia();
    if (path.isEmpty()) {
        printf("SKIP: test_probe_real_media (CLIPFORGE_TEST_MEDIA not set)\n");
        return;
    }

    MediaProbe probe;
    bool ok = probe.probe(path);
    if (!ok) {
        printf("FAIL: probe failed - %s\n", probe.errorString().toUtf8().constData());
        assert(false);
    }

    const MediaInfo& info = probe.info();
    printf("  Container: %s\n", info.containerFormat.toUtf8().constData());
    printf("  Duration: %.3f s\n", info.duration);
    printf("  Video Codec: %s\n", info.videoCodec.toUtf8().constData());
    printf("  Audio Codec: %s\n", info.audioCodec.toUtf8().constData());
    assert(info.duration > 0.0);
    assert(info.hasVideo || info.hasAudio);

    ProbeDurationOracle oracle;
    double first = 0.0, second = 0.0;
    assert(oracle.sourceDuration(path, first, nullptr));
    assert(oracle.sourceDuration(path, second, nullptr));
    assert(first == info.duration);
    assert(second == first);
    printf("PASS: test_probe_real_media\n");
}

int main() {
    test_probe_missing_file();
    test_probe_not_media();
    test_probe_real_media();
    printf("All media probe tests passed.\n");
    return 0;
}
