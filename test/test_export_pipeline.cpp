#include <cassert>
#include <cstdio>
#include <atomic>
#include <vector>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QThread>
#include "timeline/Clip.h"
#include "export/ConcatManifestBuilder.h"
#include "export/ExportExecutor.h"
#include "export/ExportService.h"
#include "media/SourceDurationOracle.h"

// Scripted stand-in for ffmpeg. Trim calls write a marker into the output
// (always the last argument); concat calls print status lines and copy the
// manifest into the output so the test can inspect what was concatenated.
// FAIL_STAGE makes the trim or concat call fail, HANG_STAGE makes it block.
static const char* FakeToolScript = R"SH(#!/bin/sh
prev=""
input=""
out=""
stage="trim"
for a in "$@"; do
  if [ "$prev" = "-i" ]; then input="$a"; fi
  if [ "$a" = "concat" ]; then stage="concat"; fi
  prev="$a"
  out="$a"
done
echo "ffmpeg version fake-clipforge" >&2
if [ "$stage" = "FAIL_STAGE" ]; then
  echo "$stage: simulated failure" >&2
  exit 1
fi
if [ "$stage" = "HANG_STAGE" ]; then
  exec sleep 30
fi
if [ "$stage" = "concat" ]; then
  printf 'frame=   10 fps=30.0 q=-1.0 size=     256kB time=00:00:04.00 bitrate=1000.0kbits/s speed=2.0x\r' >&2
  printf 'frame=   20 fps=30.0 q=-1.0 size=     512kB time=00:00:08.00 bitrate=1000.0kbits/s speed=2.0x\n' >&2
  cp "$input" "$out"
else
  printf 'trimmed %s\n' "$input" > "$out"
fi
exit 0
)SH";

struct Fixture {
    QTemporaryDir root;
    QString mediaDir;
    QString outputDir;
    QString scratchDir;
    QString toolPath;

    explicit Fixture(const QString& failStage = QString(), const QString& hangStage = QString()) {
        assert(root.isValid());
        QDir d(root.path());
        mediaDir = d.filePath("media");
        outputDir = d.filePath("out");
        scratchDir = d.filePath("scratch");
        toolPath = d.filePath("fake-ffmpeg");
        bool ok = d.mkpath(mediaDir) && d.mkpath(outputDir);
        assert(ok);

        QString script = FakeToolScript;
        script.replace("FAIL_STAGE", failStage.isEmpty() ? QString("none") : failStage);
        script.replace("HANG_STAGE", hangStage.isEmpty() ? QString("none") : hangStage);
        writeFile(toolPath, script.toUtf8());
        QFile::setPermissions(toolPath, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);

        writeFile(media("a.mp4"), "A");
        writeFile(media("b.mp4"), "B");
    }

    QString media(const QString& name) const { return QDir(mediaDir).filePath(name); }
    QString output(const QString& name) const { return QDir(outputDir).filePath(name); }

    ExportConfig config() const {
        ExportConfig c = ExportConfig::defaults();
        c.ffmpegPath = toolPath;
        c.scratchDir = scratchDir;
        c.toolTimeoutMs = 20000;
        c.killGraceMs = 1000;
        return c;
    }

    bool scratchIsEmpty() const {
        return QDir(scratchDir).entryList(QDir::AllEntries | QDir::NoDotAndDotDot).isEmpty();
    }

    static void writeFile(const QString& path, const QByteArray& data) {
        QFile f(path);
        bool ok = f.open(QIODevice::WriteOnly);
        assert(ok);
        f.write(data);
    }

    static QByteArray readFile(const QString& path) {
        QFile f(path);
        bool ok = f.open(QIODevice::ReadOnly);
        assert(ok);
        return f.readAll();
    }
};

static Clip makeClip(const QString& path, double start, double duration,
                     double trimStart, double trimEnd, double sourceDuration) {
    Clip c;
    c.filePath = path;
    c.startTime = start;
    c.duration = duration;
    c.trimStart = trimStart;
    c.trimEnd = trimEnd;
    c.trackId = "V1";
    c.sourceDuration = sourceDuration;
    return c;
}

// A [0,10) untrimmed on a 10 s source, B at [10,15) trimmed to [2,5) of an 8 s source
static std::vector<Clip> twoClipTimeline(const Fixture& fx) {
    return {
        makeClip(fx.media("a.mp4"), 0.0, 10.0, 0.0, 10.0, 10.0),
        makeClip(fx.media("b.mp4"), 10.0, 5.0, 2.0, 5.0, 8.0),
    };
}

class FixedOracle : public SourceDurationOracle {
public:
    explicit FixedOracle(bool succeed) : m_succeed(succeed) {}
    bool sourceDuration(const QString& filePath, double& seconds, QString* error) override {
        ++calls;
        if (!m_succeed) {
            if (error) *error = QString("Cannot open %1").arg(filePath);
            return false;
        }
        seconds = 10.0;
        return true;
    }
    int calls = 0;

private:
    bool m_succeed;
};

void test_two_clip_export() {
    Fixture fx;
    ExportExecutor executor(fx.config(), nullptr);

    std::vector<ExportProgress> events;
    std::vector<ExportStep> states;
    QObject::connect(&executor, &ExportExecutor::progressChanged,
                     [&](const ExportProgress& p) {
                         events.push_back(p);
                         states.push_back(executor.state());
                     });

    const QString out = fx.output("final.mp4");
    ExportResult r = executor.run(twoClipTimeline(fx), out, ExportSettings());

    assert(r.success);
    assert(r.outputPath && *r.outputPath == out);
    assert(!r.errorMessage);
    assert(executor.state() == ExportStep::Completed);

    // The output holds the manifest the concat step was given
    const QList<QByteArray> lines = Fixture::readFile(out).trimmed().split('\n');
    assert(lines.size() == 2);
    assert(lines[0] == ConcatManifestBuilder::manifestEntry(fx.media("a.mp4")).toUtf8());
    const QByteArray trimPrefix = ("file '" + QDir::cleanPath(QDir(fx.scratchDir).filePath("trim_"))).toUtf8();
    assert(lines[1].startsWith(trimPrefix));
    assert(lines[1].endsWith(".mp4'"));

    // Every scratch artifact is gone
    assert(fx.scratchIsEmpty());

    // Preparing first, Completed at 100 last, telemetry in between
    assert(events.size() >= 3);
    assert(events.front().currentStep == ExportStep::Preparing);
    assert(events.front().progress == 0.0);
    assert(events.back().currentStep == ExportStep::Completed);
    assert(events.back().progress == 100.0);
    bool sawTelemetry = false;
    for (const auto& e : events) {
        if (e.currentStep == ExportStep::Exporting && e.frame && *e.frame == 20) {
            sawTelemetry = true;
            // 8 s of 13 s total
            assert(e.progress > 61.0 && e.progress < 62.0);
        }
        assert(e.progress >= 0.0 && e.progress <= 100.0);
    }
    assert(sawTelemetry);

    // state() tracks the step of each event as it goes out
    assert(states.front() == ExportStep::Preparing);
    for (size_t i = 0; i < events.size(); ++i) {
        assert(states[i] == events[i].currentStep);
    }
    printf("PASS: test_two_clip_export\n");
}

void test_request_overload_appends_extension() {
    Fixture fx;
    ExportExecutor executor(fx.config(), nullptr);

    ExportRequest request;
    request.clips = twoClipTimeline(fx);
    request.outputDir = fx.outputDir;
    request.filename = "named";

    ExportResult r = executor.run(request);
    assert(r.success);
    assert(*r.outputPath == fx.output("named.mp4"));
    assert(QFileInfo::exists(fx.output("named.mp4")));
    printf("PASS: test_request_overload_appends_extension\n");
}

void test_validation_failure_has_no_side_effects() {
    Fixture fx;
    ExportExecutor executor(fx.config(), nullptr);

    std::vector<ExportProgress> events;
    QObject::connect(&executor, &ExportExecutor::progressChanged,
                     [&](const ExportProgress& p) { events.push_back(p); });

    std::vector<Clip> clips = twoClipTimeline(fx);
    clips[1].startTime = 8.0;   // overlaps A on the same track

    ExportResult r = executor.run(clips, fx.output("final.mp4"), ExportSettings());
    assert(!r.success);
    assert(r.errorKind == ExportError::Kind::Validation);
    assert(r.errorMessage->contains("overlaps"));
    assert(!QFileInfo::exists(fx.scratchDir));
    assert(!QFileInfo::exists(fx.output("final.mp4")));
    assert(events.size() == 1);
    assert(events.back().currentStep == ExportStep::Failed);
    assert(events.back().error && *events.back().error == *r.errorMessage);

    r = executor.run({}, fx.output("final.mp4"), ExportSettings());
    assert(r.errorKind == ExportError::Kind::Validation);
    assert(*r.errorMessage == "No clips to export");

    r = executor.run(twoClipTimeline(fx), fx.output("missing/final.mp4"), ExportSettings());
    assert(r.errorKind == ExportError::Kind::Validation);
    assert(*r.errorMessage == "Output directory does not exist");

    ExportSettings mov;
    mov.format = "mov";
    r = executor.run(twoClipTimeline(fx), fx.output("final.mp4"), mov);
    assert(r.errorKind == ExportError::Kind::Validation);
    printf("PASS: test_validation_failure_has_no_side_effects\n");
}

void test_source_durations_from_oracle() {
    Fixture fx;
    std::vector<Clip> clips = twoClipTimeline(fx);
    clips[0].sourceDuration = 0.0;

    ExportExecutor noOracle(fx.config(), nullptr);
    ExportResult r = noOracle.run(clips, fx.output("final.mp4"), ExportSettings());
    assert(r.errorKind == ExportError::Kind::Validation);
    assert(r.errorMessage->contains("unknown source duration"));

    FixedOracle failing(false);
    ExportExecutor withFailing(fx.config(), &failing);
    r = withFailing.run(clips, fx.output("final.mp4"), ExportSettings());
    assert(r.errorKind == ExportError::Kind::Validation);
    assert(r.errorMessage->contains("Cannot determine source duration of Clip 1 (a.mp4)"));
    assert(!QFileInfo::exists(fx.scratchDir));

    FixedOracle working(true);
    ExportExecutor withWorking(fx.config(), &working);
    r = withWorking.run(clips, fx.output("final.mp4"), ExportSettings());
    assert(r.success);
    // Only the clip without a duration is probed
    assert(working.calls == 1);
    printf("PASS: test_source_durations_from_oracle\n");
}

void test_trim_failure_cleans_up() {
    Fixture fx("trim");
    ExportExecutor executor(fx.config(), nullptr);

    ExportResult r = executor.run(twoClipTimeline(fx), fx.output("final.mp4"), ExportSettings());
    assert(!r.success);
    assert(r.errorKind == ExportError::Kind::ExternalTool);
    assert(r.errorMessage->contains("Clip 2 (b.mp4)"));
    assert(r.errorMessage->contains("trim: simulated failure"));
    assert(fx.scratchIsEmpty());
    assert(!QFileInfo::exists(fx.output("final.mp4")));
    assert(executor.state() == ExportStep::Failed);
    printf("PASS: test_trim_failure_cleans_up\n");
}

void test_concat_failure_cleans_up() {
    Fixture fx("concat");
    ExportExecutor executor(fx.config(), nullptr);

    std::vector<ExportProgress> events;
    QObject::connect(&executor, &ExportExecutor::progressChanged,
                     [&](const ExportProgress& p) { events.push_back(p); });

    ExportResult r = executor.run(twoClipTimeline(fx), fx.output("final.mp4"), ExportSettings());
    assert(!r.success);
    assert(r.errorKind == ExportError::Kind::ExternalTool);
    assert(r.errorMessage->contains("concat: simulated failure"));
    assert(fx.scratchIsEmpty());
    assert(!QFileInfo::exists(fx.output("final.mp4")));

    assert(events.front().currentStep == ExportStep::Preparing);
    assert(events.back().currentStep == ExportStep::Failed);
    assert(events.back().error.has_value());
    printf("PASS: test_concat_failure_cleans_up\n");
}

void test_missing_tool() {
    Fixture fx;
    ExportConfig config = fx.config();
    config.ffmpegPath = QDir(fx.root.path()).filePath("no-such-ffmpeg");
    ExportExecutor executor(config, nullptr);

    ExportResult r = executor.run(twoClipTimeline(fx), fx.output("final.mp4"), ExportSettings());
    assert(!r.success);
    assert(r.errorKind == ExportError::Kind::ExternalTool);
    assert(r.errorMessage->contains("Failed to execute"));
    assert(fx.scratchIsEmpty());
    printf("PASS: test_missing_tool\n");
}

void test_concat_timeout() {
    Fixture fx(QString(), "concat");
    ExportConfig config = fx.config();
    config.toolTimeoutMs = 500;
    ExportExecutor executor(config, nullptr);

    ExportResult r = executor.run(twoClipTimeline(fx), fx.output("final.mp4"), ExportSettings());
    assert(!r.success);
    assert(r.errorKind == ExportError::Kind::Timeout);
    assert(fx.scratchIsEmpty());
    assert(!QFileInfo::exists(fx.output("final.mp4")));
    printf("PASS: test_concat_timeout\n");
}

void test_service_runs_job() {
    Fixture fx;
    ExportService service(fx.config());

    std::atomic<int> finishedCount{0};
    std::atomic<int> progressCount{0};
    QObject::connect(&service, &ExportService::progress, &service,
                     [&](const QString&, const ExportProgress&) { ++progressCount; },
                     Qt::DirectConnection);
    QObject::connect(&service, &ExportService::finished, &service,
                     [&](const QString&, const ExportResult&) { ++finishedCount; },
                     Qt::DirectConnection);

    ExportRequest request;
    request.clips = twoClipTimeline(fx);
    request.outputDir = fx.outputDir;
    request.filename = "service";

    const QString id = service.startExport(request);
    assert(!id.isEmpty());
    assert(service.jobIds().contains(id));
    assert(service.waitForFinished(id, 30000));

    auto status = service.status(id);
    assert(status.has_value());
    assert(status->id == id);
    assert(status->step == ExportStep::Completed);
    assert(status->progress == 100.0);
    assert(status->outputPath == fx.output("service.mp4"));
    assert(status->createdAt.isValid());
    assert(status->createdAt.timeSpec() == Qt::UTC);

    auto result = service.result(id);
    assert(result && result->success);
    assert(finishedCount == 1);
    assert(progressCount >= 2);

    // Finished jobs cannot be cancelled, unknown ids are rejected
    assert(!service.cancel(id));
    assert(!service.cancel("not-a-job"));
    assert(!service.status("not-a-job"));
    assert(!service.waitForFinished("not-a-job"));

    // A finished job can be dropped from the registry exactly once
    assert(service.removeJob(id));
    assert(!service.jobIds().contains(id));
    assert(!service.status(id));
    assert(!service.result(id));
    assert(!service.waitForFinished(id));
    assert(!service.removeJob(id));
    assert(!service.removeJob("not-a-job"));
    printf("PASS: test_service_runs_job\n");
}

void test_service_cancel() {
    Fixture fx(QString(), "concat");
    ExportService service(fx.config());

    ExportRequest request;
    request.clips = twoClipTimeline(fx);
    request.outputDir = fx.outputDir;
    request.filename = "cancelled";

    const QString id = service.startExport(request);

    // Wait until the concat step is running
    for (int i = 0; i < 200; ++i) {
        auto s = service.status(id);
        if (s && s->step == ExportStep::Exporting) break;
        QThread::msleep(25);
    }
    assert(service.status(id)->step == ExportStep::Exporting);

    // Running jobs stay registered
    assert(!service.removeJob(id));
    assert(service.jobIds().contains(id));

    assert(service.cancel(id));
    assert(service.waitForFinished(id, 30000));

    auto result = service.result(id);
    assert(result && !result->success);
    assert(result->errorKind == ExportError::Kind::Cancelled);
    assert(*result->errorMessage == "Export cancelled by user");
    assert(service.status(id)->step == ExportStep::Cancelled);
    assert(!service.cancel(id));

    assert(fx.scratchIsEmpty());
    assert(!QFileInfo::exists(fx.output("cancelled.mp4")));
    assert(service.removeJob(id));
    assert(service.jobIds().isEmpty());
    printf("PASS: test_service_cancel\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_two_clip_export();
    test_request_overload_appends_extension();
    test_validation_failure_has_no_side_effects();
    test_source_durations_from_oracle();
    test_trim_failure_cleans_up();
    test_concat_failure_cleans_up();
    test_missing_tool();
    test_concat_timeout();
    test_service_runs_job();
    test_service_cancel();
    printf("All export pipeline tests passed.\n");
    return 0;
}
