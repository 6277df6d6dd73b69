#include <cassert>
#include <cstdio>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryDir>
#include "util/TempResourceTracker.h"

static void touch(const QString& path) {
    QFile f(path);
    bool ok = f.open(QIODevice::WriteOnly);
    assert(ok);
    f.write("x");
}

void test_allocate_registers_before_write() {
    QTemporaryDir scratch;
    TempResourceTracker tracker(scratch.path());

    QString path = tracker.allocateFile("trim", "mp4");
    assert(QFileInfo(path).fileName().startsWith("trim_"));
    assert(path.endsWith(".mp4"));
    assert(!QFileInfo::exists(path));
    assert(tracker.files().contains(path));

    // Cleanup of a never-written path is not a failure
    assert(tracker.cleanupAll() == 0);
    assert(tracker.isEmpty());
    printf("PASS: test_allocate_registers_before_write\n");
}

void test_create_and_track_file() {
    QTemporaryDir scratch;
    TempResourceTracker tracker(scratch.path());

    const QString path = QDir(scratch.path()).filePath("concat_test.txt");
    assert(tracker.createAndTrackFile(path, "file 'a.mp4'\n"));
    assert(QFileInfo::exists(path));

    QFile f(path);
    assert(f.open(QIODevice::ReadOnly));
    assert(f.readAll() == "file 'a.mp4'\n");
    f.close();

    assert(tracker.cleanupAll() == 0);
    assert(!QFileInfo::exists(path));
    printf("PASS: test_create_and_track_file\n");
}

void test_failed_create_stays_tracked() {
    QTemporaryDir scratch;
    TempResourceTracker tracker(scratch.path());

    const QString path = QDir(scratch.path()).filePath("missing/sub/file.txt");
    assert(!tracker.createAndTrackFile(path, "data"));
    assert(!tracker.errorString().isEmpty());
    assert(tracker.files().contains(path));
    assert(tracker.cleanupAll() == 0);
    printf("PASS: test_failed_create_stays_tracked\n");
}

void test_cleanup_is_idempotent() {
    QTemporaryDir scratch;
    TempResourceTracker tracker(scratch.path());

    const QString a = QDir(scratch.path()).filePath("a.tmp");
    const QString b = QDir(scratch.path()).filePath("b.tmp");
    touch(a);
    touch(b);
    tracker.addFile(a);
    tracker.addFile(b);
    tracker.addFile(a);
    assert(tracker.files().size() == 2);

    assert(tracker.cleanupAll() == 0);
    assert(!QFileInfo::exists(a));
    assert(!QFileInfo::exists(b));

    // Second call finds nothing to do
    assert(tracker.cleanupAll() == 0);
    assert(tracker.isEmpty());
    printf("PASS: test_cleanup_is_idempotent\n");
}

void test_nested_directories() {
    QTemporaryDir scratch;
    TempResourceTracker tracker(scratch.path());

    const QString outer = QDir(scratch.path()).filePath("job");
    const QString inner = QDir(outer).filePath("frames");
    assert(tracker.createAndTrackDirectory(outer));
    assert(tracker.createAndTrackDirectory(inner));

    const QString file = QDir(inner).filePath("0001.txt");
    assert(tracker.createAndTrackFile(file, "frame"));

    // Untracked content inside a tracked directory goes with it
    touch(QDir(inner).filePath("stray.txt"));

    assert(tracker.cleanupAll() == 0);
    assert(!QFileInfo::exists(file));
    assert(!QFileInfo::exists(inner));
    assert(!QFileInfo::exists(outer));
    assert(QDir(scratch.path()).isEmpty());
    printf("PASS: test_nested_directories\n");
}

void test_destructor_cleans_up() {
    QTemporaryDir scratch;
    QString path;
    {
        TempResourceTracker tracker(scratch.path());
        path = tracker.allocateFile("trim", "mp4");
        touch(path);
        assert(QFileInfo::exists(path));
    }
    assert(!QFileInfo::exists(path));
    printf("PASS: test_destructor_cleans_up\n");
}

void test_unique_names() {
    QSet<QString> names;
    for (int i = 0; i < 1000; ++i) {
        names.insert(TempResourceTracker::uniqueName("concat"));
    }
    assert(names.size() == 1000);
    printf("PASS: test_unique_names\n");
}

int main() {
    test_allocate_registers_before_write();
    test_create_and_track_file();
    test_failed_create_stays_tracked();
    test_cleanup_is_idempotent();
    test_nested_directories();
    test_destructor_cleans_up();
    test_unique_names();
    printf("All temp resource tracker tests passed.\n");
    return 0;
}
