// Batch level tests: overwrite policy, fallback, cancellation, cleanup.
#include "opencopy/CancellationToken.hpp"
#include "opencopy/CopyOrchestrator.hpp"
#include "opencopy/MockCopyBackend.hpp"
#include "opencopy/NativeCopyBackend.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace fs = std::filesystem;
using opencopy::kMiB;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

struct RecordingEvents : opencopy::CopyEvents {
    std::vector<opencopy::CopyIssue> issues;
    std::vector<std::string> debugLines;
    int finishedCalls = 0;

    void issue(const opencopy::CopyIssue &i) override { issues.push_back(i); }
    void debug(const std::string &m) override { debugLines.push_back(m); }
    void finished(const opencopy::CopyReport &) override { ++finishedCalls; }

    int count(opencopy::CopyIssueKind kind) const {
        int n = 0;
        for (const auto &i : issues)
            n += i.kind == kind ? 1 : 0;
        return n;
    }
};

struct RecordingRenderer : opencopy::ProgressRenderer {
    std::vector<opencopy::ProgressSnapshot> seen;
    void render(const opencopy::ProgressSnapshot &s) override {
        seen.push_back(s);
    }
};

// Requests cancellation once the named file shows partial progress.
struct CancellingRenderer : opencopy::ProgressRenderer {
    opencopy::CancellationToken &cancel;
    std::string file;
    explicit CancellingRenderer(opencopy::CancellationToken &c, std::string f)
        : cancel(c), file(std::move(f)) {}
    void render(const opencopy::ProgressSnapshot &s) override {
        if (s.barId == 2 && s.currentFileName == file && s.filePercent > 0 &&
            s.filePercent < 100)
            cancel.request();
    }
};

fs::path makeTempDir(const std::string &tag) {
    const fs::path dir = fs::temp_directory_path() /
                         ("opencopy_orch_" + tag + "_" +
                          std::to_string(std::rand()));
    fs::remove_all(dir);
    fs::create_directories(dir / "src");
    return dir;
}

void writeFile(const fs::path &p, std::uint64_t size, char seed) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    std::vector<char> block(64 * 1024);
    for (std::size_t i = 0; i < block.size(); ++i)
        block[i] = static_cast<char>(seed + static_cast<char>(i % 97));
    std::uint64_t left = size;
    while (left > 0) {
        const std::size_t n =
            left < block.size() ? static_cast<std::size_t>(left) : block.size();
        out.write(block.data(), static_cast<std::streamsize>(n));
        left -= n;
    }
}

std::string slurp(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

// Creates src/<name> of `size` bytes and a task copying it to dst/<name>.
opencopy::FileTask addFile(const fs::path &dir, const std::string &name,
                           std::uint64_t size, char seed) {
    const fs::path src = dir / "src" / name;
    fs::create_directories(src.parent_path());
    writeFile(src, size, seed);
    opencopy::FileTask t;
    t.sourcePath = src.string();
    t.destPath = (dir / "dst" / name).string();
    t.relativePath = name;
    return t;
}

opencopy::CopyOptions streamedOptions() {
    opencopy::CopyOptions o;
    o.backend = opencopy::BackendPreference::Streamed;
    return o;
}

void test_skip_existing_destination(TestContext &t) {
    const fs::path dir = makeTempDir("skip");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 10 * kMiB, 'a'),
        addFile(dir, "b.bin", 20 * kMiB, 'b'),
        addFile(dir, "c.bin", 5 * kMiB, 'c'),
    };
    fs::create_directories(dir / "dst");
    {
        std::ofstream keep(tasks[0].destPath, std::ios::binary);
        keep << "keep me";
    }

    opencopy::CancellationToken cancel;
    RecordingEvents events;
    RecordingRenderer renderer;
    opencopy::CopyOrchestrator orch(streamedOptions(), cancel, &renderer,
                                    &events);
    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "batch should run: " + err);
    t.check(report.filesCompleted == 2, "two files should be copied");
    t.check(report.filesSkipped == 1, "existing destination is skipped");
    t.check(report.bytesCopied == 25 * kMiB, "25 MiB should be credited");
    t.check(report.totalBytes == 35 * kMiB, "total covers every task");
    t.check(!report.cancelled && !report.nativeUsed, "streamed, not cancelled");
    t.check(slurp(tasks[0].destPath) == "keep me",
            "skipped destination must be untouched");
    t.check(slurp(tasks[1].destPath) == slurp(tasks[1].sourcePath),
            "b.bin content");
    t.check(slurp(tasks[2].destPath) == slurp(tasks[2].sourcePath),
            "c.bin content");
    t.check(events.count(opencopy::CopyIssueKind::AlreadyExists) == 1,
            "one AlreadyExists warning");
    t.check(events.finishedCalls == 1, "finished reported once");
    t.check(!renderer.seen.empty() && renderer.seen.back().completed,
            "bars should be completed at the end");
    t.checkContains(report.summaryLine(), "1 skipped", "summary lists skip");
    fs::remove_all(dir);
}

void test_cancel_mid_batch(TestContext &t) {
    const fs::path dir = makeTempDir("cancel");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 1 * kMiB, 'a'),
        addFile(dir, "b.bin", 8 * kMiB, 'b'),
        addFile(dir, "c.bin", 1 * kMiB, 'c'),
    };

    opencopy::CopyOptions opt = streamedOptions();
    opt.bufferSize = 1 * kMiB;
    opt.progressInterval = std::chrono::milliseconds(0);
    opencopy::CancellationToken cancel;
    CancellingRenderer renderer(cancel, "b.bin");
    RecordingEvents events;
    opencopy::CopyOrchestrator orch(opt, cancel, &renderer, &events);
    orch.setReclaimSleeper([](std::chrono::milliseconds) {});

    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "cancelled batch still runs: " + err);
    t.check(report.cancelled, "report should be marked cancelled");
    t.check(report.filesCompleted == 1, "only the first file completed");
    t.check(report.bytesCopied == 1 * kMiB, "only a.bin is credited");
    t.check(slurp(tasks[0].destPath) == slurp(tasks[0].sourcePath),
            "completed file is intact");
    t.check(!fs::exists(tasks[1].destPath), "partial b.bin is removed");
    t.check(!fs::exists(tasks[2].destPath), "c.bin is never started");
    t.check(orch.session().overallBytes() == 1 * kMiB,
            "overall bytes exclude the cancelled file");
    fs::remove_all(dir);
}

void test_cancel_mid_batch_native(TestContext &t) {
    {
        opencopy::NativeCopyBackend probe;
        std::string perr;
        if (!probe.probe(perr)) {
            std::cout << "[SKIP] native cancel mid batch: " << perr << "\n";
            return;
        }
    }
    const fs::path dir = makeTempDir("cancel_native");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 1 * kMiB, 'a'),
        addFile(dir, "b.bin", 8 * kMiB, 'b'),
        addFile(dir, "c.bin", 1 * kMiB, 'c'),
    };

    opencopy::CopyOptions opt;
    opt.progressInterval = std::chrono::milliseconds(0);
    opencopy::CancellationToken cancel;
    CancellingRenderer renderer(cancel, "b.bin");
    RecordingEvents events;
    opencopy::CopyOrchestrator orch(opt, cancel, &renderer, &events);
    orch.setNativeBackend(
        std::make_unique<opencopy::NativeCopyBackend>(10 * kMiB, 1 * kMiB));
    orch.setReclaimSleeper([](std::chrono::milliseconds) {});

    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "native cancel batch runs: " + err);
    t.check(report.nativeUsed, "native backend should be selected");
    t.check(report.cancelled, "native batch should be marked cancelled");
    t.check(report.filesCompleted == 1 && report.filesFailed == 0,
            "cancel is not counted as a failure");
    t.check(events.count(opencopy::CopyIssueKind::NativeCopy) == 0,
            "cancel must not be reported as NativeCopyError");
    t.check(slurp(tasks[0].destPath) == slurp(tasks[0].sourcePath),
            "file before the cancel is intact");
    t.check(!fs::exists(tasks[1].destPath), "native partial b.bin is removed");
    t.check(!fs::exists(tasks[2].destPath), "c.bin is never started");
    fs::remove_all(dir);
}

void test_same_file_is_never_truncated(TestContext &t) {
    const opencopy::BackendPreference backends[] = {
        opencopy::BackendPreference::Streamed,
        opencopy::BackendPreference::Native};
    for (const auto pref : backends) {
        const std::string label =
            pref == opencopy::BackendPreference::Native ? "native" : "streamed";
        const fs::path dir = makeTempDir("self_" + label);
        const fs::path file = dir / "src" / "self.txt";
        {
            std::ofstream out(file, std::ios::binary);
            out << "hello, world\n";
        }
        opencopy::FileTask task;
        task.sourcePath = file.string();
        task.destPath = (dir / "src" / "." / "self.txt").string();
        task.relativePath = "self.txt";

        opencopy::CopyOptions opt;
        opt.backend = pref;
        opt.overwrite = true;
        opencopy::CancellationToken cancel;
        RecordingEvents events;
        opencopy::CopyOrchestrator orch(opt, cancel, nullptr, &events);
        opencopy::CopyReport report;
        std::string err;
        t.check(orch.run({task}, report, err), label + " self copy runs");
        t.check(report.filesCompleted == 0 && report.filesSkipped == 1,
                label + " self copy is skipped");
        t.check(events.count(opencopy::CopyIssueKind::SameFile) == 1,
                label + " self copy reports SameFile");
        t.check(slurp(file) == "hello, world\n",
                label + " source keeps its content");
        fs::remove_all(dir);
    }
}

void test_read_only_source_rerun_native(TestContext &t) {
    const fs::path dir = makeTempDir("ro_native");
    std::vector<opencopy::FileTask> tasks = {addFile(dir, "ro.bin", 5000, 'r')};
    fs::permissions(tasks[0].sourcePath,
                    fs::perms::owner_read | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace);
    opencopy::CopyOptions opt;
    opt.overwrite = true;
    opencopy::CancellationToken cancel;
    opencopy::CopyOrchestrator orch(opt, cancel);
    for (int round = 1; round <= 2; ++round) {
        opencopy::CopyReport report;
        std::string err;
        const std::string label = "read-only rerun " + std::to_string(round);
        t.check(orch.run(tasks, report, err), label + " runs: " + err);
        t.check(report.filesCompleted == 1 && report.filesFailed == 0,
                label + " copies the file");
        t.check(slurp(tasks[0].destPath) == slurp(tasks[0].sourcePath),
                label + " content");
    }
    fs::permissions(tasks[0].destPath, fs::perms::owner_all,
                    fs::perm_options::add);
    fs::remove_all(dir);
}

void test_cancel_before_start(TestContext &t) {
    const fs::path dir = makeTempDir("precancel");
    std::vector<opencopy::FileTask> tasks = {addFile(dir, "a.bin", 1024, 'a')};
    opencopy::CancellationToken cancel;
    cancel.request();
    opencopy::CopyOrchestrator orch(streamedOptions(), cancel);
    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "run should return normally");
    t.check(report.cancelled && report.filesCompleted == 0,
            "no file copied after an early cancel");
    t.check(!fs::exists(tasks[0].destPath), "destination not created");
    fs::remove_all(dir);
}

void test_native_unavailable_falls_back(TestContext &t) {
    const fs::path dir = makeTempDir("fallback");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 4096, 'a'),
        addFile(dir, "b.bin", 8192, 'b'),
        addFile(dir, "c.bin", 0, 'c'),
    };
    opencopy::CopyOptions opt;  // prefers native
    opencopy::CancellationToken cancel;
    RecordingEvents events;
    opencopy::CopyOrchestrator orch(opt, cancel, nullptr, &events);
    auto mock = std::make_unique<opencopy::MockCopyBackend>(false);
    opencopy::MockCopyBackend *native = mock.get();
    orch.setNativeBackend(std::move(mock));

    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "fallback batch should run: " + err);
    t.check(native->probeCalls() == 1, "native probed exactly once");
    t.check(native->copyCalls() == 0, "failed backend never copies");
    t.check(!report.nativeUsed, "report should say streamed was used");
    t.check(orch.session().nativeDisabled, "session marks native disabled");
    t.check(report.filesCompleted == 3, "every file copied by streamed");
    t.check(events.count(opencopy::CopyIssueKind::BackendInitialization) == 1,
            "one initialization warning");
    for (const auto &task : tasks)
        t.check(slurp(task.destPath) == slurp(task.sourcePath),
                task.relativePath + " content");
    fs::remove_all(dir);
}

void test_native_backend_used(TestContext &t) {
    const fs::path dir = makeTempDir("native");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 4096, 'a'),
        addFile(dir, "b.bin", 100, 'b'),
    };
    opencopy::CancellationToken cancel;
    opencopy::CopyOrchestrator orch(opencopy::CopyOptions{}, cancel);
    auto mock = std::make_unique<opencopy::MockCopyBackend>(true);
    opencopy::MockCopyBackend *native = mock.get();
    orch.setNativeBackend(std::move(mock));

    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "native batch should run: " + err);
    t.check(report.nativeUsed, "native backend should be selected");
    t.check(native->probeCalls() == 1, "probe once per session");
    t.check(native->copyCalls() == 2, "native copies each file");
    t.check(report.bytesCopied == 4196, "every byte credited");
    fs::remove_all(dir);
}

void test_overwrite_is_idempotent(TestContext &t) {
    const fs::path dir = makeTempDir("idem");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 3 * kMiB, 'a'),
        addFile(dir, "sub/b.bin", 1024, 'b'),
    };
    opencopy::CopyOptions opt = streamedOptions();
    opt.overwrite = true;
    opencopy::CancellationToken cancel;
    opencopy::CopyOrchestrator orch(opt, cancel);

    for (int round = 0; round < 2; ++round) {
        opencopy::CopyReport report;
        std::string err;
        const std::string label = "round " + std::to_string(round + 1);
        t.check(orch.run(tasks, report, err), label + " should run: " + err);
        t.check(report.filesCompleted == 2 && report.filesSkipped == 0,
                label + " copies both files");
        t.check(report.bytesCopied == 3 * kMiB + 1024, label + " bytes");
        for (const auto &task : tasks)
            t.check(slurp(task.destPath) == slurp(task.sourcePath),
                    label + " " + task.relativePath + " content");
    }
    fs::remove_all(dir);
}

void test_missing_source_is_fatal(TestContext &t) {
    const fs::path dir = makeTempDir("fatal");
    std::vector<opencopy::FileTask> tasks = {addFile(dir, "a.bin", 10, 'a')};
    opencopy::FileTask ghost;
    ghost.sourcePath = (dir / "src" / "ghost.bin").string();
    ghost.destPath = (dir / "dst" / "ghost.bin").string();
    tasks.push_back(ghost);

    opencopy::CancellationToken cancel;
    RecordingEvents events;
    opencopy::CopyOrchestrator orch(streamedOptions(), cancel, nullptr,
                                    &events);
    opencopy::CopyReport report;
    std::string err;
    t.check(!orch.run(tasks, report, err), "unknown size should abort");
    t.checkContains(err, "ghost.bin", "error names the unreadable source");
    t.check(events.count(opencopy::CopyIssueKind::SizeCalculation) == 1,
            "SizeCalculation issue reported");
    t.check(!fs::exists(dir / "dst"), "nothing copied before sizing");

    std::vector<opencopy::FileTask> none;
    t.check(!orch.run(none, report, err), "empty batch is rejected");
    fs::remove_all(dir);
}

void test_failure_continues_and_reclaims(TestContext &t) {
    const fs::path dir = makeTempDir("fail");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 100, 'a'),
        addFile(dir, "b.bin", 200, 'b'),
        addFile(dir, "c.bin", 300, 'c'),
    };
    opencopy::CancellationToken cancel;
    RecordingEvents events;
    opencopy::CopyOrchestrator orch(opencopy::CopyOptions{}, cancel, nullptr,
                                    &events);
    auto mock = std::make_unique<opencopy::MockCopyBackend>(true);
    mock->failOn(tasks[1].sourcePath, EIO);
    orch.setNativeBackend(std::move(mock));
    orch.setReclaimSleeper([](std::chrono::milliseconds) {});

    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "batch should run: " + err);
    t.check(report.filesCompleted == 2, "other files still copied");
    t.check(report.filesFailed == 1, "one failure counted");
    t.check(report.bytesCopied == 400, "failed file is not credited");
    t.check(!fs::exists(tasks[1].destPath), "partial output removed");
    t.check(events.count(opencopy::CopyIssueKind::NativeCopy) == 1,
            "native copy failure reported");
    bool sawErrno = false;
    for (const auto &i : events.issues)
        sawErrno = sawErrno || (i.kind == opencopy::CopyIssueKind::NativeCopy &&
                                i.osError == EIO);
    t.check(sawErrno, "failure carries the OS error");
    fs::remove_all(dir);
}

void test_directory_creation_failure(TestContext &t) {
    const fs::path dir = makeTempDir("mkdir");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 10, 'a'),
        addFile(dir, "b.bin", 20, 'b'),
    };
    {
        std::ofstream blocker(dir / "blocker", std::ios::binary);
        blocker << "x";
    }
    tasks[0].destPath = (dir / "blocker" / "sub" / "a.bin").string();

    opencopy::CancellationToken cancel;
    RecordingEvents events;
    opencopy::CopyOrchestrator orch(streamedOptions(), cancel, nullptr,
                                    &events);
    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "batch should run: " + err);
    t.check(report.filesFailed == 1 && report.filesCompleted == 1,
            "folder failure skips only that file");
    t.check(events.count(opencopy::CopyIssueKind::DirectoryCreation) == 1,
            "DirectoryCreation issue reported");
    fs::remove_all(dir);
}

void test_passthrough_descriptors(TestContext &t) {
    const fs::path dir = makeTempDir("passthru");
    std::vector<opencopy::FileTask> tasks = {
        addFile(dir, "a.bin", 10, 'a'),
        addFile(dir, "b.bin", 20, 'b'),
    };
    opencopy::CopyOptions opt = streamedOptions();
    opt.passthrough = true;
    opencopy::CancellationToken cancel;
    opencopy::CopyOrchestrator orch(opt, cancel);
    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "batch should run: " + err);
    t.check(report.copiedFiles.size() == 2, "one descriptor per copied file");
    t.check(report.copiedFiles.size() == 2 &&
                report.copiedFiles[0].path == tasks[0].destPath &&
                report.copiedFiles[1].size == 20,
            "descriptors keep order, path and size");

    opt.passthrough = false;
    opt.overwrite = true;
    opencopy::CopyOrchestrator quiet(opt, cancel);
    t.check(quiet.run(tasks, report, err) && report.copiedFiles.empty(),
            "no descriptors without passthrough");
    fs::remove_all(dir);
}

void test_zero_length_file(TestContext &t) {
    const fs::path dir = makeTempDir("empty");
    std::vector<opencopy::FileTask> tasks = {addFile(dir, "empty.bin", 0, 'e')};
    opencopy::CancellationToken cancel;
    RecordingRenderer renderer;
    opencopy::CopyOrchestrator orch(streamedOptions(), cancel, &renderer);
    opencopy::CopyReport report;
    std::string err;
    t.check(orch.run(tasks, report, err), "empty file batch should run");
    t.check(report.filesCompleted == 1, "empty file counts as completed");
    t.check(fs::exists(tasks[0].destPath) && fs::file_size(tasks[0].destPath) == 0,
            "empty destination created");
    t.check(!renderer.seen.empty() && renderer.seen.back().overallPercent == 100 &&
                renderer.seen.back().completed,
            "empty file ends at 100%");
    fs::remove_all(dir);
}

} // namespace

int main() {
    TestContext t;
    test_skip_existing_destination(t);
    test_cancel_mid_batch(t);
    test_cancel_mid_batch_native(t);
    test_same_file_is_never_truncated(t);
    test_read_only_source_rerun_native(t);
    test_cancel_before_start(t);
    test_native_unavailable_falls_back(t);
    test_native_backend_used(t);
    test_overwrite_is_idempotent(t);
    test_missing_source_is_fatal(t);
    test_failure_continues_and_reclaims(t);
    test_directory_creation_failure(t);
    test_passthrough_descriptors(t);
    test_zero_length_file(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opencopy_orchestrator_tests\n";
    return EXIT_SUCCESS;
}
