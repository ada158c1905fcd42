// Batch driver: sizes the batch, then copies one task at a time in order.
#include "opencopy/CopyOrchestrator.hpp"
#include "opencopy/CancellationToken.hpp"
#include "opencopy/NativeCopyBackend.hpp"
#include "opencopy/StreamedCopyBackend.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace opencopy {

namespace fs = std::filesystem;

// Bridges backend callbacks to the session: cancellation, speed sampling and
// throttled progress emission.
class CopyOrchestrator::SessionSink : public ProgressSink {
public:
    SessionSink(CopySession& session, ProgressReporter& reporter,
                const CancellationToken& cancel,
                std::chrono::milliseconds speedInterval)
        : session_(session), reporter_(reporter), cancel_(cancel),
          speedInterval_(speedInterval) {}

    ProgressAction onProgress(const ProgressUpdate& update) override {
        if (cancel_.isRequested())
            return ProgressAction::Cancel;

        session_.currentFileBytes = update.bytesTransferred;
        if (update.fileSize > 0)
            session_.currentFileSize = update.fileSize;

        const auto now = CopySession::clock::now();
        if (!session_.speedSampled ||
            now - session_.lastSpeedSample >= speedInterval_) {
            session_.speed.sample(now, update.bytesTransferred);
            session_.lastSpeedSample = now;
            session_.speedSampled = true;
        }
        reporter_.update(session_, now);
        return ProgressAction::Continue;
    }

private:
    CopySession& session_;
    ProgressReporter& reporter_;
    const CancellationToken& cancel_;
    std::chrono::milliseconds speedInterval_;
};

CopyOrchestrator::CopyOrchestrator(const CopyOptions& options,
                                   CancellationToken& cancel,
                                   ProgressRenderer* renderer,
                                   CopyEvents* events)
    : options_(options), cancel_(cancel), renderer_(renderer),
      events_(events) {
    native_ = std::make_unique<NativeCopyBackend>(options_.unbufferedThreshold);
    streamed_ = std::make_unique<StreamedCopyBackend>(
        options_.bufferSize, options_.progressInterval);
}

CopyOrchestrator::~CopyOrchestrator() = default;

void CopyOrchestrator::setNativeBackend(std::unique_ptr<CopyBackend> backend) {
    native_ = std::move(backend);
}

void CopyOrchestrator::setStreamedBackend(
    std::unique_ptr<CopyBackend> backend) {
    if (backend)
        streamed_ = std::move(backend);
}

void CopyOrchestrator::setReclaimSleeper(
    PartialFileReclaimer::Sleeper sleeper) {
    reclaimSleeper_ = std::move(sleeper);
}

void CopyOrchestrator::report(CopyIssueKind kind, const std::string& path,
                              int osError, const std::string& message) {
    if (!events_)
        return;
    CopyIssue issue;
    issue.kind = kind;
    issue.path = path;
    issue.osError = osError;
    issue.message = message;
    events_->issue(issue);
}

void CopyOrchestrator::debug(const std::string& message) {
    if (events_)
        events_->debug(message);
}

bool CopyOrchestrator::resolveSizes(CopySession& session, std::string& err) {
    session.totalBytes = 0;
    for (FileTask& t : session.tasks) {
        if (!t.size) {
            std::error_code ec;
            const std::uintmax_t sz = fs::file_size(t.sourcePath, ec);
            if (ec) {
                err = "Cannot read size of " + t.sourcePath + ": " +
                      ec.message();
                report(CopyIssueKind::SizeCalculation, t.sourcePath,
                       ec.value(), err);
                return false;
            }
            t.size = static_cast<std::uint64_t>(sz);
        }
        session.totalBytes += *t.size;
    }
    return true;
}

CopyBackend* CopyOrchestrator::selectBackend(CopySession& session) {
    if (options_.backend != BackendPreference::Native) {
        debug("Streamed backend requested");
        return streamed_.get();
    }
    std::string perr;
    if (native_ && native_->probe(perr)) {
        debug(std::string("Using ") + native_->name() + " backend");
        return native_.get();
    }
    // Probed once; the rest of the session stays on the streamed backend.
    session.nativeDisabled = true;
    if (perr.empty())
        perr = "No native backend configured";
    report(CopyIssueKind::BackendInitialization, {}, 0,
           perr + "; falling back to streamed copy");
    return streamed_.get();
}

bool CopyOrchestrator::prepareDestination(const FileTask& task,
                                          CopySession& session) {
    const fs::path dest(task.destPath);
    std::error_code ec;
    const fs::path parent = dest.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        ec.clear();
        fs::create_directories(parent, ec);
        if (ec) {
            ++session.filesFailed;
            report(CopyIssueKind::DirectoryCreation, task.destPath, ec.value(),
                   "Could not create destination folder " + parent.string() +
                       ": " + ec.message());
            return false;
        }
    }
    ec.clear();
    if (!fs::exists(dest, ec))
        return true;
    // Truncating the destination would empty the source.
    if (fs::equivalent(task.sourcePath, dest, ec)) {
        ++session.filesSkipped;
        report(CopyIssueKind::SameFile, task.destPath, 0,
               "Source and destination are the same file, skipped: " +
                   task.destPath);
        return false;
    }
    if (!options_.overwrite) {
        ++session.filesSkipped;
        report(CopyIssueKind::AlreadyExists, task.destPath, 0,
               "Destination already exists, skipped: " + task.destPath);
        return false;
    }
    return true;
}

void CopyOrchestrator::reclaimPartial(const FileTask& task) {
    PartialFileReclaimer reclaimer(options_.reclaim, reclaimSleeper_);
    std::string rerr;
    if (reclaimer.reclaim(task.destPath, rerr)) {
        debug("Removed partial file " + task.destPath + " (attempts: " +
              std::to_string(reclaimer.lastAttempts()) + ")");
        return;
    }
    report(CopyIssueKind::CleanupFailed, task.destPath, 0,
           rerr + "; the file may be incomplete");
}

bool CopyOrchestrator::run(const std::vector<FileTask>& tasks,
                           CopyReport& result, std::string& err) {
    err.clear();
    result = CopyReport{};
    session_ = CopySession{};
    CopySession& session = session_;
    session.startTime = CopySession::clock::now();

    if (tasks.empty()) {
        err = "No files to copy";
        return false;
    }
    session.tasks = tasks;
    if (!resolveSizes(session, err))
        return false;

    CopyBackend* backend = selectBackend(session);
    result.nativeUsed = backend == native_.get();

    ProgressReporter reporter(renderer_, options_.progressInterval);
    session.currentIndex = 0;
    session.currentFileSize = *session.tasks.front().size;
    reporter.begin(session, CopySession::clock::now());

    for (std::size_t i = 0; i < session.tasks.size(); ++i) {
        if (cancel_.isRequested()) {
            session.cancelled = true;
            debug("Cancellation requested; " +
                  std::to_string(session.tasks.size() - i) +
                  " file(s) not started");
            break;
        }

        const FileTask& task = session.tasks[i];
        const std::uint64_t size = *task.size;
        session.currentIndex = i;
        session.currentFileBytes = 0;
        session.currentFileSize = size;
        session.currentCredited = false;

        if (!prepareDestination(task, session))
            continue;

        debug("Copying " + task.sourcePath + " -> " + task.destPath + " (" +
              backend->name() + ", " + std::to_string(size) + " bytes)");
        if (backend == native_.get()) {
            const auto* nb = dynamic_cast<const NativeCopyBackend*>(backend);
            if (nb) {
                const NativeCopyFlags flags = nb->selectFlags(task, size);
                debug(std::string("Native flags: unbuffered=") +
                      (flags.unbuffered ? "yes" : "no") +
                      " compressNetwork=" +
                      (flags.compressNetwork ? "yes" : "no"));
            }
        }
        reporter.update(session, CopySession::clock::now(), true);

        SessionSink sink(session, reporter, cancel_,
                         options_.speedSampleInterval);
        const FileCopyResult r = backend->copy(task, size, sink, cancel_);

        if (r.status == CopyStatus::Completed) {
            if (r.bytesCopied != size) {
                debug("Size of " + task.sourcePath + " changed during copy (" +
                      std::to_string(size) + " -> " +
                      std::to_string(r.bytesCopied) + " bytes)");
            }
            session.currentFileBytes = size;
            reporter.update(session, CopySession::clock::now(), true);
            session.bytesCopiedSoFar += size;
            if (session.bytesCopiedSoFar > session.totalBytes)
                session.bytesCopiedSoFar = session.totalBytes;
            session.currentCredited = true;
            ++session.filesCompleted;
            if (options_.passthrough)
                result.copiedFiles.push_back({task.destPath, size});
            continue;
        }

        if (r.destinationTouched)
            reclaimPartial(task);

        if (r.status == CopyStatus::Cancelled) {
            session.cancelled = true;
            debug("Transfer of " + task.sourcePath + " cancelled");
            break;
        }

        ++session.filesFailed;
        report(backend->failureKind(), task.sourcePath, r.osError,
               "Copy of " + task.sourcePath + " failed: " + r.error);
        if (cancel_.isRequested()) {
            session.cancelled = true;
            break;
        }
    }

    if (!session.currentCredited)
        session.currentFileBytes = 0;
    reporter.finish(session);

    result.bytesCopied = session.bytesCopiedSoFar;
    result.totalBytes = session.totalBytes;
    result.filesCompleted = session.filesCompleted;
    result.filesSkipped = session.filesSkipped;
    result.filesFailed = session.filesFailed;
    result.cancelled = session.cancelled;
    result.elapsed = CopySession::clock::now() - session.startTime;
    debug(result.summaryLine());
    if (events_)
        events_->finished(result);
    return true;
}

} // namespace opencopy
