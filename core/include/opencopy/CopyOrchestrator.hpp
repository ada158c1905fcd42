// Drives a batch of file copies: overwrite policy, backend selection,
// progress aggregation, cancellation and cleanup of partial output.
#pragma once
#include "CopyBackend.hpp"
#include "CopySession.hpp"
#include "CopyTypes.hpp"
#include "PartialFileReclaimer.hpp"
#include "ProgressReporter.hpp"
#include <memory>
#include <string>
#include <vector>

namespace opencopy {

class CancellationToken;

// Receives warnings, diagnostics and the final report of a batch.
class CopyEvents {
public:
    virtual ~CopyEvents() = default;
    virtual void issue(const CopyIssue& issue) = 0;
    virtual void debug(const std::string& message) { (void)message; }
    virtual void finished(const CopyReport& report) { (void)report; }
};

class CopyOrchestrator {
public:
    // renderer and events are optional and not owned.
    CopyOrchestrator(const CopyOptions& options, CancellationToken& cancel,
                     ProgressRenderer* renderer = nullptr,
                     CopyEvents* events = nullptr);
    ~CopyOrchestrator();

    // Replace the backends (tests, alternative primitives). Passing null for
    // the native backend makes every session fall back to streamed.
    void setNativeBackend(std::unique_ptr<CopyBackend> backend);
    void setStreamedBackend(std::unique_ptr<CopyBackend> backend);
    void setReclaimSleeper(PartialFileReclaimer::Sleeper sleeper);

    // Copies tasks in order. Returns false only when the batch could not
    // start (empty task list or unreadable source size); per-file problems
    // are reported through CopyEvents and counted in the report.
    bool run(const std::vector<FileTask>& tasks, CopyReport& report,
             std::string& err);

    // State of the last run.
    const CopySession& session() const { return session_; }

private:
    class SessionSink;

    CopyOptions options_;
    CancellationToken& cancel_;
    ProgressRenderer* renderer_;
    CopyEvents* events_;
    std::unique_ptr<CopyBackend> native_;
    std::unique_ptr<CopyBackend> streamed_;
    PartialFileReclaimer::Sleeper reclaimSleeper_;
    CopySession session_;

    bool resolveSizes(CopySession& session, std::string& err);
    CopyBackend* selectBackend(CopySession& session);
    bool prepareDestination(const FileTask& task, CopySession& session);
    void reclaimPartial(const FileTask& task);
    void report(CopyIssueKind kind, const std::string& path, int osError,
                const std::string& message);
    void debug(const std::string& message);
};

} // namespace opencopy
