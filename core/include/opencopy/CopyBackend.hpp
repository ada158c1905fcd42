// Abstract interface for single-file transfer backends. Concrete backends
// (native bulk copy, streamed buffer loop) must honor this API so the
// orchestrator stays independent of the mechanism.
#pragma once
#include "CopyTypes.hpp"
#include <cstdint>
#include <string>

namespace opencopy {

class CancellationToken;

// Receives progress from a backend while it transfers one file. The
// orchestrator implements it; the backend is its only caller.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual ProgressAction onProgress(const ProgressUpdate& update) = 0;
};

enum class CopyStatus { Completed, Failed, Cancelled };

struct FileCopyResult {
    CopyStatus status = CopyStatus::Failed;
    std::uint64_t bytesCopied = 0;
    int osError = 0;      // errno of the failing call, 0 if not applicable
    std::string error;    // empty on success
    // The destination was opened (and truncated); partial output may exist.
    bool destinationTouched = false;
};

class CopyBackend {
public:
    virtual ~CopyBackend() = default;

    virtual const char* name() const = 0;

    // Checks whether the mechanism can run on this system. Called at most
    // once per session by the orchestrator; leaves err empty on success.
    virtual bool probe(std::string& err) = 0;

    // Copies task.sourcePath to task.destPath (created or truncated).
    // `fileSize` is the size used for progress. Cancellation is observed
    // through `cancel`; when the sink answers Cancel the result is Cancelled.
    virtual FileCopyResult copy(const FileTask& task,
                                std::uint64_t fileSize,
                                ProgressSink& sink,
                                const CancellationToken& cancel) = 0;

    // Issue kind used when copy() fails.
    virtual CopyIssueKind failureKind() const = 0;
};

} // namespace opencopy
