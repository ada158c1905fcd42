#pragma once
#include "CopyBackend.hpp"
#include <chrono>

namespace opencopy {

// Fixed-size buffer read/write loop. Used when the native primitive is
// unavailable or the caller asked for it.
class StreamedCopyBackend : public CopyBackend {
public:
    explicit StreamedCopyBackend(
        std::size_t bufferSize = 4 * kMiB,
        std::chrono::milliseconds progressInterval =
            std::chrono::milliseconds(100));

    const char* name() const override { return "streamed"; }
    bool probe(std::string& err) override;
    FileCopyResult copy(const FileTask& task,
                        std::uint64_t fileSize,
                        ProgressSink& sink,
                        const CancellationToken& cancel) override;
    CopyIssueKind failureKind() const override {
        return CopyIssueKind::StreamCopy;
    }

private:
    std::size_t bufferSize_;
    std::chrono::milliseconds progressInterval_;
};

} // namespace opencopy
