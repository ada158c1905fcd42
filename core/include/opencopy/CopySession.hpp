// State of one batch invocation, owned by the orchestrator and passed by
// reference to every component that reads or updates it.
#pragma once
#include "CopyTypes.hpp"
#include "SpeedEstimator.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

namespace opencopy {

struct CopySession {
    using clock = std::chrono::steady_clock;

    std::vector<FileTask> tasks;  // sizes resolved
    std::uint64_t totalBytes = 0;
    // Credited only once a file completed; never exceeds totalBytes.
    std::uint64_t bytesCopiedSoFar = 0;
    // Incremented exactly once per completed file.
    std::size_t filesCompleted = 0;
    std::size_t filesSkipped = 0;
    std::size_t filesFailed = 0;
    clock::time_point startTime{};

    // File currently in transfer.
    std::size_t currentIndex = 0;
    std::uint64_t currentFileBytes = 0;
    std::uint64_t currentFileSize = 0;
    bool currentCredited = false;  // already part of bytesCopiedSoFar

    bool cancelled = false;
    bool nativeDisabled = false;  // probe failed, streamed for the rest

    SpeedEstimator speed;
    clock::time_point lastSpeedSample{};
    bool speedSampled = false;

    // Bytes for the overall bar: credited files plus the in-flight one.
    std::uint64_t overallBytes() const {
        const std::uint64_t b =
            bytesCopiedSoFar + (currentCredited ? 0 : currentFileBytes);
        return b < totalBytes ? b : totalBytes;
    }
};

} // namespace opencopy
