// Basic types shared between the CLI and the core for copy batches.
// Keep these structures plain so front ends can fill and read them directly.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace opencopy {

inline constexpr std::uint64_t kMiB = 1024ull * 1024ull;

// Which transfer backend the session should try first.
enum class BackendPreference {
    Native,   // OS bulk-copy primitive, falls back to Streamed if unavailable.
    Streamed  // Buffered read/write loop.
};

// One planned transfer, produced by the path resolver.
struct FileTask {
    std::string sourcePath;
    std::string destPath;
    // Empty when the resolver did not stat the source; filled by the
    // orchestrator before the batch starts.
    std::optional<std::uint64_t> size;
    std::string relativePath;  // display name (relative to the source root)
};

// Retry policy used when removing partial output.
struct ReclaimPolicy {
    int maxAttempts = 30;
    std::chrono::milliseconds initialDelay{100};
    std::chrono::milliseconds maxDelay{10000};
};

struct CopyOptions {
    bool overwrite = false;
    BackendPreference backend = BackendPreference::Native;
    bool passthrough = false;

    std::size_t bufferSize = 4 * kMiB;              // streamed backend chunk
    std::uint64_t unbufferedThreshold = 10 * kMiB;  // native "no buffering"
    std::chrono::milliseconds progressInterval{100};
    std::chrono::milliseconds speedSampleInterval{1000};
    ReclaimPolicy reclaim;
};

// Conditions reported to the caller. Only SizeCalculation is fatal.
enum class CopyIssueKind {
    SizeCalculation,
    BackendInitialization,
    AlreadyExists,
    SameFile,
    DirectoryCreation,
    NativeCopy,
    StreamCopy,
    CleanupFailed
};

struct CopyIssue {
    CopyIssueKind kind = CopyIssueKind::StreamCopy;
    std::string path;     // affected file (empty for session-wide issues)
    int osError = 0;      // errno when known
    std::string message;
};

const char* issueKindName(CopyIssueKind kind);

// Descriptor of a destination file written by the batch (passthrough).
struct CopiedFile {
    std::string path;
    std::uint64_t size = 0;
};

struct CopyReport {
    std::uint64_t bytesCopied = 0;
    std::uint64_t totalBytes = 0;
    std::size_t filesCompleted = 0;
    std::size_t filesSkipped = 0;
    std::size_t filesFailed = 0;
    bool cancelled = false;
    bool nativeUsed = false;
    std::chrono::steady_clock::duration elapsed{};
    std::vector<CopiedFile> copiedFiles;  // only filled with passthrough

    // "Copied 2 file(s), 25.0 MiB in 1m 4s" style line.
    std::string summaryLine() const;
};

// One progress bar state for the external renderer.
struct ProgressSnapshot {
    int barId = 0;
    std::optional<int> parentBarId;
    int overallPercent = 0;
    std::string overallStatusText;
    std::string currentFileName;
    int filePercent = 0;
    double speedBytesPerSec = 0.0;
    bool completed = false;
};

// Raw counters a backend hands to its progress sink.
struct ProgressUpdate {
    std::uint64_t bytesTransferred = 0;  // for the current file
    std::uint64_t fileSize = 0;
};

enum class ProgressAction {
    Continue,
    Cancel,  // stop this transfer as soon as possible
    Quiet    // keep copying but stop calling the sink for this file
};

// Percent of done over total, rounded and clamped to 100. A zero-length file
// counts as complete.
int progressPercent(std::uint64_t done, std::uint64_t total);

// "1h 2m 3s", "2m 3s" or "3s".
std::string formatElapsed(std::chrono::steady_clock::duration d);

// "512 B", "1.5 KiB", "20.0 MiB", ...
std::string formatBytes(double bytes);

} // namespace opencopy
