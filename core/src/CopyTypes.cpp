#include "opencopy/CopyTypes.hpp"

#include <cmath>
#include <cstdio>

namespace opencopy {

const char* issueKindName(CopyIssueKind kind) {
    switch (kind) {
    case CopyIssueKind::SizeCalculation:
        return "SizeCalculationError";
    case CopyIssueKind::BackendInitialization:
        return "BackendInitializationError";
    case CopyIssueKind::AlreadyExists:
        return "AlreadyExists";
    case CopyIssueKind::SameFile:
        return "SameFileError";
    case CopyIssueKind::DirectoryCreation:
        return "DirectoryCreationError";
    case CopyIssueKind::NativeCopy:
        return "NativeCopyError";
    case CopyIssueKind::StreamCopy:
        return "StreamCopyError";
    case CopyIssueKind::CleanupFailed:
        return "CleanupFailed";
    }
    return "Unknown";
}

int progressPercent(std::uint64_t done, std::uint64_t total) {
    if (total == 0)
        return 100;
    const double pct = std::round(double(done) * 100.0 / double(total));
    if (pct >= 100.0)
        return 100;
    return pct <= 0.0 ? 0 : int(pct);
}

std::string formatElapsed(std::chrono::steady_clock::duration d) {
    long long secs =
        std::chrono::duration_cast<std::chrono::seconds>(d).count();
    if (secs < 0)
        secs = 0;
    const long long h = secs / 3600;
    const long long m = (secs % 3600) / 60;
    const long long s = secs % 60;
    if (h > 0)
        return std::to_string(h) + "h " + std::to_string(m) + "m " +
               std::to_string(s) + "s";
    if (m > 0)
        return std::to_string(m) + "m " + std::to_string(s) + "s";
    return std::to_string(s) + "s";
}

std::string formatBytes(double bytes) {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    static constexpr double KIB = 1024.0;
    if (!(bytes > 0.0))
        return "0 B";
    int u = 0;
    while (bytes >= KIB && u < 4) {
        bytes /= KIB;
        ++u;
    }
    char buf[32];
    if (u == 0)
        std::snprintf(buf, sizeof(buf), "%.0f %s", bytes, units[u]);
    else
        std::snprintf(buf, sizeof(buf), "%.1f %s", bytes, units[u]);
    return buf;
}

std::string CopyReport::summaryLine() const {
    std::string line = "Copied " + std::to_string(filesCompleted) +
                       " file(s), " + formatBytes(double(bytesCopied)) +
                       " in " + formatElapsed(elapsed);
    if (filesSkipped > 0)
        line += ", " + std::to_string(filesSkipped) + " skipped";
    if (filesFailed > 0)
        line += ", " + std::to_string(filesFailed) + " failed";
    if (cancelled)
        line += " (cancelled)";
    return line;
}

} // namespace opencopy
