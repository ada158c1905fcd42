// Streamed backend: plain buffered read/write loop with cooperative
// cancellation before every read and every write.
#include "opencopy/StreamedCopyBackend.hpp"
#include "opencopy/CancellationToken.hpp"
#include "../FileGuards.hpp"

#include <cerrno>
#include <cstdio>
#include <vector>

namespace opencopy {

StreamedCopyBackend::StreamedCopyBackend(
    std::size_t bufferSize, std::chrono::milliseconds progressInterval)
    : bufferSize_(bufferSize > 0 ? bufferSize : 4 * kMiB),
      progressInterval_(progressInterval) {}

bool StreamedCopyBackend::probe(std::string& err) {
    err.clear();
    return true;
}

FileCopyResult StreamedCopyBackend::copy(const FileTask& task,
                                         std::uint64_t fileSize,
                                         ProgressSink& sink,
                                         const CancellationToken& cancel) {
    FileCopyResult res;

    detail::FileGuard src(std::fopen(task.sourcePath.c_str(), "rb"));
    if (!src.f) {
        res.osError = errno;
        res.error = "Could not open source for reading: " +
                    detail::errnoText(res.osError);
        return res;
    }
    detail::FileGuard dst(std::fopen(task.destPath.c_str(), "wb"));
    if (!dst.f) {
        res.osError = errno;
        res.error = "Could not open destination for writing: " +
                    detail::errnoText(res.osError);
        return res;
    }
    res.destinationTouched = true;
    // We already write whole chunks; stdio buffering would only add a copy.
    std::setvbuf(dst.f, nullptr, _IONBF, 0);

    using clock = std::chrono::steady_clock;
    std::vector<char> buf(bufferSize_);
    std::uint64_t done = 0;
    bool quiet = false;
    auto lastEmit = clock::now();

    // Returns false when the sink asked to cancel.
    auto report = [&](bool force) -> bool {
        if (quiet)
            return true;
        const auto now = clock::now();
        if (!force && now - lastEmit <= progressInterval_)
            return true;
        lastEmit = now;
        const ProgressAction a = sink.onProgress({done, fileSize});
        if (a == ProgressAction::Quiet)
            quiet = true;
        return a != ProgressAction::Cancel;
    };

    auto cancelled = [&]() {
        res.status = CopyStatus::Cancelled;
        res.bytesCopied = done;
        res.error = "Cancelled";
        return res;
    };

    if (!report(true))
        return cancelled();

    while (true) {
        if (cancel.isRequested())
            return cancelled();
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), src.f);
        if (n == 0) {
            if (std::ferror(src.f)) {
                res.osError = errno;
                res.bytesCopied = done;
                res.error = "Read failed: " + detail::errnoText(res.osError);
                return res;
            }
            break; // EOF
        }
        if (cancel.isRequested())
            return cancelled();
        if (std::fwrite(buf.data(), 1, n, dst.f) != n) {
            res.osError = errno;
            res.bytesCopied = done;
            res.error = "Write failed: " + detail::errnoText(res.osError);
            return res;
        }
        done += n;
        if (!report(false))
            return cancelled();
    }

    if (const int rc = dst.close(); rc != 0) {
        res.osError = rc;
        res.bytesCopied = done;
        res.error = "Closing destination failed: " + detail::errnoText(rc);
        return res;
    }
    (void)src.close();

    res.status = CopyStatus::Completed;
    res.bytesCopied = done;
    // Final state; the whole file is on disk, a late cancel applies to the
    // next file.
    (void)report(true);
    return res;
}

} // namespace opencopy
