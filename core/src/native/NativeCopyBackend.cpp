// Native backend: kernel-side bulk copy (copy_file_range) driven in chunks so
// progress and cancellation can be handled between them.
#include "opencopy/NativeCopyBackend.hpp"
#include "opencopy/CancellationToken.hpp"
#include "../FileGuards.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/vfs.h>
#endif

namespace opencopy {

namespace {

// statfs f_type values of network filesystems.
constexpr unsigned long kNfsMagic = 0x6969UL;
constexpr unsigned long kSmbMagic = 0x517BUL;
constexpr unsigned long kCifsMagic = 0xFF534D42UL;
constexpr unsigned long kSmb2Magic = 0xFE534D42UL;

FileCopyResult failure(int osError, const std::string& what) {
    FileCopyResult r;
    r.status = CopyStatus::Failed;
    r.osError = osError;
    r.error = what + ": " + detail::errnoText(osError);
    return r;
}

#if defined(__linux__)
// copy_file_range answers for a pair of files it cannot handle: EXDEV across
// filesystems (5.19+), EOPNOTSUPP/EINVAL where the filesystem lacks support.
bool kernelRefusedPair(int err) {
    return err == EXDEV || err == EOPNOTSUPP || err == ENOSYS ||
           err == EINVAL;
}

// Returns 0 or the errno of the failing write.
int writeAll(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        const ssize_t w = ::write(fd, data, len);
        if (w < 0) {
            if (errno == EINTR)
                continue;
            return errno;
        }
        data += w;
        len -= static_cast<std::size_t>(w);
    }
    return 0;
}

// Opens `path` for rewriting. A read-only copy left by an earlier run gets
// owner write back so the batch can be repeated with overwrite on.
int openDestination(const std::string& path) {
    const int oflags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    const int fd = ::open(path.c_str(), oflags, 0666);
    if (fd >= 0 || errno != EACCES)
        return fd;
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode) ||
        (st.st_mode & S_IWUSR) != 0 ||
        ::chmod(path.c_str(), (st.st_mode & 07777) | S_IWUSR) != 0) {
        errno = EACCES;
        return -1;
    }
    return ::open(path.c_str(), oflags, 0666);
}
#endif

} // namespace

NativeCopyBackend::NativeCopyBackend(std::uint64_t unbufferedThreshold,
                                     std::size_t chunkSize)
    : unbufferedThreshold_(unbufferedThreshold),
      chunkSize_(chunkSize > 0 ? chunkSize : 8 * kMiB) {}

bool NativeCopyBackend::probe(std::string& err) {
    err.clear();
#if defined(__linux__)
    detail::FdGuard src(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    detail::FdGuard dst(::open("/dev/null", O_WRONLY | O_CLOEXEC));
    if (src.fd < 0 || dst.fd < 0) {
        err = "Could not open /dev/null to probe copy_file_range";
        return false;
    }
    errno = 0;
    const ssize_t r =
        ::copy_file_range(src.fd, nullptr, dst.fd, nullptr, 1, 0);
    // Any answer other than "no such syscall" means the kernel has it
    // (character devices are rejected with EINVAL). Seccomp filters report
    // blocked syscalls as EPERM.
    if (r < 0 && (errno == ENOSYS || errno == EPERM)) {
        err = "copy_file_range unavailable: " + detail::errnoText(errno);
        return false;
    }
    return true;
#else
    err = "No native bulk-copy primitive on this platform";
    return false;
#endif
}

bool NativeCopyBackend::isUncPath(const std::string& path) {
    if (path.size() < 3)
        return false;
    const bool slashes = path[0] == '/' && path[1] == '/';
    const bool backslashes = path[0] == '\\' && path[1] == '\\';
    return (slashes || backslashes) && path[2] != '/' && path[2] != '\\';
}

bool NativeCopyBackend::isNetworkPath(const std::string& path) {
#if defined(__linux__)
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec)
        return false;
    // The destination usually does not exist yet; test its nearest ancestor.
    while (!p.empty() && !fs::exists(p, ec)) {
        const fs::path parent = p.parent_path();
        if (parent == p)
            break;
        p = parent;
    }
    if (p.empty())
        return false;
    struct statfs sfs {};
    if (::statfs(p.c_str(), &sfs) != 0)
        return false;
    const auto type = static_cast<unsigned long>(sfs.f_type);
    return type == kNfsMagic || type == kSmbMagic || type == kCifsMagic ||
           type == kSmb2Magic;
#else
    (void)path;
    return false;
#endif
}

NativeCopyFlags NativeCopyBackend::selectFlags(const FileTask& task,
                                               std::uint64_t fileSize) const {
    NativeCopyFlags f;
    f.unbuffered = fileSize > unbufferedThreshold_;
    f.compressNetwork = isUncPath(task.destPath) || isNetworkPath(task.destPath);
    return f;
}

FileCopyResult NativeCopyBackend::copy(const FileTask& task,
                                       std::uint64_t fileSize,
                                       ProgressSink& sink,
                                       const CancellationToken& cancel) {
#if defined(__linux__)
    const NativeCopyFlags flags = selectFlags(task, fileSize);

    detail::FdGuard src(::open(task.sourcePath.c_str(), O_RDONLY | O_CLOEXEC));
    if (src.fd < 0)
        return failure(errno, "Could not open source for reading");

    struct stat st {};
    if (::fstat(src.fd, &st) != 0)
        return failure(errno, "Could not stat source");

    detail::FdGuard dst(openDestination(task.destPath));
    if (dst.fd < 0)
        return failure(errno, "Could not open destination for writing");

    if (flags.unbuffered)
        (void)::posix_fadvise(src.fd, 0, 0, POSIX_FADV_SEQUENTIAL);

    std::uint64_t done = 0;
    bool quiet = false;

    // Progress routine; false means the transfer must stop.
    auto progress = [&]() -> bool {
        if (quiet)
            return !cancel.isRequested();
        const ProgressAction a = sink.onProgress({done, fileSize});
        if (a == ProgressAction::Quiet)
            quiet = true;
        return a != ProgressAction::Cancel;
    };

    auto cancelled = [&]() {
        FileCopyResult r;
        r.status = CopyStatus::Cancelled;
        r.bytesCopied = done;
        r.error = "Cancelled";
        r.destinationTouched = true;
        return r;
    };

    auto failed = [&](int e, const std::string& what) {
        FileCopyResult r = failure(e, what);
        r.bytesCopied = done;
        r.destinationTouched = true;
        return r;
    };

    if (!progress())
        return cancelled();

    bool readWrite = false;
    std::vector<char> buf;
    while (true) {
        ssize_t n = 0;
        if (!readWrite) {
            n = ::copy_file_range(src.fd, nullptr, dst.fd, nullptr,
                                  chunkSize_, 0);
            if (n < 0) {
                const int e = errno;
                if (e == EINTR)
                    continue;
                if (done == 0 && kernelRefusedPair(e)) {
                    // Different filesystems, or one without support for the
                    // primitive: finish with read/write like cp does.
                    readWrite = true;
                    buf.resize(chunkSize_);
                    continue;
                }
                if (cancel.isRequested())
                    return cancelled();
                return failed(e, "copy_file_range failed");
            }
        } else {
            if (cancel.isRequested())
                return cancelled();
            n = ::read(src.fd, buf.data(), buf.size());
            if (n < 0) {
                const int e = errno;
                if (e == EINTR)
                    continue;
                return failed(e, "Read failed");
            }
            if (n > 0) {
                if (cancel.isRequested())
                    return cancelled();
                if (const int e = writeAll(dst.fd, buf.data(),
                                           static_cast<std::size_t>(n));
                    e != 0)
                    return failed(e, "Write failed");
            }
        }
        if (n == 0)
            break; // EOF
        if (flags.unbuffered) {
            (void)::posix_fadvise(src.fd, static_cast<off_t>(done), n,
                                  POSIX_FADV_DONTNEED);
        }
        done += static_cast<std::uint64_t>(n);
        if (!progress())
            return cancelled();
    }

    // Permissions last, so a read-only source does not lock the copy while
    // it is being written.
    if (::fchmod(dst.fd, st.st_mode & 07777) != 0) {
        const int e = errno;
        if (e != EPERM && e != EOPNOTSUPP)
            return failed(e, "Could not apply source permissions");
    }
    if (flags.unbuffered) {
        if (::fdatasync(dst.fd) != 0)
            return failed(errno, "fdatasync failed");
        (void)::posix_fadvise(dst.fd, 0, 0, POSIX_FADV_DONTNEED);
    }
    if (const int rc = dst.close(); rc != 0)
        return failed(rc, "Closing destination failed");

    FileCopyResult r;
    r.status = CopyStatus::Completed;
    r.bytesCopied = done;
    r.destinationTouched = true;
    return r;
#else
    (void)task;
    (void)fileSize;
    (void)sink;
    (void)cancel;
    return failure(ENOSYS, "Native copy unavailable");
#endif
}

} // namespace opencopy
