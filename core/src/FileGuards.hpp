// Scope guards for raw file handles used by the backends.
#pragma once
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <unistd.h>

namespace opencopy {
namespace detail {

// Owns a POSIX descriptor; closes it on scope exit unless closed explicitly.
struct FdGuard {
    int fd = -1;

    FdGuard() = default;
    explicit FdGuard(int f) : fd(f) {}
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    ~FdGuard() {
        if (fd >= 0)
            ::close(fd);
    }

    // Closes now and reports the result (errno on failure, 0 on success).
    int close() {
        if (fd < 0)
            return 0;
        const int rc = ::close(fd);
        fd = -1;
        return rc == 0 ? 0 : errno;
    }
};

// Same for stdio streams.
struct FileGuard {
    std::FILE* f = nullptr;

    FileGuard() = default;
    explicit FileGuard(std::FILE* file) : f(file) {}
    FileGuard(const FileGuard&) = delete;
    FileGuard& operator=(const FileGuard&) = delete;
    ~FileGuard() {
        if (f)
            std::fclose(f);
    }

    int close() {
        if (!f)
            return 0;
        const int rc = std::fclose(f);
        f = nullptr;
        return rc == 0 ? 0 : errno;
    }
};

inline std::string errnoText(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) +
           ")";
}

} // namespace detail
} // namespace opencopy
