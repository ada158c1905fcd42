#pragma once
#include "CopyBackend.hpp"
#include <chrono>
#include <string>

namespace opencopy {

// Flags requested from the OS copy primitive for one file.
struct NativeCopyFlags {
  bool unbuffered = false;          // bypass the page cache for large files
  bool compressNetwork = false;     // destination is on a network share
};

// Backend on top of the kernel bulk-copy primitive (copy_file_range on
// Linux). The primitive runs in chunks and the sink is called once before the
// first chunk and after each one, like an OS progress routine. Pairs of files
// the kernel refuses (cross-filesystem) are finished with read/write.
class NativeCopyBackend : public CopyBackend {
public:
  explicit NativeCopyBackend(std::uint64_t unbufferedThreshold = 10 * kMiB,
                             std::size_t chunkSize = 8 * kMiB);

  const char* name() const override { return "native"; }
  bool probe(std::string& err) override;
  FileCopyResult copy(const FileTask& task,
                      std::uint64_t fileSize,
                      ProgressSink& sink,
                      const CancellationToken& cancel) override;
  CopyIssueKind failureKind() const override { return CopyIssueKind::NativeCopy; }

  NativeCopyFlags selectFlags(const FileTask& task, std::uint64_t fileSize) const;

  // True for "//server/share" and "\\server\share" paths.
  static bool isUncPath(const std::string& path);
  // True when the path (or its closest existing parent) lives on NFS/SMB.
  static bool isNetworkPath(const std::string& path);

private:
  std::uint64_t unbufferedThreshold_;
  std::size_t chunkSize_;
};

} // namespace opencopy
