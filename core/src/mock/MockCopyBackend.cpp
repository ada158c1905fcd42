#include "opencopy/MockCopyBackend.hpp"
#include "opencopy/CancellationToken.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace opencopy {

MockCopyBackend::MockCopyBackend(bool available, CopyIssueKind failureKind)
    : available_(available), failureKind_(failureKind) {}

bool MockCopyBackend::probe(std::string& err) {
  ++probeCalls_;
  if (!available_) {
    err = "Mock backend not available";
    return false;
  }
  err.clear();
  return true;
}

void MockCopyBackend::failOn(const std::string& sourcePath, int osError) {
  failures_[sourcePath] = osError;
}

FileCopyResult MockCopyBackend::copy(const FileTask& task,
                                     std::uint64_t fileSize,
                                     ProgressSink& sink,
                                     const CancellationToken& cancel) {
  copied_.push_back(task.sourcePath);
  FileCopyResult r;

  if (sink.onProgress({0, fileSize}) == ProgressAction::Cancel ||
      cancel.isRequested()) {
    r.status = CopyStatus::Cancelled;
    r.error = "Cancelled";
    return r;
  }

  auto it = failures_.find(task.sourcePath);
  if (it != failures_.end()) {
    // Leave a partial file behind, as an interrupted transfer would.
    std::ofstream out(task.destPath, std::ios::binary | std::ios::trunc);
    out << "partial";
    r.destinationTouched = true;
    r.osError = it->second;
    r.error = "Mock failure injected";
    return r;
  }

  std::error_code ec;
  std::filesystem::copy_file(task.sourcePath, task.destPath,
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  r.destinationTouched = true;
  if (ec) {
    r.osError = ec.value();
    r.error = ec.message();
    return r;
  }
  r.bytesCopied = fileSize;
  (void)sink.onProgress({fileSize, fileSize});
  r.status = CopyStatus::Completed;
  return r;
}

} // namespace opencopy
