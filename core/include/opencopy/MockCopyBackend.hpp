#pragma once
#include "CopyBackend.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace opencopy {

// Scriptable backend: configurable availability and per-file failures.
// Successful copies go through std::filesystem in one step.
class MockCopyBackend : public CopyBackend {
public:
  explicit MockCopyBackend(bool available = true,
                           CopyIssueKind failureKind = CopyIssueKind::NativeCopy);

  const char* name() const override { return "mock"; }
  bool probe(std::string& err) override;
  FileCopyResult copy(const FileTask& task,
                      std::uint64_t fileSize,
                      ProgressSink& sink,
                      const CancellationToken& cancel) override;
  CopyIssueKind failureKind() const override { return failureKind_; }

  // Transfers of `sourcePath` write a few bytes and then fail with osError.
  void failOn(const std::string& sourcePath, int osError);

  int probeCalls() const { return probeCalls_; }
  int copyCalls() const { return static_cast<int>(copied_.size()); }
  const std::vector<std::string>& attempted() const { return copied_; }

private:
  bool available_;
  CopyIssueKind failureKind_;
  int probeCalls_ = 0;
  std::vector<std::string> copied_;
  std::unordered_map<std::string, int> failures_;
};

} // namespace opencopy
