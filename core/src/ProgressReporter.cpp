#include "opencopy/ProgressReporter.hpp"

#include <filesystem>

namespace opencopy {

namespace {

std::string displayName(const CopySession& session) {
    if (session.currentIndex >= session.tasks.size())
        return {};
    const FileTask& t = session.tasks[session.currentIndex];
    if (!t.relativePath.empty())
        return t.relativePath;
    return std::filesystem::path(t.sourcePath).filename().string();
}

std::string speedText(double bytesPerSec) {
    return formatBytes(bytesPerSec) + "/s";
}

} // namespace

ProgressReporter::ProgressReporter(ProgressRenderer* renderer,
                                   std::chrono::milliseconds interval)
    : renderer_(renderer), interval_(interval) {}

void ProgressReporter::begin(const CopySession& session,
                             clock::time_point now) {
    multiBar_ = session.tasks.size() > 1;
    openBars_.clear();
    openBars_.push_back(kOverallBarId);
    if (multiBar_)
        openBars_.push_back(kFileBarId);
    emitted_ = false;
    (void)update(session, now, true);
}

bool ProgressReporter::update(const CopySession& session,
                              clock::time_point now, bool force) {
    if (openBars_.empty())
        return false;
    if (!force && emitted_ && now - lastEmit_ < interval_)
        return false;
    emitted_ = true;
    lastEmit_ = now;
    emit(session, false);
    return true;
}

void ProgressReporter::finish(const CopySession& session) {
    if (openBars_.empty())
        return;
    emit(session, true);
    openBars_.clear();
}

void ProgressReporter::emit(const CopySession& session, bool completed) {
    if (!renderer_)
        return;
    if (multiBar_) {
        ProgressSnapshot overall = overallSnapshot(session);
        overall.completed = completed;
        renderer_->render(overall);
        ProgressSnapshot file = fileSnapshot(session);
        file.completed = completed;
        renderer_->render(file);
        return;
    }
    // Single file: one bar carrying the file percent and the speed text.
    ProgressSnapshot s = fileSnapshot(session);
    s.barId = kOverallBarId;
    s.parentBarId.reset();
    s.overallPercent = s.filePercent;
    s.overallStatusText = s.currentFileName + " - " + speedText(s.speedBytesPerSec);
    s.completed = completed;
    renderer_->render(s);
}

ProgressSnapshot
ProgressReporter::overallSnapshot(const CopySession& session) const {
    ProgressSnapshot s;
    s.barId = kOverallBarId;
    s.overallPercent = progressPercent(session.overallBytes(), session.totalBytes);
    s.speedBytesPerSec = session.speed.current();
    s.currentFileName = displayName(session);
    s.overallStatusText = std::to_string(session.filesCompleted) + "/" +
                          std::to_string(session.tasks.size()) + " files, " +
                          formatBytes(double(session.overallBytes())) + " of " +
                          formatBytes(double(session.totalBytes)) + ", " +
                          speedText(s.speedBytesPerSec);
    s.filePercent =
        progressPercent(session.currentFileBytes, session.currentFileSize);
    return s;
}

ProgressSnapshot
ProgressReporter::fileSnapshot(const CopySession& session) const {
    ProgressSnapshot s;
    s.barId = kFileBarId;
    s.parentBarId = kOverallBarId;
    s.overallPercent = progressPercent(session.overallBytes(), session.totalBytes);
    s.currentFileName = displayName(session);
    s.filePercent =
        progressPercent(session.currentFileBytes, session.currentFileSize);
    s.speedBytesPerSec = session.speed.current();
    s.overallStatusText = s.currentFileName;
    return s;
}

} // namespace opencopy
