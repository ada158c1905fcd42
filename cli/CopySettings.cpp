#include "CopySettings.hpp"

#include <QSettings>

namespace CopySettings {

namespace {

int positiveInt(QSettings& s, const char* key, int fallback) {
    bool ok = false;
    const int v = s.value(key, fallback).toInt(&ok);
    return (ok && v > 0) ? v : fallback;
}

} // namespace

opencopy::CopyOptions load(QSettings& s) {
    opencopy::CopyOptions opt;
    opt.overwrite = s.value("Copy/overwrite", opt.overwrite).toBool();
    const bool preferNative = s.value("Copy/preferNative", true).toBool();
    opt.backend = preferNative ? opencopy::BackendPreference::Native
                               : opencopy::BackendPreference::Streamed;
    opt.bufferSize = std::size_t(positiveInt(
                         s, "Copy/bufferKiB", int(opt.bufferSize / 1024))) *
                     1024;
    opt.unbufferedThreshold =
        std::uint64_t(positiveInt(s, "Copy/unbufferedThresholdMiB",
                                  int(opt.unbufferedThreshold / opencopy::kMiB))) *
        opencopy::kMiB;
    opt.progressInterval = std::chrono::milliseconds(positiveInt(
        s, "Progress/intervalMs", int(opt.progressInterval.count())));
    opt.reclaim.maxAttempts =
        positiveInt(s, "Cleanup/maxAttempts", opt.reclaim.maxAttempts);
    opt.reclaim.initialDelay = std::chrono::milliseconds(positiveInt(
        s, "Cleanup/initialDelayMs", int(opt.reclaim.initialDelay.count())));
    opt.reclaim.maxDelay = std::chrono::milliseconds(positiveInt(
        s, "Cleanup/maxDelayMs", int(opt.reclaim.maxDelay.count())));
    return opt;
}

void store(QSettings& s, const opencopy::CopyOptions& opt) {
    s.setValue("Copy/overwrite", opt.overwrite);
    s.setValue("Copy/preferNative",
               opt.backend == opencopy::BackendPreference::Native);
    s.setValue("Copy/bufferKiB", qulonglong(opt.bufferSize / 1024));
    s.setValue("Copy/unbufferedThresholdMiB",
               qulonglong(opt.unbufferedThreshold / opencopy::kMiB));
    s.setValue("Progress/intervalMs", qlonglong(opt.progressInterval.count()));
    s.setValue("Cleanup/maxAttempts", opt.reclaim.maxAttempts);
    s.setValue("Cleanup/initialDelayMs",
               qlonglong(opt.reclaim.initialDelay.count()));
    s.setValue("Cleanup/maxDelayMs", qlonglong(opt.reclaim.maxDelay.count()));
    s.sync();
}

} // namespace CopySettings
