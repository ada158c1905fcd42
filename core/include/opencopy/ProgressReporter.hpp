// Turns session counters into hierarchical progress snapshots.
#pragma once
#include "CopySession.hpp"
#include "CopyTypes.hpp"
#include <chrono>
#include <vector>

namespace opencopy {

// External renderer. Snapshots with `completed` set are terminal for their
// bar id.
class ProgressRenderer {
public:
    virtual ~ProgressRenderer() = default;
    virtual void render(const ProgressSnapshot& snapshot) = 0;
};

class ProgressReporter {
public:
    using clock = std::chrono::steady_clock;

    static constexpr int kOverallBarId = 1;
    static constexpr int kFileBarId = 2;

    // renderer may be null (no output, counters still tracked).
    ProgressReporter(ProgressRenderer* renderer,
                     std::chrono::milliseconds interval);

    // Opens the bars (two for multi-file batches, one otherwise) and emits the
    // initial 0% state.
    void begin(const CopySession& session, clock::time_point now);

    // Emits the current state unless the previous emission is younger than
    // the interval. `force` bypasses throttling (file start and end).
    // Returns true when something was emitted.
    bool update(const CopySession& session, clock::time_point now,
                bool force = false);

    // Emits a completed state for every opened bar.
    void finish(const CopySession& session);

    bool multiBar() const { return multiBar_; }
    const std::vector<int>& openBars() const { return openBars_; }

private:
    ProgressRenderer* renderer_;
    std::chrono::milliseconds interval_;
    bool multiBar_ = false;
    bool emitted_ = false;
    clock::time_point lastEmit_{};
    std::vector<int> openBars_;

    void emit(const CopySession& session, bool completed);
    ProgressSnapshot overallSnapshot(const CopySession& session) const;
    ProgressSnapshot fileSnapshot(const CopySession& session) const;
};

} // namespace opencopy
