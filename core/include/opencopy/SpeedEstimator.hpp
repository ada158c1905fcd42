// Rolling throughput estimate over the last N instantaneous samples.
#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace opencopy {

class SpeedEstimator {
public:
    using clock = std::chrono::steady_clock;
    static constexpr std::size_t kCapacity = 100;

    // Feeds the cumulative byte counter observed at `now` and returns the
    // mean rate (bytes/s) of the retained samples. Returns 0 without touching
    // state when no time elapsed since the previous sample. A counter lower
    // than the previous one (new file) only moves the reference point.
    double sample(clock::time_point now, std::uint64_t cumulativeBytes);

    // Last value returned by sample(), 0 before any rate was recorded.
    double current() const { return current_; }
    std::size_t sampleCount() const { return count_; }
    void reset();

private:
    std::array<double, kCapacity> rates_{};
    std::size_t head_ = 0;   // next slot to write
    std::size_t count_ = 0;
    double sum_ = 0.0;
    double current_ = 0.0;

    bool hasReference_ = false;
    clock::time_point refTime_{};
    std::uint64_t refBytes_ = 0;
};

} // namespace opencopy
