#include "opencopy/SpeedEstimator.hpp"

namespace opencopy {

double SpeedEstimator::sample(clock::time_point now,
                              std::uint64_t cumulativeBytes) {
    if (!hasReference_) {
        hasReference_ = true;
        refTime_ = now;
        refBytes_ = cumulativeBytes;
        return current_;
    }

    const double dt =
        std::chrono::duration_cast<std::chrono::duration<double>>(now -
                                                                  refTime_)
            .count();
    if (dt <= 0.0)
        return 0.0;

    if (cumulativeBytes < refBytes_) {
        // Counter restarted (next file): re-anchor, keep the history.
        refTime_ = now;
        refBytes_ = cumulativeBytes;
        return current_;
    }

    const double rate = double(cumulativeBytes - refBytes_) / dt;
    if (count_ == kCapacity) {
        sum_ -= rates_[head_];
    } else {
        ++count_;
    }
    rates_[head_] = rate;
    sum_ += rate;
    head_ = (head_ + 1) % kCapacity;

    refTime_ = now;
    refBytes_ = cumulativeBytes;

    current_ = sum_ / double(count_);
    // Accumulated rounding in sum_ must not leak a tiny negative mean.
    if (current_ < 0.0)
        current_ = 0.0;
    return current_;
}

void SpeedEstimator::reset() {
    rates_.fill(0.0);
    head_ = 0;
    count_ = 0;
    sum_ = 0.0;
    current_ = 0.0;
    hasReference_ = false;
    refBytes_ = 0;
}

} // namespace opencopy
