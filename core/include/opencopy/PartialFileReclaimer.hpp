// Best-effort removal of partially written destination files.
#pragma once
#include "CopyTypes.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace opencopy {

class PartialFileReclaimer {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit PartialFileReclaimer(ReclaimPolicy policy = {},
                                  Sleeper sleeper = {});

    // Deletes `path`, relaxing permissions when needed and retrying with a
    // doubling backoff capped at policy.maxDelay. Returns true when the file
    // is gone (including when it never existed). On exhaustion returns false
    // and describes the last error in err.
    bool reclaim(const std::string& path, std::string& err);

    // Attempts used by the last reclaim() call.
    int lastAttempts() const { return lastAttempts_; }

    // Delay before retry number `attempt` (1-based).
    std::chrono::milliseconds backoffFor(int attempt) const;

private:
    ReclaimPolicy policy_;
    Sleeper sleeper_;
    int lastAttempts_ = 0;
};

} // namespace opencopy
