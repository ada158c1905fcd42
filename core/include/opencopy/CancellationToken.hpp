// Cooperative cancellation flag shared by the orchestrator and backends.
#pragma once
#include <atomic>

namespace opencopy {

// Checked at suspension points, never awaited. request() only touches a
// lock-free atomic, so it may be called from a signal handler.
class CancellationToken {
public:
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancellation flag must be usable from a signal handler");

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    bool isRequested() const {
        return requested_.load(std::memory_order_acquire);
    }
    void request() { requested_.store(true, std::memory_order_release); }

private:
    std::atomic<bool> requested_{false};
};

} // namespace opencopy
