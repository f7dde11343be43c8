#pragma once

#include <atomic>

namespace replica::session {

// Single slot written by the input layer and drained once per cycle by the
// session driver. Repeated requests before a drain collapse into one.
class SpawnMailbox final {
public:
    void Request() {
        requested_.store(true, std::memory_order_release);
    }

    bool TryConsume() {
        return requested_.exchange(false, std::memory_order_acq_rel);
    }

    bool IsPending() const {
        return requested_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> requested_{false};
};

}  // namespace replica::session
