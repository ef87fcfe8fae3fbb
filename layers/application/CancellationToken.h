#pragma once

#include <atomic>

namespace application {

// Set from a signal handler, polled between cycles and between unit reads.
class CancellationToken {
public:
    void requestStop() noexcept { stop_.store(true); }
    bool stopRequested() const noexcept { return stop_.load(); }
    void reset() noexcept { stop_.store(false); }

private:
    std::atomic<bool> stop_{false};
};

} // namespace application
