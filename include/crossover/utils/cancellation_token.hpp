#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace crossover::utils {

// Cooperative stop flag shared between the polling loop and whoever
// requests shutdown (signal handler thread, tests).
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Blocks for up to `timeout`. Returns true if cancelled before it elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace crossover::utils
