#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace das_integrity {

/**
 * Shared cancellation signal.
 *
 * cancel() only stores to a lock-free atomic, so it may be called from a signal
 * handler. Work checks the flag at task boundaries; in-flight calls are never
 * interrupted.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * Sleep for the given duration, waking early once cancelled.
     * @return true if the full duration elapsed
     */
    bool sleep_for(std::chrono::milliseconds duration) const {
        constexpr std::chrono::milliseconds kSlice(50);
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (!is_cancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
        }
        return false;
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace das_integrity
