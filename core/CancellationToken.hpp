#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace devsim {

/**
 * @brief One-shot cancellation signal shared between the orchestrator,
 *        the publish loops and the signal watcher
 *
 * Once cancelled a token stays cancelled. Waiters blocked in waitFor() are
 * woken immediately.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /// Sleep for up to @p duration; returns true if cancelled meanwhile
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace devsim
