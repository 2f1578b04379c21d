#ifndef DESKPILOT_CANCELLATION_H
#define DESKPILOT_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <algorithm>

namespace deskpilot {

/**
 * @brief Run-scoped emergency cell
 *
 * Set at most once; the first reason wins and the flag is never cleared.
 * Every suspension point of a run observes the same token.
 */
class CancellationToken {
public:
    CancellationToken() : m_cancelled(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Raise the flag and wake every waiter
     * @return true if this call set the flag, false if it was already set
     */
    bool cancel(const std::string& reason);

    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    std::string reason() const;
    std::optional<std::chrono::steady_clock::time_point> cancelledAt() const;

    /**
     * @brief Sleep for up to the given duration
     * @return true if the token was (or became) cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> m_cancelled;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    std::string m_reason;
    std::chrono::steady_clock::time_point m_cancelledAt;
};

enum class AwaitStatus {
    READY,
    TIMED_OUT,
    CANCELLED
};

/**
 * @brief Wait on a future with both a timeout and a cancellation check
 *
 * Waits in slices of at most pollInterval so a cancellation is observed within
 * one slice. A ready future wins over a simultaneous cancellation or timeout.
 * On TIMED_OUT or CANCELLED the future is left unconsumed; the caller abandons it.
 */
template<typename T>
AwaitStatus awaitWithCancellation(std::future<T>& future,
                                  std::chrono::milliseconds timeout,
                                  const CancellationToken& token,
                                  std::chrono::milliseconds pollInterval) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    if (pollInterval.count() <= 0) {
        pollInterval = std::chrono::milliseconds(1);
    }

    while (true) {
        if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            return AwaitStatus::READY;
        }
        if (token.isCancelled()) {
            return AwaitStatus::CANCELLED;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return AwaitStatus::TIMED_OUT;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto slice = std::min(remaining, pollInterval);
        if (slice.count() <= 0) {
            slice = std::chrono::milliseconds(1);
        }
        future.wait_for(slice);
    }
}

} // namespace deskpilot

#endif // DESKPILOT_CANCELLATION_H
