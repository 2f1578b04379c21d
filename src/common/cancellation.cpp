#include "cancellation.h"

namespace deskpilot {

bool CancellationToken::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled.load(std::memory_order_relaxed)) {
            return false;
        }
        m_reason = reason;
        m_cancelledAt = std::chrono::steady_clock::now();
        m_cancelled.store(true, std::memory_order_release);
    }
    m_condition.notify_all();
    return true;
}

std::string CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason;
}

std::optional<std::chrono::steady_clock::time_point> CancellationToken::cancelledAt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_cancelled.load(std::memory_order_relaxed)) {
        return std::nullopt;
    }
    return m_cancelledAt;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, duration, [this] {
        return m_cancelled.load(std::memory_order_relaxed);
    });
}

} // namespace deskpilot
