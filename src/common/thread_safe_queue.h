#ifndef DESKPILOT_THREAD_SAFE_QUEUE_H
#define DESKPILOT_THREAD_SAFE_QUEUE_H

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>

namespace deskpilot {

/**
 * @brief FIFO hand-off between producer threads and one consumer thread
 * @tparam T Element type
 *
 * push() never blocks: it fails when the queue is closed or full, and the
 * caller decides whether that counts as a drop. Consumers drain what is left
 * after close().
 */
template<typename T>
class ThreadSafeQueue {
public:
    /**
     * @param capacity Maximum number of queued items, 0 for unbounded
     */
    explicit ThreadSafeQueue(size_t capacity = 0) : m_capacity(capacity), m_closed(false) {}

    /**
     * @return true if queued, false if the queue is closed or at capacity
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || (m_capacity != 0 && m_queue.size() >= m_capacity)) {
                return false;
            }
            m_queue.push(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    /**
     * @brief Wait for the next item
     * @return The item, or empty once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return !m_queue.empty() || m_closed; });
        return takeFront();
    }

    /**
     * @brief Wait up to timeout for the next item
     */
    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_closed; });
        return takeFront();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return takeFront();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    // Rejects further pushes and wakes every waiter
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

private:
    // Caller holds m_mutex
    std::optional<T> takeFront() {
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop();
        return item;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::queue<T> m_queue;
    const size_t m_capacity;
    bool m_closed;
};

} // namespace deskpilot

#endif // DESKPILOT_THREAD_SAFE_QUEUE_H
