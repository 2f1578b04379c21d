#include "thread_pool.h"
#include "structured_logger.h"

namespace deskpilot {

ThreadPool::ThreadPool(size_t numThreads)
    : m_stopping(false)
    , m_busy(0) {

    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 4;
        }
    }

    SLOG_DEBUG().message("Starting worker pool").context("workers", numThreads);

    for (size_t i = 0; i < numThreads; ++i) {
        m_workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown(false);
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });

            if (m_stopping && m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores any exception in the future
        m_busy++;
        task();
        m_busy--;
    }
}

void ThreadPool::shutdown(bool drain) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;

        if (!drain) {
            dropped = m_tasks.size();
            std::queue<std::function<void()>> empty;
            std::swap(m_tasks, empty);
        }
    }
    m_condition.notify_all();

    if (m_busy > 0) {
        SLOG_DEBUG().message("Waiting for abandoned calls to return")
            .context("busy_workers", m_busy.load())
            .context("dropped_calls", dropped);
    }

    for (std::thread& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace deskpilot
