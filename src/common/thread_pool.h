#ifndef DESKPILOT_THREAD_POOL_H
#define DESKPILOT_THREAD_POOL_H

#include <vector>
#include <queue>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <stdexcept>
#include <atomic>

namespace deskpilot {

/**
 * @brief Fixed-size worker pool for collaborator calls
 *
 * Capture, inference and execution calls run here so the orchestrator thread
 * can wait on the returned future in short slices and abandon a call that
 * times out or is cancelled. An abandoned task keeps its worker until the
 * collaborator returns.
 */
class ThreadPool {
public:
    /**
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a collaborator call
     * @return Future for the call's result; an exception thrown by the call is
     *         rethrown from future::get()
     * @throws std::runtime_error once shutdown() has started
     */
    template<typename F>
    auto submit(F&& call) -> std::future<typename std::result_of<F()>::type> {
        using return_type = typename std::result_of<F()>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(call));
        std::future<return_type> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("Cannot submit a call to a stopping worker pool");
            }
            m_tasks.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return result;
    }

    /**
     * @brief Stop the workers and join them
     * @param drain If true, queued calls run first; otherwise they are dropped
     *        and their futures report broken_promise
     */
    void shutdown(bool drain = true);

    size_t size() const { return m_workers.size(); }
    size_t busyWorkers() const { return m_busy.load(); }

private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_stopping;
    std::atomic<size_t> m_busy;
};

} // namespace deskpilot

#endif // DESKPILOT_THREAD_POOL_H
