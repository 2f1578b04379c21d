#ifndef DESKPILOT_METRICS_SINK_H
#define DESKPILOT_METRICS_SINK_H

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <condition_variable>
#include <nlohmann/json.hpp>
#include "../common/thread_safe_queue.h"

namespace deskpilot {

enum class MetricsEventKind {
    PERCEPTION_ATTEMPT,
    MODEL_ATTEMPT,
    SAFETY_DECISION_MADE,
    ACTION_ATTEMPT,
    CYCLE_COMPLETED,
    RUN_TERMINATED,
    CONFIRMATION_REQUESTED,
    CONFIRMATION_RESOLVED,
    AUDIT,
    RUN_PAUSED,
    RUN_RESUMED
};

std::string metricsEventKindToString(MetricsEventKind kind);

/**
 * @brief Read-only copy of something that happened during a run
 *
 * sequence is the originating cycle (0 for run-level events before the first cycle).
 */
struct MetricsEvent {
    MetricsEventKind kind;
    std::string runId;
    uint64_t sequence;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json data;

    MetricsEvent(MetricsEventKind k, const std::string& run, uint64_t seq,
                 const nlohmann::json& payload = nlohmann::json::object())
        : kind(k), runId(run), sequence(seq),
          timestamp(std::chrono::system_clock::now()), data(payload) {}

    nlohmann::json toJson() const;
};

/**
 * @brief Fire-and-forget event recorder
 *
 * record() must return after at most a bounded enqueue.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void record(const MetricsEvent& event) = 0;
    virtual void flush() {}
};

/**
 * @brief Bounded queue drained by a worker thread that fans events out to listeners
 *
 * A full queue drops the event and counts the drop. Listener exceptions are
 * logged and do not stop delivery.
 */
class AsyncMetricsSink : public MetricsSink {
public:
    using Listener = std::function<void(const MetricsEvent&)>;

    struct Statistics {
        std::map<MetricsEventKind, size_t> eventCounts;
        size_t recorded = 0;
        size_t delivered = 0;
        size_t dropped = 0;
        size_t listenerFailures = 0;
    };

    explicit AsyncMetricsSink(size_t queueCapacity = 1024);
    ~AsyncMetricsSink() override;

    AsyncMetricsSink(const AsyncMetricsSink&) = delete;
    AsyncMetricsSink& operator=(const AsyncMetricsSink&) = delete;

    void addListener(Listener listener);

    void record(const MetricsEvent& event) override;

    /**
     * @brief Wait until every accepted event has been delivered (bounded wait)
     */
    void flush() override;

    /**
     * @brief Deliver what is queued, then stop the worker. Later events are dropped.
     */
    void stop();

    Statistics getStatistics() const;

private:
    void workerLoop();
    void dispatch(const MetricsEvent& event);

    ThreadSafeQueue<MetricsEvent> m_queue;
    std::vector<Listener> m_listeners;
    mutable std::mutex m_listenerMutex;

    mutable std::mutex m_statsMutex;
    Statistics m_stats;

    std::mutex m_pendingMutex;
    std::condition_variable m_pendingCondition;
    size_t m_pending;

    std::atomic<bool> m_stopped;
    std::thread m_worker;
};

/**
 * @brief Appends one JSON object per event to a file (metrics.jsonl)
 */
class JsonlMetricsWriter {
public:
    /**
     * @throws DeskpilotException CONFIGURATION_ERROR if the file cannot be opened
     */
    explicit JsonlMetricsWriter(const std::string& path);

    void write(const MetricsEvent& event);
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    std::ofstream m_file;
    std::mutex m_mutex;
};

} // namespace deskpilot

#endif // DESKPILOT_METRICS_SINK_H
