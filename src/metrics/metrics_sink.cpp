#include "metrics_sink.h"
#include "../common/types.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <filesystem>

namespace deskpilot {

std::string metricsEventKindToString(MetricsEventKind kind) {
    switch (kind) {
        case MetricsEventKind::PERCEPTION_ATTEMPT: return "PerceptionAttempt";
        case MetricsEventKind::MODEL_ATTEMPT: return "ModelAttempt";
        case MetricsEventKind::SAFETY_DECISION_MADE: return "SafetyDecisionMade";
        case MetricsEventKind::ACTION_ATTEMPT: return "ActionAttempt";
        case MetricsEventKind::CYCLE_COMPLETED: return "CycleCompleted";
        case MetricsEventKind::RUN_TERMINATED: return "RunTerminated";
        case MetricsEventKind::CONFIRMATION_REQUESTED: return "ConfirmationRequested";
        case MetricsEventKind::CONFIRMATION_RESOLVED: return "ConfirmationResolved";
        case MetricsEventKind::AUDIT: return "Audit";
        case MetricsEventKind::RUN_PAUSED: return "RunPaused";
        case MetricsEventKind::RUN_RESUMED: return "RunResumed";
        default: return "Unknown";
    }
}

nlohmann::json MetricsEvent::toJson() const {
    return {
        {"event", metricsEventKindToString(kind)},
        {"run_id", runId},
        {"sequence", sequence},
        {"timestamp", formatIsoTimestamp(timestamp)},
        {"data", data}
    };
}

// AsyncMetricsSink implementation
AsyncMetricsSink::AsyncMetricsSink(size_t queueCapacity)
    : m_queue(queueCapacity == 0 ? 1 : queueCapacity)
    , m_pending(0)
    , m_stopped(false) {
    m_worker = std::thread(&AsyncMetricsSink::workerLoop, this);
}

AsyncMetricsSink::~AsyncMetricsSink() {
    stop();
}

void AsyncMetricsSink::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.push_back(std::move(listener));
}

void AsyncMetricsSink::record(const MetricsEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        ++m_pending;
    }

    if (m_stopped || !m_queue.push(event)) {
        {
            std::lock_guard<std::mutex> lock(m_pendingMutex);
            --m_pending;
        }
        m_pendingCondition.notify_all();

        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.dropped++;
        return;
    }

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.recorded++;
    m_stats.eventCounts[event.kind]++;
}

void AsyncMetricsSink::flush() {
    std::unique_lock<std::mutex> lock(m_pendingMutex);
    m_pendingCondition.wait_for(lock, std::chrono::seconds(5), [this] { return m_pending == 0; });
}

void AsyncMetricsSink::stop() {
    if (m_stopped.exchange(true)) {
        return;
    }
    m_queue.close();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

AsyncMetricsSink::Statistics AsyncMetricsSink::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

void AsyncMetricsSink::workerLoop() {
    // pop() drains remaining events after close()
    while (auto event = m_queue.pop()) {
        dispatch(*event);
        {
            std::lock_guard<std::mutex> lock(m_pendingMutex);
            --m_pending;
        }
        m_pendingCondition.notify_all();
    }
}

void AsyncMetricsSink::dispatch(const MetricsEvent& event) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listeners = m_listeners;
    }

    size_t failures = 0;
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            failures++;
            SLOG_WARNING().message("Metrics listener failed")
                .context("event", metricsEventKindToString(event.kind))
                .context("error", e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.delivered++;
    m_stats.listenerFailures += failures;
}

// JsonlMetricsWriter implementation
JsonlMetricsWriter::JsonlMetricsWriter(const std::string& path) : m_path(path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    m_file.open(path, std::ios::app);
    if (!m_file.is_open()) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Cannot open metrics file", path, "JsonlMetricsWriter");
    }
}

void JsonlMetricsWriter::write(const MetricsEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file << event.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    m_file.flush();
}

} // namespace deskpilot
