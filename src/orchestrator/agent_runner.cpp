#include "agent_runner.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace deskpilot {

RunHandle::RunHandle(std::unique_ptr<CycleOrchestrator> orchestrator)
    : m_orchestrator(std::move(orchestrator))
    , m_waitingForResume(false)
    , m_resumeRequested(false) {
    if (!m_orchestrator) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Run handle needs an orchestrator", "", "RunHandle");
    }
    m_thread = std::thread(&RunHandle::runLoop, this);
}

RunHandle::~RunHandle() {
    if (!finished()) {
        abort();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool RunHandle::confirm(uint64_t sequence, bool approved) {
    return m_orchestrator->confirmations()->deliver(sequence, approved);
}

bool RunHandle::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_waitingForResume || m_resumeRequested) {
            return false;
        }
        m_resumeRequested = true;
    }
    m_condition.notify_all();
    return true;
}

void RunHandle::abort() {
    m_orchestrator->requestAbort();
    m_condition.notify_all();
}

bool RunHandle::emergencyStop(const std::string& reason) {
    bool raised = m_orchestrator->emergencyStop(reason);
    m_condition.notify_all();
    return raised;
}

RunOutcome RunHandle::wait() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return m_final.has_value(); });
    return *m_final;
}

bool RunHandle::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] { return m_final.has_value(); });
}

bool RunHandle::finished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_final.has_value();
}

std::optional<RunOutcome> RunHandle::lastPausedOutcome() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastPaused;
}

bool RunHandle::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waitingForResume && !m_resumeRequested;
}

std::vector<CycleRecord> RunHandle::history() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_final && !m_waitingForResume) {
        return {};
    }
    return m_orchestrator->history().records();
}

void RunHandle::runLoop() {
    auto token = m_orchestrator->token();
    const auto poll = m_orchestrator->config().cancellationPoll;

    while (true) {
        RunOutcome outcome;
        try {
            outcome = m_orchestrator->run();
        } catch (const std::exception& e) {
            // An unexpected failure inside a cycle ends the run as an emergency stop
            DESKPILOT_HANDLE_ERROR(ErrorType::UNKNOWN_ERROR, ErrorSeverity::CRITICAL,
                                   "Run loop failed", e.what(), "RunHandle");
            m_orchestrator->emergencyStop(std::string("internal error: ") + e.what());
            outcome = m_orchestrator->abort();
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        if (outcome.verdict == RunVerdict::TERMINATED) {
            m_final = std::move(outcome);
            m_waitingForResume = false;
            lock.unlock();
            m_condition.notify_all();
            return;
        }

        m_lastPaused = outcome;
        m_waitingForResume = true;
        m_resumeRequested = false;
        m_condition.notify_all();

        SLOG_INFO().message("Run waiting for resume or abort")
            .context("run_id", m_orchestrator->runId())
            .context("reason", outcome.detail);

        while (!m_resumeRequested && !token->isCancelled()) {
            m_condition.wait_for(lock, poll);
        }

        const bool resumeRequested = m_resumeRequested;
        m_waitingForResume = false;
        m_resumeRequested = false;
        lock.unlock();

        if (token->isCancelled()) {
            RunOutcome finalOutcome = m_orchestrator->abort();
            {
                std::lock_guard<std::mutex> guard(m_mutex);
                m_final = std::move(finalOutcome);
            }
            m_condition.notify_all();
            return;
        }
        if (resumeRequested) {
            m_orchestrator->resume();
        }
    }
}

std::unique_ptr<RunHandle> AgentRunner::start(Goal goal, RunConfig config,
                                              AgentCollaborators collaborators,
                                              std::string runId) {
    auto orchestrator = std::make_unique<CycleOrchestrator>(std::move(goal), std::move(config),
                                                            std::move(collaborators), std::move(runId));
    return std::make_unique<RunHandle>(std::move(orchestrator));
}

} // namespace deskpilot
