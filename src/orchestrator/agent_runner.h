#ifndef DESKPILOT_AGENT_RUNNER_H
#define DESKPILOT_AGENT_RUNNER_H

#include <memory>
#include <mutex>
#include <thread>
#include <chrono>
#include <vector>
#include <optional>
#include <condition_variable>
#include "cycle_orchestrator.h"

namespace deskpilot {

/**
 * @class RunHandle
 * @brief Control surface for a run executing on its own thread
 *
 * The run thread owns the orchestrator. Callers steer it through confirm(),
 * resume(), abort() and emergencyStop(); all of them are thread-safe.
 * Destroying the handle aborts an unfinished run and joins the thread.
 */
class RunHandle {
public:
    explicit RunHandle(std::unique_ptr<CycleOrchestrator> orchestrator);
    ~RunHandle();

    RunHandle(const RunHandle&) = delete;
    RunHandle& operator=(const RunHandle&) = delete;

    const std::string& runId() const { return m_orchestrator->runId(); }
    RunPhase phase() const { return m_orchestrator->phase(); }

    /**
     * @brief Answer the confirmation for cycle sequence
     * @return false if that cycle was already resolved
     */
    bool confirm(uint64_t sequence, bool approved);

    /**
     * @return false unless the run is currently paused
     */
    bool resume();

    void abort();
    bool emergencyStop(const std::string& reason);

    // Final outcome; blocks until the run terminates
    RunOutcome wait();
    bool waitFor(std::chrono::milliseconds timeout);
    bool finished() const;

    // Outcome the run reported when it last paused
    std::optional<RunOutcome> lastPausedOutcome() const;
    bool isPaused() const;

    /**
     * @brief Retained cycles; empty while the run is executing a cycle
     */
    std::vector<CycleRecord> history() const;

    std::shared_ptr<CancellationToken> token() const { return m_orchestrator->token(); }
    std::shared_ptr<ConfirmationChannel> confirmations() const { return m_orchestrator->confirmations(); }

private:
    void runLoop();

    std::unique_ptr<CycleOrchestrator> m_orchestrator;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_waitingForResume;
    bool m_resumeRequested;
    std::optional<RunOutcome> m_final;
    std::optional<RunOutcome> m_lastPaused;

    std::thread m_thread;
};

/**
 * @brief Starts runs on background threads
 */
class AgentRunner {
public:
    /**
     * @throws DeskpilotException CONFIGURATION_ERROR as CycleOrchestrator does
     */
    static std::unique_ptr<RunHandle> start(Goal goal, RunConfig config,
                                            AgentCollaborators collaborators,
                                            std::string runId = "");
};

} // namespace deskpilot

#endif // DESKPILOT_AGENT_RUNNER_H
