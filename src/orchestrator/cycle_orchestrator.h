#ifndef DESKPILOT_CYCLE_ORCHESTRATOR_H
#define DESKPILOT_CYCLE_ORCHESTRATOR_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "cycle_history.h"
#include "confirmation_channel.h"
#include "run_report.h"
#include "../common/types.h"
#include "../common/run_config.h"
#include "../common/cancellation.h"
#include "../common/thread_pool.h"
#include "../metrics/metrics_sink.h"
#include "../model_gateway/model_gateway.h"
#include "../safety/safety_gate.h"
#include "../ports/perception_port.h"
#include "../ports/action_port.h"

namespace deskpilot {

/**
 * @brief External capabilities a run drives
 *
 * metrics and confirmations are optional; a missing confirmation channel is
 * replaced by a private one nobody answers (every level-3 proposal times out).
 */
struct AgentCollaborators {
    std::shared_ptr<PerceptionPort> perception;
    std::shared_ptr<ActionPort> actions;
    std::vector<std::shared_ptr<ReasoningEndpoint>> endpoints;
    std::shared_ptr<MetricsSink> metrics;
    std::shared_ptr<ConfirmationChannel> confirmations;
};

enum class RunVerdict {
    PAUSED,
    TERMINATED
};

struct RunOutcome {
    RunVerdict verdict = RunVerdict::PAUSED;
    std::optional<TerminationReason> reason;
    std::string detail;
    RunReport report;

    bool goalSatisfied() const {
        return verdict == RunVerdict::TERMINATED && reason == TerminationReason::GOAL_SATISFIED;
    }

    nlohmann::json toJson() const;
};

/**
 * @brief Drives one run: perceive, reason, gate, act, monitor, repeat
 *
 * run(), resume() and abort() belong to the thread that owns the run; the
 * RunState behind them is never shared. phase(), emergencyStop() and
 * requestAbort() may be called from any thread.
 */
class CycleOrchestrator {
public:
    /**
     * @throws DeskpilotException CONFIGURATION_ERROR if the configuration is
     *         invalid or a required collaborator is missing
     */
    CycleOrchestrator(Goal goal, RunConfig config, AgentCollaborators collaborators,
                      std::string runId = "");
    ~CycleOrchestrator();

    CycleOrchestrator(const CycleOrchestrator&) = delete;
    CycleOrchestrator& operator=(const CycleOrchestrator&) = delete;

    /**
     * @brief Run cycles until the run stops or pauses
     *
     * After a PAUSED outcome call resume() and run() again, or abort().
     * Calling run() on a terminated run returns the final outcome again.
     */
    RunOutcome run();

    /**
     * @brief Leave Paused: clears the retry and failure counters (not the cycle budget)
     * @return false if the run is not paused
     */
    bool resume();

    /**
     * @brief End a paused or not yet started run
     *
     * Terminates with operator_abort, or with emergency_stop if the token was
     * already raised for another reason.
     */
    RunOutcome abort();

    // Thread-safe control
    void requestAbort();
    bool emergencyStop(const std::string& reason);

    RunPhase phase() const { return m_phase.load(); }
    bool isTerminated() const { return m_terminated.has_value(); }
    const std::string& runId() const { return m_runId; }
    const Goal& goal() const { return m_goal; }
    const RunConfig& config() const { return m_config; }

    std::shared_ptr<CancellationToken> token() const { return m_token; }
    std::shared_ptr<ConfirmationChannel> confirmations() const { return m_confirmations; }

    const CycleHistory& history() const { return m_history; }
    const RunReport& report() const { return m_report; }
    int consecutiveFailures() const { return m_consecutiveFailures; }

private:
    enum class CycleStep {
        CONTINUE,
        PAUSED,
        TERMINATED
    };

    enum class PhaseStatus {
        DONE,
        EXHAUSTED,
        CANCELLED
    };

    CycleStep runCycle();
    CycleStep monitor(CycleRecord record);

    PhaseStatus perceive(uint64_t sequence, Snapshot& snapshot, std::string& pauseReason);
    PhaseStatus reasonAbout(uint64_t sequence, const Snapshot& snapshot,
                            ActionProposal& proposal, std::string& pauseReason);
    SafetyDecision awaitConfirmation(uint64_t sequence, const ActionProposal& proposal,
                                     const SafetyDecision& pending, CycleRecord& record);
    ExecutionResult execute(uint64_t sequence, const ActionProposal& proposal);

    // True if the global failure counter now exceeds its threshold
    bool recordFailure();
    bool backoff(int attempt);

    CycleStep pause(const std::string& reason);
    CycleStep terminate(TerminationReason reason, const std::string& detail = "");
    CycleStep terminateOnCancellation();

    RunOutcome outcome() const;
    void setPhase(RunPhase phase);
    void emit(MetricsEventKind kind, uint64_t sequence, const nlohmann::json& data);
    void emitTerminated();

    const Goal m_goal;
    const RunConfig m_config;
    const std::string m_runId;

    std::shared_ptr<PerceptionPort> m_perception;
    std::shared_ptr<ActionPort> m_actions;
    std::shared_ptr<MetricsSink> m_metrics;
    std::shared_ptr<ConfirmationChannel> m_confirmations;
    std::shared_ptr<CancellationToken> m_token;

    SafetyGate m_safetyGate;
    std::unique_ptr<ThreadPool> m_pool;
    std::unique_ptr<ModelGateway> m_gateway;

    // RunState
    std::atomic<RunPhase> m_phase;
    CycleHistory m_history;
    RunReport m_report;
    uint64_t m_sequence;
    int m_consecutiveFailures;
    int m_executionFailureStreak;
    std::optional<std::string> m_lastFailure;
    std::string m_pauseReason;
    bool m_started;
    std::chrono::steady_clock::time_point m_startTime;
    std::optional<TerminationReason> m_terminated;
    std::string m_terminationDetail;
};

std::string runVerdictToString(RunVerdict verdict);
std::string generateRunId();

} // namespace deskpilot

#endif // DESKPILOT_CYCLE_ORCHESTRATOR_H
