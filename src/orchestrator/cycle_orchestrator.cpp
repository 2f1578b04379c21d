#include "cycle_orchestrator.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <random>
#include <sstream>
#include <iomanip>

namespace deskpilot {

namespace {
    const char* const OPERATOR_ABORT_REASON = "operator abort";

    RunConfig validated(RunConfig config) {
        config.validate();
        return config;
    }

    std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }
}

std::string runVerdictToString(RunVerdict verdict) {
    switch (verdict) {
        case RunVerdict::PAUSED: return "paused";
        case RunVerdict::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

std::string generateRunId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dis(0, 0xFFFF);

    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    std::ostringstream oss;
    oss << "run_" << millis << "_" << std::hex << std::setw(4) << std::setfill('0') << dis(gen);
    return oss.str();
}

nlohmann::json RunOutcome::toJson() const {
    nlohmann::json json = {
        {"verdict", runVerdictToString(verdict)},
        {"detail", detail},
        {"report", report.toJson()}
    };
    json["reason"] = reason ? nlohmann::json(terminationReasonToString(*reason)) : nlohmann::json(nullptr);
    return json;
}

CycleOrchestrator::CycleOrchestrator(Goal goal, RunConfig config, AgentCollaborators collaborators,
                                     std::string runId)
    : m_goal(std::move(goal))
    , m_config(validated(std::move(config)))
    , m_runId(runId.empty() ? generateRunId() : std::move(runId))
    , m_perception(std::move(collaborators.perception))
    , m_actions(std::move(collaborators.actions))
    , m_metrics(std::move(collaborators.metrics))
    , m_confirmations(std::move(collaborators.confirmations))
    , m_token(std::make_shared<CancellationToken>())
    , m_safetyGate(m_config.riskTable, m_config.denylist)
    , m_phase(RunPhase::IDLE)
    , m_history(m_config.historyCapacity)
    , m_sequence(0)
    , m_consecutiveFailures(0)
    , m_executionFailureStreak(0)
    , m_started(false) {

    if (!m_perception || !m_actions) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "A run needs a perception port and an action port", "", "CycleOrchestrator");
    }
    if (m_goal.objective.empty()) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Goal objective is empty", "", "CycleOrchestrator");
    }
    if (!m_confirmations) {
        m_confirmations = std::make_shared<ConfirmationChannel>();
    }

    m_pool = std::make_unique<ThreadPool>(static_cast<size_t>(m_config.workerThreads));
    m_gateway = std::make_unique<ModelGateway>(std::move(collaborators.endpoints), *m_pool,
                                               m_metrics, m_config.cancellationPoll);

    m_report.runId = m_runId;
    m_report.objective = m_goal.objective;
}

CycleOrchestrator::~CycleOrchestrator() {
    // Abandoned calls still hold the token; let them unwind before the pool joins
    if (!m_terminated) {
        m_token->cancel("orchestrator destroyed");
    }
    m_gateway.reset();
    if (m_pool) {
        m_pool->shutdown(false);
    }
}

RunOutcome CycleOrchestrator::run() {
    if (m_terminated || m_phase == RunPhase::PAUSED) {
        return outcome();
    }

    if (!m_started) {
        m_started = true;
        m_startTime = std::chrono::steady_clock::now();
        m_report.startedAt = std::chrono::system_clock::now();

        SLOG_INFO().message("Run started")
            .context("run_id", m_runId)
            .context("objective", m_goal.objective)
            .context("endpoints", m_gateway->endpointNames())
            .context("max_cycles", m_config.maxCycles);
    }

    CycleStep step = CycleStep::CONTINUE;
    while (step == CycleStep::CONTINUE) {
        step = runCycle();
    }

    m_report.duration = elapsedSince(m_startTime);
    return outcome();
}

bool CycleOrchestrator::resume() {
    if (m_terminated || m_phase != RunPhase::PAUSED) {
        return false;
    }

    m_consecutiveFailures = 0;
    m_executionFailureStreak = 0;
    m_pauseReason.clear();

    emit(MetricsEventKind::RUN_RESUMED, m_sequence, {{"cycles_used", m_sequence}});
    SLOG_INFO().message("Run resumed").context("run_id", m_runId).cycle(m_sequence);
    setPhase(RunPhase::IDLE);
    return true;
}

RunOutcome CycleOrchestrator::abort() {
    if (!m_terminated) {
        if (!m_started) {
            m_started = true;
            m_startTime = std::chrono::steady_clock::now();
            m_report.startedAt = std::chrono::system_clock::now();
        }
        if (m_token->isCancelled()) {
            terminateOnCancellation();
        } else {
            terminate(TerminationReason::OPERATOR_ABORT, "aborted by operator");
        }
    }
    return outcome();
}

void CycleOrchestrator::requestAbort() {
    m_token->cancel(OPERATOR_ABORT_REASON);
}

bool CycleOrchestrator::emergencyStop(const std::string& reason) {
    if (!m_token->cancel(reason)) {
        return false;
    }
    DESKPILOT_HANDLE_ERROR(ErrorType::EMERGENCY_STOP, ErrorSeverity::CRITICAL,
                           "Emergency stop requested", reason, "CycleOrchestrator");
    return true;
}

CycleOrchestrator::CycleStep CycleOrchestrator::runCycle() {
    if (m_token->isCancelled()) {
        return terminateOnCancellation();
    }

    const uint64_t sequence = ++m_sequence;
    m_report.cycles = sequence;
    SLOG_DEBUG().message("Cycle started").cycle(sequence);

    std::string pauseReason;

    Snapshot snapshot;
    switch (perceive(sequence, snapshot, pauseReason)) {
        case PhaseStatus::CANCELLED: return terminateOnCancellation();
        case PhaseStatus::EXHAUSTED: return pause(pauseReason);
        case PhaseStatus::DONE: break;
    }

    ActionProposal proposal;
    switch (reasonAbout(sequence, snapshot, proposal, pauseReason)) {
        case PhaseStatus::CANCELLED: return terminateOnCancellation();
        case PhaseStatus::EXHAUSTED: return pause(pauseReason);
        case PhaseStatus::DONE: break;
    }

    if (proposal.goalSatisfied) {
        SLOG_INFO().message("Model reports goal satisfied")
            .context("rationale", proposal.rationale)
            .cycle(sequence);
        emit(MetricsEventKind::CYCLE_COMPLETED, sequence, {
            {"goal_satisfied", true},
            {"executed", false},
            {"history_size", m_history.size()}
        });
        return terminate(TerminationReason::GOAL_SATISFIED, proposal.rationale);
    }

    CycleRecord record;
    record.sequence = sequence;
    record.snapshot = summarizeSnapshot(snapshot);
    record.proposal = proposal;

    setPhase(RunPhase::SAFETY_CHECK);
    SafetyDecision decision = m_safetyGate.evaluate(proposal);
    emit(MetricsEventKind::SAFETY_DECISION_MADE, sequence, {
        {"action", actionKindToString(proposal.kind)},
        {"level", static_cast<int>(decision.level)},
        {"verdict", safetyVerdictToString(decision.verdict)},
        {"reason", decision.reason},
        {"matched_term", decision.matchedTerm}
    });

    const bool confirmationRequested = decision.verdict == SafetyVerdict::PENDING_CONFIRMATION;
    if (confirmationRequested) {
        decision = awaitConfirmation(sequence, proposal, decision, record);
    } else if (decision.verdict == SafetyVerdict::APPROVED_WITH_LOG) {
        SLOG_INFO().message("Action approved with log")
            .context("action", actionKindToString(proposal.kind))
            .context("target", proposal.target.toJson())
            .context("level", riskLevelToString(decision.level))
            .cycle(sequence);
        if (decision.audit) {
            emit(MetricsEventKind::AUDIT, sequence, {
                {"action", actionKindToString(proposal.kind)},
                {"target", proposal.target.toJson()},
                {"level", static_cast<int>(decision.level)},
                {"verdict", safetyVerdictToString(decision.verdict)},
                {"rationale", proposal.rationale}
            });
        }
    }
    record.decision = decision;

    if (!decision.permitsExecution()) {
        setPhase(RunPhase::BLOCKED);
        m_report.denials++;
        // Unanswered confirmations were already reported by awaitConfirmation()
        if (!confirmationRequested || record.confirmation.has_value()) {
            DESKPILOT_HANDLE_ERROR(ErrorType::SAFETY_DENIED, ErrorSeverity::LOW,
                                   "Action denied: " + actionKindToString(proposal.kind),
                                   decision.reason, "CycleOrchestrator");
        }
    } else {
        ExecutionResult result = execute(sequence, proposal);
        switch (result.status) {
            case ExecutionStatus::SUCCEEDED:
                m_report.actionsSucceeded++;
                m_executionFailureStreak = 0;
                m_consecutiveFailures = 0;
                m_lastFailure.reset();
                break;
            case ExecutionStatus::FAILED:
                m_report.actionsFailed++;
                m_executionFailureStreak++;
                recordFailure();
                m_lastFailure = actionKindToString(proposal.kind) + " failed: " + result.reason;
                DESKPILOT_HANDLE_ERROR(ErrorType::EXECUTION_FAILURE, ErrorSeverity::MEDIUM,
                                       "Action failed", result.reason, "CycleOrchestrator");
                break;
            case ExecutionStatus::CANCELLED:
                m_report.actionsCancelled++;
                break;
        }
        record.execution = result;
    }

    return monitor(std::move(record));
}

CycleOrchestrator::CycleStep CycleOrchestrator::monitor(CycleRecord record) {
    setPhase(RunPhase::MONITORING);

    const uint64_t sequence = record.sequence;
    nlohmann::json data = {
        {"goal_satisfied", false},
        {"executed", record.execution.has_value()},
        {"verdict", safetyVerdictToString(record.decision.verdict)}
    };
    if (record.execution) {
        data["status"] = executionStatusToString(record.execution->status);
    }

    m_history.append(std::move(record));
    data["history_size"] = m_history.size();
    data["consecutive_failures"] = m_consecutiveFailures;
    emit(MetricsEventKind::CYCLE_COMPLETED, sequence, data);

    if (m_token->isCancelled()) {
        return terminateOnCancellation();
    }

    const auto elapsed = elapsedSince(m_startTime);
    if (sequence >= static_cast<uint64_t>(m_config.maxCycles)) {
        return terminate(TerminationReason::CYCLE_BUDGET_EXCEEDED,
                         "cycle limit " + std::to_string(m_config.maxCycles) + " reached");
    }
    if (elapsed >= m_config.maxRunDuration) {
        return terminate(TerminationReason::CYCLE_BUDGET_EXCEEDED,
                         "run duration limit " + std::to_string(m_config.maxRunDuration.count()) + " ms reached");
    }

    if (m_executionFailureStreak >= m_config.retry.executionMaxConsecutiveFailures) {
        return pause(std::to_string(m_executionFailureStreak) + " consecutive action failures");
    }
    if (m_consecutiveFailures > m_config.retry.maxConsecutiveFailures) {
        return pause("consecutive failure threshold exceeded");
    }

    setPhase(RunPhase::IDLE);
    return CycleStep::CONTINUE;
}

CycleOrchestrator::PhaseStatus CycleOrchestrator::perceive(uint64_t sequence, Snapshot& snapshot,
                                                           std::string& pauseReason) {
    setPhase(RunPhase::PERCEIVING);

    const int maxAttempts = m_config.retry.perceptionMaxAttempts;
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        if (m_token->isCancelled()) {
            return PhaseStatus::CANCELLED;
        }

        auto perception = m_perception;
        auto token = m_token;
        const auto timeout = m_config.perceptionTimeout;
        const auto started = std::chrono::steady_clock::now();

        auto future = m_pool->submit([perception, token, timeout]() {
            return perception->capture(timeout, *token);
        });

        AwaitStatus status = awaitWithCancellation(future, timeout, *m_token, m_config.cancellationPoll);
        const auto latency = elapsedSince(started);

        nlohmann::json data = {
            {"attempt", attempt + 1},
            {"latency_ms", latency.count()}
        };

        if (status == AwaitStatus::CANCELLED) {
            data["success"] = false;
            data["outcome"] = "cancelled";
            emit(MetricsEventKind::PERCEPTION_ATTEMPT, sequence, data);
            return PhaseStatus::CANCELLED;
        }

        std::string failure;
        if (status == AwaitStatus::TIMED_OUT) {
            failure = "timed out after " + std::to_string(timeout.count()) + " ms";
            data["outcome"] = "timeout";
        } else {
            try {
                snapshot = future.get();
                data["success"] = true;
                data["outcome"] = "captured";
                data["snapshot_id"] = snapshot.id;
                emit(MetricsEventKind::PERCEPTION_ATTEMPT, sequence, data);
                return PhaseStatus::DONE;
            } catch (const std::exception& e) {
                failure = e.what();
                data["outcome"] = "error";
            }
        }

        m_report.perceptionFailures++;
        data["success"] = false;
        data["detail"] = failure;
        emit(MetricsEventKind::PERCEPTION_ATTEMPT, sequence, data);

        SLOG_WARNING().message("Perception attempt failed")
            .context("attempt", attempt + 1)
            .context("error", failure)
            .cycle(sequence);

        if (recordFailure()) {
            pauseReason = "consecutive failure threshold exceeded";
            return PhaseStatus::EXHAUSTED;
        }
        if (attempt + 1 < maxAttempts && backoff(attempt)) {
            return PhaseStatus::CANCELLED;
        }
    }

    DESKPILOT_HANDLE_ERROR(ErrorType::PERCEPTION_FAILURE, ErrorSeverity::HIGH,
                           "Perception failed on every attempt",
                           std::to_string(maxAttempts) + " attempts", "CycleOrchestrator");
    pauseReason = "perception failed " + std::to_string(maxAttempts) + " times";
    return PhaseStatus::EXHAUSTED;
}

CycleOrchestrator::PhaseStatus CycleOrchestrator::reasonAbout(uint64_t sequence, const Snapshot& snapshot,
                                                              ActionProposal& proposal,
                                                              std::string& pauseReason) {
    setPhase(RunPhase::REASONING);

    ReasoningRequest request;
    request.runId = m_runId;
    request.sequence = sequence;
    request.goal = m_goal;
    request.history = m_history.records();
    request.snapshot = summarizeSnapshot(snapshot);
    request.imageRef = snapshot.imageRef;
    request.lastFailure = m_lastFailure;

    const int maxAttempts = m_config.retry.reasoningMaxAttempts;
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        GatewayResult result = m_gateway->invoke(request, m_token);

        for (const auto& modelAttempt : result.attempts) {
            auto& usage = m_report.modelUsage[modelAttempt.endpoint];
            usage.attempts++;
            usage.totalLatency += modelAttempt.latency;
            if (modelAttempt.succeeded()) {
                usage.successes++;
            }
        }

        if (result.status == GatewayStatus::CANCELLED) {
            return PhaseStatus::CANCELLED;
        }

        if (result.status == GatewayStatus::OK && result.proposal) {
            proposal = *result.proposal;
            SLOG_INFO().message("Proposal received")
                .context("endpoint", result.endpoint)
                .context("action", actionKindToString(proposal.kind))
                .context("confidence", proposal.confidence)
                .cycle(sequence);
            return PhaseStatus::DONE;
        }

        m_report.reasoningExhaustions++;
        nlohmann::json attempts = nlohmann::json::array();
        for (const auto& modelAttempt : result.attempts) {
            attempts.push_back(modelAttempt.endpoint + ": " + attemptOutcomeToString(modelAttempt.outcome));
        }
        DESKPILOT_HANDLE_ERROR(ErrorType::REASONING_EXHAUSTED, ErrorSeverity::MEDIUM,
                               "Every model endpoint failed", attempts.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "CycleOrchestrator");

        if (recordFailure()) {
            pauseReason = "consecutive failure threshold exceeded";
            return PhaseStatus::EXHAUSTED;
        }
        if (attempt + 1 < maxAttempts && backoff(attempt)) {
            return PhaseStatus::CANCELLED;
        }
    }

    pauseReason = "reasoning exhausted after " + std::to_string(maxAttempts) + " attempts";
    return PhaseStatus::EXHAUSTED;
}

SafetyDecision CycleOrchestrator::awaitConfirmation(uint64_t sequence, const ActionProposal& proposal,
                                                    const SafetyDecision& pending, CycleRecord& record) {
    setPhase(RunPhase::AWAITING_CONFIRMATION);
    m_report.confirmationsRequested++;

    emit(MetricsEventKind::CONFIRMATION_REQUESTED, sequence, {
        {"action", actionKindToString(proposal.kind)},
        {"target", proposal.target.toJson()},
        {"rationale", proposal.rationale},
        {"window_ms", m_config.confirmationWindow.count()}
    });
    SLOG_INFO().message("Awaiting operator confirmation")
        .context("action", actionKindToString(proposal.kind))
        .context("window_ms", m_config.confirmationWindow.count())
        .cycle(sequence);

    ConfirmationResult answer = m_confirmations->awaitDecision(sequence, proposal, pending,
                                                               m_config.confirmationWindow, *m_token,
                                                               m_config.cancellationPoll);

    std::optional<bool> approved;
    if (answer == ConfirmationResult::APPROVED) {
        approved = true;
        m_report.confirmationsApproved++;
    } else if (answer == ConfirmationResult::DENIED) {
        approved = false;
    }
    record.confirmation = approved;

    SafetyDecision decision = m_safetyGate.resolveConfirmation(pending, approved);
    if (answer == ConfirmationResult::CANCELLED) {
        decision.reason = "run cancelled while awaiting confirmation";
    } else if (answer == ConfirmationResult::TIMED_OUT) {
        m_report.confirmationTimeouts++;
        DESKPILOT_HANDLE_ERROR(ErrorType::CONFIRMATION_TIMEOUT, ErrorSeverity::MEDIUM,
                               "Action denied: no confirmation within window",
                               actionKindToString(proposal.kind), "CycleOrchestrator");
    }

    emit(MetricsEventKind::CONFIRMATION_RESOLVED, sequence, {
        {"result", confirmationResultToString(answer)},
        {"verdict", safetyVerdictToString(decision.verdict)}
    });
    emit(MetricsEventKind::AUDIT, sequence, {
        {"action", actionKindToString(proposal.kind)},
        {"target", proposal.target.toJson()},
        {"level", static_cast<int>(decision.level)},
        {"verdict", safetyVerdictToString(decision.verdict)},
        {"confirmation", confirmationResultToString(answer)},
        {"rationale", proposal.rationale}
    });
    return decision;
}

ExecutionResult CycleOrchestrator::execute(uint64_t sequence, const ActionProposal& proposal) {
    setPhase(RunPhase::EXECUTING);

    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result;

    if (m_token->isCancelled()) {
        result = ExecutionResult::cancelled("emergency stop before dispatch", std::chrono::milliseconds(0));
    } else {
        auto actions = m_actions;
        auto token = m_token;
        const auto timeout = m_config.executionTimeout;

        auto future = m_pool->submit([actions, proposal, token, timeout]() {
            // The flag may have been raised while this task was queued
            if (token->isCancelled()) {
                return ExecutionResult::cancelled("emergency stop before dispatch", std::chrono::milliseconds(0));
            }
            return actions->execute(proposal, timeout, *token);
        });

        AwaitStatus status = awaitWithCancellation(future, timeout, *m_token, m_config.cancellationPoll);
        const auto elapsed = elapsedSince(started);

        switch (status) {
            case AwaitStatus::READY:
                try {
                    result = future.get();
                } catch (const std::exception& e) {
                    result = ExecutionResult::failed(e.what(), elapsed);
                }
                break;
            case AwaitStatus::TIMED_OUT:
                result = ExecutionResult::failed("timed out after " + std::to_string(timeout.count()) + " ms",
                                                 elapsed);
                break;
            case AwaitStatus::CANCELLED:
                result = ExecutionResult::cancelled("emergency stop", elapsed);
                break;
        }
        if (result.duration.count() == 0) {
            result.duration = elapsed;
        }
    }

    emit(MetricsEventKind::ACTION_ATTEMPT, sequence, {
        {"action", actionKindToString(proposal.kind)},
        {"status", executionStatusToString(result.status)},
        {"reason", result.reason},
        {"duration_ms", result.duration.count()}
    });

    SLOG_INFO().message("Action " + executionStatusToString(result.status))
        .context("action", actionKindToString(proposal.kind))
        .context("duration_ms", result.duration.count())
        .cycle(sequence);
    return result;
}

bool CycleOrchestrator::recordFailure() {
    ++m_consecutiveFailures;
    return m_consecutiveFailures > m_config.retry.maxConsecutiveFailures;
}

bool CycleOrchestrator::backoff(int attempt) {
    auto delay = m_config.retry.backoffFor(attempt);
    SLOG_DEBUG().message("Backing off").context("delay_ms", delay.count()).cycle(m_sequence);
    return m_token->waitFor(delay);
}

CycleOrchestrator::CycleStep CycleOrchestrator::pause(const std::string& reason) {
    m_pauseReason = reason;
    m_report.pauses++;
    m_report.duration = elapsedSince(m_startTime);
    setPhase(RunPhase::PAUSED);

    emit(MetricsEventKind::RUN_PAUSED, m_sequence, {
        {"reason", reason},
        {"consecutive_failures", m_consecutiveFailures}
    });
    SLOG_WARNING().message("Run paused")
        .context("reason", reason)
        .context("consecutive_failures", m_consecutiveFailures)
        .cycle(m_sequence);
    return CycleStep::PAUSED;
}

CycleOrchestrator::CycleStep CycleOrchestrator::terminate(TerminationReason reason, const std::string& detail) {
    m_terminated = reason;
    m_terminationDetail = detail;
    m_report.termination = reason;
    m_report.duration = elapsedSince(m_startTime);
    setPhase(RunPhase::STOPPED);

    emitTerminated();
    SLOG_INFO().message("Run terminated")
        .context("reason", terminationReasonToString(reason))
        .context("detail", detail)
        .context("cycles", m_sequence)
        .context("duration_ms", m_report.duration.count());
    return CycleStep::TERMINATED;
}

CycleOrchestrator::CycleStep CycleOrchestrator::terminateOnCancellation() {
    const std::string reason = m_token->reason();
    if (reason == OPERATOR_ABORT_REASON) {
        return terminate(TerminationReason::OPERATOR_ABORT, reason);
    }
    return terminate(TerminationReason::EMERGENCY_STOP, reason);
}

RunOutcome CycleOrchestrator::outcome() const {
    RunOutcome result;
    result.verdict = m_terminated ? RunVerdict::TERMINATED : RunVerdict::PAUSED;
    result.reason = m_terminated;
    result.detail = m_terminated ? m_terminationDetail : m_pauseReason;
    result.report = m_report;
    return result;
}

void CycleOrchestrator::setPhase(RunPhase phase) {
    m_phase.store(phase);
}

void CycleOrchestrator::emit(MetricsEventKind kind, uint64_t sequence, const nlohmann::json& data) {
    if (m_metrics) {
        m_metrics->record(MetricsEvent(kind, m_runId, sequence, data));
    }
}

void CycleOrchestrator::emitTerminated() {
    emit(MetricsEventKind::RUN_TERMINATED, m_sequence, {
        {"reason", terminationReasonToString(*m_terminated)},
        {"detail", m_terminationDetail},
        {"cycles", m_sequence},
        {"duration_ms", m_report.duration.count()},
        {"report", m_report.toJson()}
    });
}

} // namespace deskpilot
