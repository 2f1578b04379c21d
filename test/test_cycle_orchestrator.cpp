#include <iostream>
#include <thread>
#include "test_helpers.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"
#include "orchestrator/cycle_orchestrator.h"
#include "orchestrator/agent_runner.h"
#include "orchestrator/emergency_monitor.h"

using namespace deskpilot;
using namespace deskpilot::testing;

namespace {

struct Rig {
    std::shared_ptr<CountingPerception> perception = std::make_shared<CountingPerception>();
    std::shared_ptr<RecordingActionPort> actions = std::make_shared<RecordingActionPort>();
    std::shared_ptr<CollectingMetricsSink> metrics = std::make_shared<CollectingMetricsSink>();
    std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
    std::vector<std::shared_ptr<ReasoningEndpoint>> endpoints;

    AgentCollaborators collaborators() const {
        AgentCollaborators c;
        c.perception = perception;
        c.actions = actions;
        c.endpoints = endpoints;
        c.metrics = metrics;
        return c;
    }
};

Goal makeGoal(const std::string& objective) {
    Goal goal;
    goal.objective = objective;
    return goal;
}

const std::string CLICK_SAVE = proposalText("click", {{"element", "Save button"}}, "press Save");

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return condition();
}

// Fails the first capture with text that is not valid UTF-8
class CodePagePerception : public PerceptionPort {
public:
    CodePagePerception() : m_calls(0) {}

    Snapshot capture(std::chrono::milliseconds, const CancellationToken&) override {
        if (++m_calls == 1) {
            throw std::runtime_error("capture failed: \xE9\xE9 device");
        }
        return makeSnapshot("snap-" + std::to_string(m_calls.load()), "Settings window");
    }

private:
    std::atomic<int> m_calls;
};

// Runs every entry through both formatters
class FormattingLogSink : public ILogSink {
public:
    void write(const LogEntry& entry) override {
        std::string json = m_json.format(entry);
        std::string text = m_text.format(entry);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lines.push_back(json);
        m_lines.push_back(text);
    }
    void flush() override {}

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lines;
    }

private:
    JsonLogFormatter m_json;
    TextLogFormatter m_text;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_lines;
};

// Fires once its flag is raised
class FlagTriggerSource : public EmergencyTriggerSource {
public:
    FlagTriggerSource() : m_raised(false) {}
    std::string name() const override { return "test trigger"; }
    bool poll() override { return m_raised; }
    void raise() { m_raised = true; }

private:
    std::atomic<bool> m_raised;
};

}

void testApprovedDoubleClick() {
    std::cout << "[TEST] Safe action is executed and the goal completes\n";

    Rig rig;
    auto endpoint = std::make_shared<FunctionEndpoint>("vision", replies({
        proposalText("double_click", {{"element", "Projects folder"}}, "open the folder"),
        goalSatisfiedText("folder window is open")
    }), rig.log);
    rig.endpoints.push_back(endpoint);

    CycleOrchestrator orchestrator(makeGoal("open folder Projects"), fastConfig(), rig.collaborators(), "run-open");
    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.goalSatisfied());
    CHECK_EQ(outcome.detail, std::string("folder window is open"));
    CHECK(orchestrator.phase() == RunPhase::STOPPED);

    CHECK_EQ(orchestrator.history().size(), size_t(1));
    const CycleRecord* first = orchestrator.history().latest();
    CHECK(first->decision.verdict == SafetyVerdict::APPROVED);
    CHECK(first->execution.has_value());
    CHECK(first->execution->status == ExecutionStatus::SUCCEEDED);
    CHECK_EQ(first->snapshot.snapshotId, std::string("snap-1"));

    auto executed = rig.actions->executed();
    CHECK_EQ(executed.size(), size_t(1));
    CHECK(executed[0].kind == ActionKind::DOUBLE_CLICK);
    CHECK_EQ(executed[0].target.element, std::string("Projects folder"));

    CHECK_EQ(outcome.report.cycles, uint64_t(2));
    CHECK_EQ(outcome.report.actionsSucceeded, size_t(1));
    CHECK_EQ(rig.metrics->ofKind(MetricsEventKind::CYCLE_COMPLETED).size(), size_t(2));
    CHECK_EQ(rig.metrics->ofKind(MetricsEventKind::RUN_TERMINATED).size(), size_t(1));

    // The second request carries the first cycle
    auto requests = endpoint->requests();
    CHECK_EQ(requests.size(), size_t(2));
    CHECK(requests[0].history.empty());
    CHECK_EQ(requests[1].history.size(), size_t(1));
    CHECK(!requests[1].lastFailure.has_value());

    // A terminated run keeps its outcome
    RunOutcome again = orchestrator.run();
    CHECK(again.goalSatisfied());
    CHECK_EQ(again.report.cycles, uint64_t(2));

    std::cout << "[OK] Approved action test passed\n\n";
}

void testUnconfirmedCommandIsDenied() {
    std::cout << "[TEST] Level-3 action without confirmation\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("reasoning", replies({
        proposalText("system_command", {{"command", "ipconfig /all"}}, "check the network"),
        goalSatisfiedText()
    }), rig.log));

    RunConfig config = fastConfig();
    config.confirmationWindow = 40ms;

    CycleOrchestrator orchestrator(makeGoal("check the network settings"), config, rig.collaborators());
    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.goalSatisfied());
    CHECK(rig.actions->executed().empty());

    const CycleRecord* record = orchestrator.history().latest();
    CHECK(record != nullptr);
    CHECK(record->decision.verdict == SafetyVerdict::DENIED);
    CHECK_EQ(record->decision.reason, std::string("confirmation window expired"));
    CHECK(!record->confirmation.has_value());
    CHECK(!record->execution.has_value());

    CHECK_EQ(outcome.report.confirmationsRequested, size_t(1));
    CHECK_EQ(outcome.report.confirmationTimeouts, size_t(1));
    CHECK_EQ(outcome.report.denials, size_t(1));
    CHECK_EQ(outcome.report.cycles, uint64_t(2));

    auto decisions = rig.metrics->ofKind(MetricsEventKind::SAFETY_DECISION_MADE);
    CHECK_EQ(decisions[0].data["verdict"].get<std::string>(), std::string("pending_confirmation"));
    auto resolved = rig.metrics->ofKind(MetricsEventKind::CONFIRMATION_RESOLVED);
    CHECK_EQ(resolved.size(), size_t(1));
    CHECK_EQ(resolved[0].data["result"].get<std::string>(), std::string("timed_out"));
    CHECK_EQ(rig.metrics->ofKind(MetricsEventKind::AUDIT).size(), size_t(1));

    std::cout << "[OK] Unconfirmed action test passed\n\n";
}

void testPrimaryTimeoutUsesSecondary() {
    std::cout << "[TEST] Primary endpoint times out in every cycle\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("primary", hangs(), rig.log, 40ms));
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("secondary",
        replies({CLICK_SAVE, goalSatisfiedText()}), rig.log));

    CycleOrchestrator orchestrator(makeGoal("save the open document"), fastConfig(), rig.collaborators());
    RunOutcome outcome = orchestrator.run();
    orchestrator.token()->cancel("test finished");

    CHECK(outcome.goalSatisfied());
    CHECK_EQ(rig.actions->executed().size(), size_t(1));
    CHECK(rig.actions->executed()[0].kind == ActionKind::CLICK);

    auto calls = rig.log->calls();
    CHECK_EQ(calls.size(), size_t(4));
    CHECK_EQ(calls[0], std::string("primary"));
    CHECK_EQ(calls[1], std::string("secondary"));
    CHECK_EQ(calls[2], std::string("primary"));
    CHECK_EQ(calls[3], std::string("secondary"));

    auto attempts = rig.metrics->ofKind(MetricsEventKind::MODEL_ATTEMPT);
    CHECK_EQ(attempts.size(), size_t(4));
    CHECK_EQ(attempts[0].data["endpoint"].get<std::string>(), std::string("primary"));
    CHECK_EQ(attempts[0].data["outcome"].get<std::string>(), std::string("timeout"));
    CHECK_EQ(attempts[1].data["endpoint"].get<std::string>(), std::string("secondary"));
    CHECK(attempts[1].data["success"].get<bool>());

    CHECK_EQ(outcome.report.modelUsage.at("primary").attempts, size_t(2));
    CHECK_EQ(outcome.report.modelUsage.at("primary").successes, size_t(0));
    CHECK_EQ(outcome.report.modelUsage.at("secondary").successes, size_t(2));
    CHECK_EQ(outcome.report.reasoningExhaustions, size_t(0));

    std::cout << "[OK] Secondary endpoint test passed\n\n";
}

void testEmergencyDuringExecution() {
    std::cout << "[TEST] Emergency trigger while an action runs\n";

    auto trigger = std::make_shared<FlagTriggerSource>();

    Rig rig;
    rig.actions = std::make_shared<RecordingActionPort>(
        [trigger](const ActionProposal&, std::chrono::milliseconds, const CancellationToken& token) {
            trigger->raise();
            token.waitFor(2000ms);
            return ExecutionResult::cancelled("interrupted", 0ms);
        });
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({CLICK_SAVE}), rig.log));

    RunConfig config = fastConfig();
    config.executionTimeout = 3000ms;

    CycleOrchestrator orchestrator(makeGoal("save the open document"), config, rig.collaborators());

    EmergencyMonitor monitor(orchestrator.token(), 5ms);
    monitor.addSource(trigger);
    monitor.start();

    auto started = std::chrono::steady_clock::now();
    RunOutcome outcome = orchestrator.run();
    auto elapsed = std::chrono::steady_clock::now() - started;
    monitor.stop();

    CHECK(outcome.verdict == RunVerdict::TERMINATED);
    CHECK(outcome.reason == TerminationReason::EMERGENCY_STOP);
    CHECK_EQ(outcome.detail, std::string("test trigger"));
    CHECK(elapsed < 2000ms);

    CHECK_EQ(orchestrator.history().size(), size_t(1));
    const CycleRecord* record = orchestrator.history().latest();
    CHECK(record->execution.has_value());
    CHECK(record->execution->status == ExecutionStatus::CANCELLED);

    CHECK_EQ(outcome.report.cycles, uint64_t(1));
    CHECK_EQ(outcome.report.actionsCancelled, size_t(1));
    CHECK_EQ(rig.perception->calls(), 1);
    CHECK_EQ(rig.actions->callsAfterCancel(), 0);

    // RunTerminated follows the cancelled cycle and nothing comes after it
    auto events = rig.metrics->events();
    CHECK(events.back().kind == MetricsEventKind::RUN_TERMINATED);
    CHECK_EQ(events.back().data["reason"].get<std::string>(), std::string("emergency_stop"));
    CHECK(events[events.size() - 2].kind == MetricsEventKind::CYCLE_COMPLETED);

    CHECK(!monitor.trigger("second press"));

    std::cout << "[OK] Emergency stop test passed\n\n";
}

void testDenylistBlocksAction() {
    std::cout << "[TEST] Denylisted target never reaches the action port\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({
        proposalText("click", {{"element", "Delete Account"}}, "close the account"),
        goalSatisfiedText()
    }), rig.log));

    CycleOrchestrator orchestrator(makeGoal("tidy the profile page"), fastConfig(), rig.collaborators());
    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.goalSatisfied());
    CHECK(rig.actions->executed().empty());
    CHECK(orchestrator.history().latest()->decision.verdict == SafetyVerdict::DENIED);
    CHECK_EQ(orchestrator.history().latest()->decision.matchedTerm, std::string("delete"));
    CHECK_EQ(outcome.report.confirmationsRequested, size_t(0));
    CHECK_EQ(outcome.report.denials, size_t(1));
    CHECK_EQ(orchestrator.consecutiveFailures(), 0);

    std::cout << "[OK] Denylist test passed\n\n";
}

void testStopWhileAwaitingConfirmation() {
    std::cout << "[TEST] Emergency stop while awaiting confirmation\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({
        proposalText("file_operation", {{"operation", "copy"}, {"path", "notes.txt"}}, "back up the notes")
    }), rig.log));

    RunConfig config = fastConfig();
    config.confirmationWindow = 3000ms;

    AgentCollaborators collaborators = rig.collaborators();
    collaborators.confirmations = std::make_shared<ConfirmationChannel>();

    CycleOrchestrator orchestrator(makeGoal("back up my notes"), config, collaborators);
    orchestrator.confirmations()->setRequestListener(
        [&orchestrator](uint64_t, const ActionProposal&, const SafetyDecision&) {
            orchestrator.emergencyStop("operator hotkey");
        });

    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.reason == TerminationReason::EMERGENCY_STOP);
    CHECK(rig.actions->executed().empty());
    CHECK_EQ(orchestrator.history().size(), size_t(1));
    CHECK_EQ(orchestrator.history().latest()->decision.reason,
             std::string("run cancelled while awaiting confirmation"));
    CHECK(!orchestrator.emergencyStop("again"));

    std::cout << "[OK] Stop during confirmation test passed\n\n";
}

void testFailedActionFeedsNextRequest() {
    std::cout << "[TEST] Repeated action failures pause the run\n";

    Rig rig;
    rig.actions = std::make_shared<RecordingActionPort>(
        [](const ActionProposal&, std::chrono::milliseconds, const CancellationToken&) {
            return ExecutionResult::failed("element not found", 2ms);
        });
    auto endpoint = std::make_shared<FunctionEndpoint>("vision", replies({CLICK_SAVE}), rig.log);
    rig.endpoints.push_back(endpoint);

    RunConfig config = fastConfig();
    config.retry.executionMaxConsecutiveFailures = 3;

    CycleOrchestrator orchestrator(makeGoal("save the open document"), config, rig.collaborators());
    RunOutcome paused = orchestrator.run();

    CHECK(paused.verdict == RunVerdict::PAUSED);
    CHECK_EQ(paused.detail, std::string("3 consecutive action failures"));
    CHECK(orchestrator.phase() == RunPhase::PAUSED);
    CHECK_EQ(paused.report.actionsFailed, size_t(3));
    CHECK_EQ(orchestrator.consecutiveFailures(), 3);

    auto requests = endpoint->requests();
    CHECK_EQ(requests.size(), size_t(3));
    CHECK(!requests[0].lastFailure.has_value());
    CHECK(requests[1].lastFailure.has_value());
    CHECK_EQ(*requests[1].lastFailure, std::string("click failed: element not found"));

    // run() on a paused run does nothing until resume()
    CHECK(orchestrator.run().verdict == RunVerdict::PAUSED);
    CHECK_EQ(rig.actions->executed().size(), size_t(3));

    RunOutcome aborted = orchestrator.abort();
    CHECK(aborted.reason == TerminationReason::OPERATOR_ABORT);
    CHECK(!orchestrator.resume());

    std::cout << "[OK] Action failure test passed\n\n";
}

void testPerceptionPauseAndResume() {
    std::cout << "[TEST] Perception failures pause; resume resets counters\n";

    Rig rig;
    rig.perception = std::make_shared<CountingPerception>(3);
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({goalSatisfiedText()}), rig.log));

    CycleOrchestrator orchestrator(makeGoal("open the settings window"), fastConfig(), rig.collaborators());
    RunOutcome paused = orchestrator.run();

    CHECK(paused.verdict == RunVerdict::PAUSED);
    CHECK_EQ(paused.detail, std::string("perception failed 3 times"));
    CHECK_EQ(paused.report.perceptionFailures, size_t(3));
    CHECK_EQ(orchestrator.consecutiveFailures(), 3);
    CHECK(orchestrator.history().empty());
    CHECK(rig.log->calls().empty());

    auto perceptionEvents = rig.metrics->ofKind(MetricsEventKind::PERCEPTION_ATTEMPT);
    CHECK_EQ(perceptionEvents.size(), size_t(3));
    CHECK(!perceptionEvents[2].data["success"].get<bool>());

    CHECK(orchestrator.resume());
    CHECK_EQ(orchestrator.consecutiveFailures(), 0);
    CHECK(!orchestrator.resume());

    RunOutcome finished = orchestrator.run();
    CHECK(finished.goalSatisfied());
    CHECK_EQ(finished.report.cycles, uint64_t(2));
    CHECK_EQ(finished.report.pauses, size_t(1));
    CHECK_EQ(rig.metrics->ofKind(MetricsEventKind::RUN_RESUMED).size(), size_t(1));

    std::cout << "[OK] Perception pause test passed\n\n";
}

void testGlobalFailureThreshold() {
    std::cout << "[TEST] Consecutive failures across phases\n";

    Rig rig;
    rig.perception = std::make_shared<CountingPerception>(100);
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({CLICK_SAVE}), rig.log));

    RunConfig config = fastConfig();
    config.retry.perceptionMaxAttempts = 5;
    config.retry.maxConsecutiveFailures = 2;

    CycleOrchestrator orchestrator(makeGoal("save the open document"), config, rig.collaborators());
    RunOutcome paused = orchestrator.run();

    CHECK(paused.verdict == RunVerdict::PAUSED);
    CHECK_EQ(paused.detail, std::string("consecutive failure threshold exceeded"));
    CHECK_EQ(rig.perception->calls(), 3);

    std::cout << "[OK] Failure threshold test passed\n\n";
}

void testReasoningExhausted() {
    std::cout << "[TEST] Every endpoint fails on every attempt\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({"no idea"}), rig.log));
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("fallback", replies({"{}"}), rig.log));

    RunConfig config = fastConfig();
    config.retry.reasoningMaxAttempts = 2;

    CycleOrchestrator orchestrator(makeGoal("save the open document"), config, rig.collaborators());
    RunOutcome paused = orchestrator.run();

    CHECK(paused.verdict == RunVerdict::PAUSED);
    CHECK_EQ(paused.detail, std::string("reasoning exhausted after 2 attempts"));
    CHECK_EQ(paused.report.reasoningExhaustions, size_t(2));
    CHECK_EQ(rig.log->calls().size(), size_t(4));
    CHECK(rig.actions->executed().empty());

    std::cout << "[OK] Reasoning exhausted test passed\n\n";
}

void testCycleBudgetAndHistoryBound() {
    std::cout << "[TEST] Cycle budget and bounded history\n";

    Rig rig;
    auto endpoint = std::make_shared<FunctionEndpoint>("vision", replies({CLICK_SAVE}), rig.log);
    rig.endpoints.push_back(endpoint);

    RunConfig config = fastConfig();
    config.maxCycles = 5;
    config.historyCapacity = 2;

    CycleOrchestrator orchestrator(makeGoal("save the open document"), config, rig.collaborators());
    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.reason == TerminationReason::CYCLE_BUDGET_EXCEEDED);
    CHECK_EQ(outcome.detail, std::string("cycle limit 5 reached"));
    CHECK_EQ(outcome.report.cycles, uint64_t(5));
    CHECK_EQ(rig.actions->executed().size(), size_t(5));

    auto records = orchestrator.history().records();
    CHECK_EQ(records.size(), size_t(2));
    CHECK_EQ(records[0].sequence, uint64_t(4));
    CHECK_EQ(records[1].sequence, uint64_t(5));
    CHECK_EQ(endpoint->requests().back().history.size(), size_t(2));

    std::cout << "[OK] Budget test passed\n\n";
}

void testInvalidSetupRejected() {
    std::cout << "[TEST] Invalid setup\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({CLICK_SAVE}), rig.log));

    CHECK_THROWS(CycleOrchestrator(makeGoal(""), fastConfig(), rig.collaborators()));

    AgentCollaborators noPerception = rig.collaborators();
    noPerception.perception.reset();
    CHECK_THROWS(CycleOrchestrator(makeGoal("save"), fastConfig(), noPerception));

    RunConfig partialTable = fastConfig();
    partialTable.riskTable = RiskTable();
    partialTable.riskTable.set(ActionKind::CLICK, RiskLevel::SAFE);
    CHECK_THROWS(CycleOrchestrator(makeGoal("save"), partialTable, rig.collaborators()));

    RunConfig noCycles = fastConfig();
    noCycles.maxCycles = 0;
    CHECK_THROWS(CycleOrchestrator(makeGoal("save"), noCycles, rig.collaborators()));

    std::cout << "[OK] Invalid setup test passed\n\n";
}

void testRunHandleConfirmation() {
    std::cout << "[TEST] Operator approves through the run handle\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({
        proposalText("file_operation", {{"operation", "copy"}, {"path", "notes.txt"}}, "back up the notes"),
        goalSatisfiedText()
    }), rig.log));

    RunConfig config = fastConfig();
    config.confirmationWindow = 3000ms;

    auto handle = AgentRunner::start(makeGoal("back up my notes"), config, rig.collaborators(), "run-confirm");
    CHECK_EQ(handle->runId(), std::string("run-confirm"));

    CHECK(waitUntil([&handle]() { return handle->confirmations()->pendingSequence().has_value(); }));
    CHECK(handle->phase() == RunPhase::AWAITING_CONFIRMATION);
    CHECK(handle->confirm(*handle->confirmations()->pendingSequence(), true));

    RunOutcome outcome = handle->wait();
    CHECK(outcome.goalSatisfied());
    CHECK(handle->finished());
    CHECK_EQ(outcome.report.confirmationsApproved, size_t(1));

    auto history = handle->history();
    CHECK_EQ(history.size(), size_t(1));
    CHECK(history[0].confirmation == std::optional<bool>(true));
    CHECK(history[0].decision.verdict == SafetyVerdict::APPROVED_WITH_LOG);
    CHECK_EQ(rig.actions->executed().size(), size_t(1));

    std::cout << "[OK] Handle confirmation test passed\n\n";
}

void testRunHandlePauseResumeAbort() {
    std::cout << "[TEST] Run handle pause, resume and abort\n";

    {
        Rig rig;
        rig.perception = std::make_shared<CountingPerception>(3);
        rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({goalSatisfiedText()}), rig.log));

        auto handle = AgentRunner::start(makeGoal("open the settings window"), fastConfig(), rig.collaborators());
        CHECK(waitUntil([&handle]() { return handle->isPaused(); }));
        CHECK(handle->lastPausedOutcome().has_value());
        CHECK_EQ(handle->lastPausedOutcome()->detail, std::string("perception failed 3 times"));
        CHECK(handle->history().empty());

        CHECK(handle->resume());
        RunOutcome outcome = handle->wait();
        CHECK(outcome.goalSatisfied());
        CHECK(!handle->resume());
    }

    {
        Rig rig;
        rig.perception = std::make_shared<CountingPerception>(3);
        rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({goalSatisfiedText()}), rig.log));

        auto handle = AgentRunner::start(makeGoal("open the settings window"), fastConfig(), rig.collaborators());
        CHECK(waitUntil([&handle]() { return handle->isPaused(); }));

        handle->abort();
        RunOutcome outcome = handle->wait();
        CHECK(outcome.reason == TerminationReason::OPERATOR_ABORT);
        CHECK_EQ(outcome.detail, std::string("operator abort"));
        CHECK(handle->phase() == RunPhase::STOPPED);
        CHECK(rig.log->calls().empty());
    }

    std::cout << "[OK] Handle pause test passed\n\n";
}

void testEarlyApprovalIsRefused() {
    std::cout << "[TEST] Approval sent before the request is refused\n";

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("reasoning", replies({
        proposalText("system_command", {{"command", "ipconfig /all"}}, "check the network"),
        goalSatisfiedText()
    }), rig.log));

    RunConfig config = fastConfig();
    config.confirmationWindow = 40ms;

    AgentCollaborators collaborators = rig.collaborators();
    auto channel = std::make_shared<ConfirmationChannel>();
    collaborators.confirmations = channel;

    CycleOrchestrator orchestrator(makeGoal("check the network settings"), config, collaborators);
    CHECK(!channel->deliver(1, true));

    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.goalSatisfied());
    CHECK(rig.actions->executed().empty());
    const CycleRecord* record = orchestrator.history().latest();
    CHECK(record->decision.verdict == SafetyVerdict::DENIED);
    CHECK(!record->confirmation.has_value());
    CHECK_EQ(outcome.report.confirmationsApproved, size_t(0));
    CHECK_EQ(outcome.report.confirmationTimeouts, size_t(1));

    auto resolved = rig.metrics->ofKind(MetricsEventKind::CONFIRMATION_RESOLVED);
    CHECK_EQ(resolved.size(), size_t(1));
    CHECK_EQ(resolved[0].data["result"].get<std::string>(), std::string("timed_out"));

    std::cout << "[OK] Early approval test passed\n\n";
}

void testNonUtf8FailureIsRetried() {
    std::cout << "[TEST] Perception error text that is not UTF-8\n";

    auto& logger = StructuredLogger::getInstance();
    auto sink = std::make_shared<FormattingLogSink>();
    logger.addSink(sink);

    Rig rig;
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({goalSatisfiedText()}), rig.log));
    AgentCollaborators collaborators = rig.collaborators();
    collaborators.perception = std::make_shared<CodePagePerception>();

    CycleOrchestrator orchestrator(makeGoal("open the settings window"), fastConfig(), collaborators);
    RunOutcome outcome = orchestrator.run();
    logger.flush();
    logger.removeSink(sink);

    CHECK(outcome.goalSatisfied());
    CHECK_EQ(outcome.report.perceptionFailures, size_t(1));

    auto attempts = rig.metrics->ofKind(MetricsEventKind::PERCEPTION_ATTEMPT);
    CHECK_EQ(attempts.size(), size_t(2));
    CHECK(!attempts[0].data["success"].get<bool>());
    CHECK(attempts[1].data["success"].get<bool>());

    // The bad bytes are replaced in formatted output
    bool sawFailure = false;
    for (const auto& line : sink->lines()) {
        if (line.find("capture failed") != std::string::npos) {
            sawFailure = true;
            CHECK(line.find("\xEF\xBF\xBD") != std::string::npos);
        }
    }
    CHECK(sawFailure);

    std::cout << "[OK] Non-UTF-8 failure test passed\n\n";
}

void testSuccessfulCycleResetsFailures() {
    std::cout << "[TEST] A successful cycle clears the failure counter\n";

    Rig rig;
    rig.perception = std::make_shared<CountingPerception>(1);
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision",
        replies({CLICK_SAVE, goalSatisfiedText()}), rig.log));

    CycleOrchestrator orchestrator(makeGoal("save the open document"), fastConfig(), rig.collaborators());
    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.goalSatisfied());
    CHECK_EQ(outcome.report.perceptionFailures, size_t(1));
    CHECK_EQ(outcome.report.pauses, size_t(0));
    CHECK_EQ(rig.actions->executed().size(), size_t(1));

    // The first cycle had one failed capture, then succeeded end to end
    auto completed = rig.metrics->ofKind(MetricsEventKind::CYCLE_COMPLETED);
    CHECK_EQ(completed.size(), size_t(2));
    CHECK_EQ(completed[0].sequence, uint64_t(1));
    CHECK_EQ(completed[0].data["status"].get<std::string>(), std::string("succeeded"));
    CHECK_EQ(completed[0].data["consecutive_failures"].get<int>(), 0);
    CHECK_EQ(orchestrator.consecutiveFailures(), 0);

    std::cout << "[OK] Failure reset test passed\n\n";
}

void testRunDurationLimit() {
    std::cout << "[TEST] Wall-clock limit ends the run\n";

    Rig rig;
    rig.actions = std::make_shared<RecordingActionPort>(
        [](const ActionProposal&, std::chrono::milliseconds, const CancellationToken& token) {
            token.waitFor(30ms);
            return ExecutionResult::succeeded(30ms);
        });
    rig.endpoints.push_back(std::make_shared<FunctionEndpoint>("vision", replies({CLICK_SAVE}), rig.log));

    RunConfig config = fastConfig();
    config.maxRunDuration = 60ms;

    CycleOrchestrator orchestrator(makeGoal("save the open document"), config, rig.collaborators());
    RunOutcome outcome = orchestrator.run();

    CHECK(outcome.reason == TerminationReason::CYCLE_BUDGET_EXCEEDED);
    CHECK_EQ(outcome.detail, std::string("run duration limit 60 ms reached"));
    CHECK(outcome.report.cycles >= uint64_t(2));
    CHECK(outcome.report.cycles < uint64_t(config.maxCycles));
    CHECK(outcome.report.duration >= 60ms);

    std::cout << "[OK] Duration limit test passed\n\n";
}

int main() {
    std::cout << "=== Deskpilot Cycle Orchestrator Test Suite ===\n\n";

    try {
        testApprovedDoubleClick();
        testUnconfirmedCommandIsDenied();
        testPrimaryTimeoutUsesSecondary();
        testEmergencyDuringExecution();
        testDenylistBlocksAction();
        testStopWhileAwaitingConfirmation();
        testFailedActionFeedsNextRequest();
        testPerceptionPauseAndResume();
        testGlobalFailureThreshold();
        testReasoningExhausted();
        testCycleBudgetAndHistoryBound();
        testRunDurationLimit();
        testSuccessfulCycleResetsFailures();
        testEarlyApprovalIsRefused();
        testNonUtf8FailureIsRetried();
        testInvalidSetupRejected();
        testRunHandleConfirmation();
        testRunHandlePauseResumeAbort();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
