#ifndef DESKPILOT_TYPES_H
#define DESKPILOT_TYPES_H

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace deskpilot {

// Natural-language objective for one run; fixed at run start
struct Goal {
    std::string objective;
    nlohmann::json constraints = nlohmann::json::object();

    nlohmann::json toJson() const;
};

struct TextRegion {
    std::string text;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    double confidence = 1.0;
};

struct UiElement {
    std::string id;
    std::string role;
    std::string label;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

/**
 * @brief One perception result
 *
 * imageRef is an opaque handle owned by the perceiver (a file path or buffer key).
 */
struct Snapshot {
    std::string id;
    std::string imageRef;
    std::vector<TextRegion> textRegions;
    std::vector<UiElement> elements;
    std::string description;
    std::chrono::system_clock::time_point capturedAt;
};

/**
 * @brief Compact form of a snapshot kept in history and sent to models
 */
struct SnapshotSummary {
    std::string snapshotId;
    std::chrono::system_clock::time_point capturedAt;
    std::string text;
    size_t elementCount = 0;

    nlohmann::json toJson() const;
};

SnapshotSummary summarizeSnapshot(const Snapshot& snapshot, size_t maxChars = 512);

enum class ActionKind {
    POINTER_MOVE,
    CLICK,
    DOUBLE_CLICK,
    DRAG,
    SCROLL,
    KEY_INPUT,
    TEXT_ENTRY,
    WAIT,
    LAUNCH_APP,
    CLOSE_APP,
    FILE_OPERATION,
    SYSTEM_COMMAND,
    PASSWORD_ENTRY
};

const std::vector<ActionKind>& allActionKinds();
std::string actionKindToString(ActionKind kind);

/**
 * @brief Parse an action kind name
 *
 * Accepts the canonical snake_case names, hyphenated spellings and the
 * legacy names "type" and "key_press".
 */
std::optional<ActionKind> actionKindFromString(const std::string& name);

enum class RiskLevel : int {
    SAFE = 0,
    LOW = 1,
    MEDIUM = 2,
    REQUIRES_CONFIRMATION = 3
};

std::string riskLevelToString(RiskLevel level);
std::optional<RiskLevel> riskLevelFromInt(int value);

struct TargetDescriptor {
    std::string element;
    nlohmann::json parameters = nlohmann::json::object();

    bool has(const std::string& key) const;

    // Every string in the descriptor, space separated
    std::string describe() const;

    nlohmann::json toJson() const;
};

struct ActionProposal {
    ActionKind kind = ActionKind::WAIT;
    TargetDescriptor target;
    std::string rationale;
    double confidence = 0.0;
    std::optional<RiskLevel> riskHint;
    bool goalSatisfied = false;

    static ActionProposal goalSatisfiedSentinel(const std::string& rationale, double confidence);

    nlohmann::json toJson() const;
};

enum class SafetyVerdict {
    APPROVED,
    APPROVED_WITH_LOG,
    PENDING_CONFIRMATION,
    DENIED
};

std::string safetyVerdictToString(SafetyVerdict verdict);

struct SafetyDecision {
    SafetyVerdict verdict = SafetyVerdict::DENIED;
    RiskLevel level = RiskLevel::REQUIRES_CONFIRMATION;
    std::string reason;
    bool audit = false;
    std::string matchedTerm;

    bool permitsExecution() const {
        return verdict == SafetyVerdict::APPROVED || verdict == SafetyVerdict::APPROVED_WITH_LOG;
    }

    nlohmann::json toJson() const;
};

enum class ExecutionStatus {
    SUCCEEDED,
    FAILED,
    CANCELLED
};

std::string executionStatusToString(ExecutionStatus status);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::FAILED;
    std::string reason;
    std::chrono::system_clock::time_point finishedAt;
    std::chrono::milliseconds duration{0};

    static ExecutionResult succeeded(std::chrono::milliseconds duration);
    static ExecutionResult failed(const std::string& reason, std::chrono::milliseconds duration);
    static ExecutionResult cancelled(const std::string& reason, std::chrono::milliseconds duration);

    nlohmann::json toJson() const;
};

/**
 * @brief One completed cycle as retained in history
 *
 * execution is set only when the decision permitted execution. confirmation
 * holds the operator's answer for level-3 proposals (empty when the window
 * expired or no confirmation was needed).
 */
struct CycleRecord {
    uint64_t sequence = 0;
    SnapshotSummary snapshot;
    ActionProposal proposal;
    SafetyDecision decision;
    std::optional<bool> confirmation;
    std::optional<ExecutionResult> execution;

    nlohmann::json toJson() const;
};

enum class RunPhase {
    IDLE,
    PERCEIVING,
    REASONING,
    SAFETY_CHECK,
    EXECUTING,
    AWAITING_CONFIRMATION,
    BLOCKED,
    MONITORING,
    PAUSED,
    STOPPED
};

std::string runPhaseToString(RunPhase phase);

enum class TerminationReason {
    GOAL_SATISFIED,
    EMERGENCY_STOP,
    CYCLE_BUDGET_EXCEEDED,
    OPERATOR_ABORT
};

std::string terminationReasonToString(TerminationReason reason);

std::string formatIsoTimestamp(const std::chrono::system_clock::time_point& tp);

} // namespace deskpilot

#endif // DESKPILOT_TYPES_H
