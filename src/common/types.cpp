#include "types.h"
#include "string_utils.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace deskpilot {

namespace {
    void collectStrings(const nlohmann::json& value, std::vector<std::string>& out) {
        if (value.is_string()) {
            out.push_back(value.get<std::string>());
        } else if (value.is_object() || value.is_array()) {
            for (const auto& item : value) {
                collectStrings(item, out);
            }
        }
    }
}

std::string formatIsoTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

nlohmann::json Goal::toJson() const {
    return {{"objective", objective}, {"constraints", constraints}};
}

nlohmann::json SnapshotSummary::toJson() const {
    return {
        {"snapshot_id", snapshotId},
        {"captured_at", formatIsoTimestamp(capturedAt)},
        {"text", text},
        {"element_count", elementCount}
    };
}

SnapshotSummary summarizeSnapshot(const Snapshot& snapshot, size_t maxChars) {
    SnapshotSummary summary;
    summary.snapshotId = snapshot.id;
    summary.capturedAt = snapshot.capturedAt;
    summary.elementCount = snapshot.elements.size();

    std::vector<std::string> parts;
    if (!snapshot.description.empty()) {
        parts.push_back(snapshot.description);
    }
    for (const auto& element : snapshot.elements) {
        std::string label = element.role.empty() ? element.label : element.role + " '" + element.label + "'";
        if (!label.empty()) {
            parts.push_back(label);
        }
    }
    for (const auto& region : snapshot.textRegions) {
        if (!region.text.empty()) {
            parts.push_back(region.text);
        }
    }

    summary.text = utils::StringUtils::truncate(utils::StringUtils::join(parts, "; "), maxChars);
    return summary;
}

const std::vector<ActionKind>& allActionKinds() {
    static const std::vector<ActionKind> kinds = {
        ActionKind::POINTER_MOVE, ActionKind::CLICK, ActionKind::DOUBLE_CLICK,
        ActionKind::DRAG, ActionKind::SCROLL, ActionKind::KEY_INPUT,
        ActionKind::TEXT_ENTRY, ActionKind::WAIT, ActionKind::LAUNCH_APP,
        ActionKind::CLOSE_APP, ActionKind::FILE_OPERATION,
        ActionKind::SYSTEM_COMMAND, ActionKind::PASSWORD_ENTRY
    };
    return kinds;
}

std::string actionKindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::POINTER_MOVE: return "pointer_move";
        case ActionKind::CLICK: return "click";
        case ActionKind::DOUBLE_CLICK: return "double_click";
        case ActionKind::DRAG: return "drag";
        case ActionKind::SCROLL: return "scroll";
        case ActionKind::KEY_INPUT: return "key_input";
        case ActionKind::TEXT_ENTRY: return "text_entry";
        case ActionKind::WAIT: return "wait";
        case ActionKind::LAUNCH_APP: return "launch_app";
        case ActionKind::CLOSE_APP: return "close_app";
        case ActionKind::FILE_OPERATION: return "file_operation";
        case ActionKind::SYSTEM_COMMAND: return "system_command";
        case ActionKind::PASSWORD_ENTRY: return "password_entry";
        default: return "unknown";
    }
}

std::optional<ActionKind> actionKindFromString(const std::string& name) {
    std::string normalized = utils::StringUtils::toLowerCase(utils::StringUtils::trim(name));
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    std::replace(normalized.begin(), normalized.end(), ' ', '_');

    if (normalized == "type") return ActionKind::TEXT_ENTRY;
    if (normalized == "key_press") return ActionKind::KEY_INPUT;

    for (ActionKind kind : allActionKinds()) {
        if (actionKindToString(kind) == normalized) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::SAFE: return "safe";
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::REQUIRES_CONFIRMATION: return "requires_confirmation";
        default: return "unknown";
    }
}

std::optional<RiskLevel> riskLevelFromInt(int value) {
    if (value < 0 || value > 3) {
        return std::nullopt;
    }
    return static_cast<RiskLevel>(value);
}

bool TargetDescriptor::has(const std::string& key) const {
    return parameters.is_object() && parameters.contains(key) && !parameters.at(key).is_null();
}

std::string TargetDescriptor::describe() const {
    std::vector<std::string> parts;
    if (!element.empty()) {
        parts.push_back(element);
    }
    collectStrings(parameters, parts);
    return utils::StringUtils::join(parts, " ");
}

nlohmann::json TargetDescriptor::toJson() const {
    nlohmann::json j = parameters.is_object() ? parameters : nlohmann::json::object();
    if (!element.empty()) {
        j["element"] = element;
    }
    return j;
}

ActionProposal ActionProposal::goalSatisfiedSentinel(const std::string& rationale, double confidence) {
    ActionProposal proposal;
    proposal.kind = ActionKind::WAIT;
    proposal.rationale = rationale;
    proposal.confidence = confidence;
    proposal.goalSatisfied = true;
    return proposal;
}

nlohmann::json ActionProposal::toJson() const {
    nlohmann::json j = {
        {"action", actionKindToString(kind)},
        {"target", target.toJson()},
        {"rationale", rationale},
        {"confidence", confidence},
        {"goal_satisfied", goalSatisfied}
    };
    if (riskHint) {
        j["risk_hint"] = static_cast<int>(*riskHint);
    }
    return j;
}

std::string safetyVerdictToString(SafetyVerdict verdict) {
    switch (verdict) {
        case SafetyVerdict::APPROVED: return "approved";
        case SafetyVerdict::APPROVED_WITH_LOG: return "approved_with_log";
        case SafetyVerdict::PENDING_CONFIRMATION: return "pending_confirmation";
        case SafetyVerdict::DENIED: return "denied";
        default: return "unknown";
    }
}

nlohmann::json SafetyDecision::toJson() const {
    nlohmann::json j = {
        {"verdict", safetyVerdictToString(verdict)},
        {"level", static_cast<int>(level)},
        {"reason", reason},
        {"audit", audit}
    };
    if (!matchedTerm.empty()) {
        j["matched_term"] = matchedTerm;
    }
    return j;
}

std::string executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCEEDED: return "succeeded";
        case ExecutionStatus::FAILED: return "failed";
        case ExecutionStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

ExecutionResult ExecutionResult::succeeded(std::chrono::milliseconds duration) {
    ExecutionResult result;
    result.status = ExecutionStatus::SUCCEEDED;
    result.finishedAt = std::chrono::system_clock::now();
    result.duration = duration;
    return result;
}

ExecutionResult ExecutionResult::failed(const std::string& reason, std::chrono::milliseconds duration) {
    ExecutionResult result;
    result.status = ExecutionStatus::FAILED;
    result.reason = reason;
    result.finishedAt = std::chrono::system_clock::now();
    result.duration = duration;
    return result;
}

ExecutionResult ExecutionResult::cancelled(const std::string& reason, std::chrono::milliseconds duration) {
    ExecutionResult result;
    result.status = ExecutionStatus::CANCELLED;
    result.reason = reason;
    result.finishedAt = std::chrono::system_clock::now();
    result.duration = duration;
    return result;
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j = {
        {"status", executionStatusToString(status)},
        {"finished_at", formatIsoTimestamp(finishedAt)},
        {"duration_ms", duration.count()}
    };
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

nlohmann::json CycleRecord::toJson() const {
    nlohmann::json j = {
        {"sequence", sequence},
        {"snapshot", snapshot.toJson()},
        {"proposal", proposal.toJson()},
        {"decision", decision.toJson()}
    };
    if (confirmation) {
        j["confirmation"] = *confirmation ? "approved" : "denied";
    }
    if (execution) {
        j["execution"] = execution->toJson();
    }
    return j;
}

std::string runPhaseToString(RunPhase phase) {
    switch (phase) {
        case RunPhase::IDLE: return "idle";
        case RunPhase::PERCEIVING: return "perceiving";
        case RunPhase::REASONING: return "reasoning";
        case RunPhase::SAFETY_CHECK: return "safety_check";
        case RunPhase::EXECUTING: return "executing";
        case RunPhase::AWAITING_CONFIRMATION: return "awaiting_confirmation";
        case RunPhase::BLOCKED: return "blocked";
        case RunPhase::MONITORING: return "monitoring";
        case RunPhase::PAUSED: return "paused";
        case RunPhase::STOPPED: return "stopped";
        default: return "unknown";
    }
}

std::string terminationReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::GOAL_SATISFIED: return "goal_satisfied";
        case TerminationReason::EMERGENCY_STOP: return "emergency_stop";
        case TerminationReason::CYCLE_BUDGET_EXCEEDED: return "cycle_budget_exceeded";
        case TerminationReason::OPERATOR_ABORT: return "operator_abort";
        default: return "unknown";
    }
}

} // namespace deskpilot
