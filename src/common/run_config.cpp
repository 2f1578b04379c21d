#include "run_config.h"
#include "error_handler.h"
#include "string_utils.h"
#include <algorithm>
#include <cmath>

namespace deskpilot {

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
    if (attempt < 0) {
        attempt = 0;
    }
    double delay = static_cast<double>(initialBackoff.count()) * std::pow(backoffMultiplier, attempt);
    double cap = static_cast<double>(maxBackoff.count());
    if (!(delay < cap)) {
        return maxBackoff;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

RiskTable RiskTable::defaults() {
    RiskTable table;
    table.set(ActionKind::POINTER_MOVE, RiskLevel::SAFE);
    table.set(ActionKind::CLICK, RiskLevel::SAFE);
    table.set(ActionKind::DOUBLE_CLICK, RiskLevel::SAFE);
    table.set(ActionKind::SCROLL, RiskLevel::SAFE);
    table.set(ActionKind::WAIT, RiskLevel::SAFE);
    table.set(ActionKind::DRAG, RiskLevel::LOW);
    table.set(ActionKind::KEY_INPUT, RiskLevel::LOW);
    table.set(ActionKind::TEXT_ENTRY, RiskLevel::LOW);
    table.set(ActionKind::LAUNCH_APP, RiskLevel::MEDIUM);
    table.set(ActionKind::CLOSE_APP, RiskLevel::MEDIUM);
    table.set(ActionKind::FILE_OPERATION, RiskLevel::REQUIRES_CONFIRMATION);
    table.set(ActionKind::SYSTEM_COMMAND, RiskLevel::REQUIRES_CONFIRMATION);
    table.set(ActionKind::PASSWORD_ENTRY, RiskLevel::REQUIRES_CONFIRMATION);
    return table;
}

void RiskTable::set(ActionKind kind, RiskLevel level) {
    m_levels[kind] = level;
}

RiskLevel RiskTable::levelFor(ActionKind kind) const {
    auto it = m_levels.find(kind);
    if (it == m_levels.end()) {
        return RiskLevel::REQUIRES_CONFIRMATION;
    }
    return it->second;
}

bool RiskTable::contains(ActionKind kind) const {
    return m_levels.count(kind) > 0;
}

bool RiskTable::isTotal() const {
    return missingKinds().empty();
}

std::vector<ActionKind> RiskTable::missingKinds() const {
    std::vector<ActionKind> missing;
    for (ActionKind kind : allActionKinds()) {
        if (!contains(kind)) {
            missing.push_back(kind);
        }
    }
    return missing;
}

nlohmann::json RiskTable::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : m_levels) {
        j[actionKindToString(entry.first)] = static_cast<int>(entry.second);
    }
    return j;
}

std::vector<std::string> defaultDenylist() {
    return {"password", "credit card", "delete", "format", "sudo", "admin",
            "system32", "registry", "rm -rf", "del /f", "format c:"};
}

RunConfig RunConfig::defaults() {
    RunConfig config;
    config.endpoints = {
        {"vision", "llava", std::chrono::milliseconds(30000), true},
        {"reasoning", "phi3", std::chrono::milliseconds(20000), false},
        {"fallback", "mistral", std::chrono::milliseconds(15000), false}
    };
    return config;
}

namespace {
    void fail(const std::string& message, const std::string& details = "") {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        message, details, "RunConfig::validate");
    }
}

void RunConfig::validate() const {
    if (historyCapacity < 1) {
        fail("run.history_capacity must be at least 1");
    }
    if (workerThreads < 1) {
        fail("run.worker_threads must be at least 1");
    }
    if (maxCycles < 1) {
        fail("budget.max_cycles must be at least 1");
    }
    if (maxRunDuration.count() <= 0) {
        fail("budget.max_run_duration_ms must be positive");
    }
    if (perceptionTimeout.count() <= 0 || executionTimeout.count() <= 0 ||
        confirmationWindow.count() <= 0 || cancellationPoll.count() <= 0) {
        fail("timeouts must be positive");
    }
    if (retry.perceptionMaxAttempts < 1 || retry.reasoningMaxAttempts < 1 ||
        retry.executionMaxConsecutiveFailures < 1 || retry.maxConsecutiveFailures < 1) {
        fail("retry attempt limits must be at least 1");
    }
    if (retry.initialBackoff.count() < 0 || retry.maxBackoff.count() < 0 ||
        retry.backoffMultiplier < 1.0) {
        fail("retry backoff must be non-negative with multiplier >= 1");
    }
    if (!riskTable.isTotal()) {
        std::vector<std::string> names;
        for (ActionKind kind : riskTable.missingKinds()) {
            names.push_back(actionKindToString(kind));
        }
        fail("safety.risk_levels is missing action kinds", utils::StringUtils::join(names, ", "));
    }
    if (endpoints.empty()) {
        fail("models must list at least one endpoint");
    }
    for (const auto& endpoint : endpoints) {
        if (endpoint.name.empty()) {
            fail("every model endpoint needs a name");
        }
        if (endpoint.timeout.count() <= 0) {
            fail("model endpoint timeout must be positive", endpoint.name);
        }
    }
    if (metricsQueueCapacity < 1) {
        fail("metrics.queue_capacity must be at least 1");
    }
}

nlohmann::json RunConfig::toJson() const {
    nlohmann::json models = nlohmann::json::array();
    for (const auto& endpoint : endpoints) {
        models.push_back({
            {"name", endpoint.name},
            {"model", endpoint.model},
            {"timeout_ms", endpoint.timeout.count()},
            {"vision", endpoint.vision}
        });
    }

    return {
        {"run", {{"history_capacity", historyCapacity}, {"worker_threads", workerThreads}}},
        {"budget", {{"max_cycles", maxCycles}, {"max_run_duration_ms", maxRunDuration.count()}}},
        {"timeouts", {
            {"perception_ms", perceptionTimeout.count()},
            {"execution_ms", executionTimeout.count()},
            {"confirmation_window_ms", confirmationWindow.count()},
            {"cancellation_poll_ms", cancellationPoll.count()}
        }},
        {"retry", {
            {"perception_max_attempts", retry.perceptionMaxAttempts},
            {"reasoning_max_attempts", retry.reasoningMaxAttempts},
            {"execution_max_consecutive_failures", retry.executionMaxConsecutiveFailures},
            {"max_consecutive_failures", retry.maxConsecutiveFailures},
            {"initial_backoff_ms", retry.initialBackoff.count()},
            {"backoff_multiplier", retry.backoffMultiplier},
            {"max_backoff_ms", retry.maxBackoff.count()}
        }},
        {"safety", {{"risk_levels", riskTable.toJson()}, {"denylist", denylist}}},
        {"models", models},
        {"metrics", {{"queue_capacity", metricsQueueCapacity}, {"jsonl_file", metricsFile}}}
    };
}

} // namespace deskpilot
