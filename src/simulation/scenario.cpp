#include "scenario.h"
#include "../common/error_handler.h"
#include "../common/file_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <stdexcept>

namespace deskpilot {
namespace simulation {

namespace {
    void scenarioError(const std::string& message, const std::string& details = "") {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        message, details, "Scenario");
    }

    // Sleep the scripted delay; true if the token fired first
    bool scriptedDelay(std::chrono::milliseconds delay, std::chrono::milliseconds timeout,
                       const CancellationToken& token, const std::string& what) {
        if (delay.count() <= 0) {
            return token.isCancelled();
        }
        if (token.waitFor(std::min(delay, timeout))) {
            return true;
        }
        if (delay > timeout) {
            throw std::runtime_error(what + " timed out after " + std::to_string(timeout.count()) + " ms");
        }
        return false;
    }

    std::chrono::milliseconds delayOf(const nlohmann::json& entry) {
        return std::chrono::milliseconds(entry.value("delay_ms", 0));
    }

    Snapshot parseSnapshot(const nlohmann::json& entry, size_t index) {
        Snapshot snapshot;
        snapshot.id = entry.value("id", "snapshot-" + std::to_string(index + 1));
        snapshot.imageRef = entry.value("image_ref", "");
        snapshot.description = entry.value("description", "");

        if (entry.contains("text")) {
            for (const auto& region : entry.at("text")) {
                TextRegion text;
                if (region.is_string()) {
                    text.text = region.get<std::string>();
                } else {
                    text.text = region.value("text", "");
                    text.x = region.value("x", 0);
                    text.y = region.value("y", 0);
                    text.width = region.value("width", 0);
                    text.height = region.value("height", 0);
                    text.confidence = region.value("confidence", 1.0);
                }
                snapshot.textRegions.push_back(text);
            }
        }

        if (entry.contains("elements")) {
            for (const auto& item : entry.at("elements")) {
                UiElement element;
                element.id = item.value("id", "");
                element.role = item.value("role", "");
                element.label = item.value("label", "");
                element.x = item.value("x", 0);
                element.y = item.value("y", 0);
                element.width = item.value("width", 0);
                element.height = item.value("height", 0);
                snapshot.elements.push_back(element);
            }
        }
        return snapshot;
    }

    ExecutionStatus parseStatus(const std::string& name) {
        if (name == "succeeded" || name == "success") {
            return ExecutionStatus::SUCCEEDED;
        }
        if (name == "failed" || name == "failure") {
            return ExecutionStatus::FAILED;
        }
        if (name == "cancelled") {
            return ExecutionStatus::CANCELLED;
        }
        scenarioError("Unknown scripted action status", name);
        return ExecutionStatus::FAILED;
    }
}

// ScriptedPerception

ScriptedPerception::ScriptedPerception(std::vector<ScriptedCapture> script)
    : m_script(std::move(script))
    , m_next(0)
    , m_calls(0) {}

Snapshot ScriptedPerception::capture(std::chrono::milliseconds timeout, const CancellationToken& token) {
    ScriptedCapture step;
    size_t call = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        call = ++m_calls;
        if (m_script.empty()) {
            DESKPILOT_THROW(ErrorType::PERCEPTION_FAILURE, ErrorSeverity::MEDIUM,
                            "No scripted screens", "", "ScriptedPerception");
        }
        step = m_script[std::min(m_next, m_script.size() - 1)];
        if (m_next < m_script.size()) {
            m_next++;
        }
    }

    if (scriptedDelay(step.delay, timeout, token, "capture")) {
        throw std::runtime_error("capture cancelled");
    }
    if (!step.failure.empty()) {
        DESKPILOT_THROW(ErrorType::PERCEPTION_FAILURE, ErrorSeverity::MEDIUM,
                        step.failure, "call " + std::to_string(call), "ScriptedPerception");
    }

    Snapshot snapshot = step.snapshot;
    snapshot.capturedAt = std::chrono::system_clock::now();
    return snapshot;
}

size_t ScriptedPerception::captureCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_calls;
}

// ScriptedActionPort

ScriptedActionPort::ScriptedActionPort(std::vector<ScriptedOutcome> script)
    : m_script(std::move(script))
    , m_next(0) {}

ExecutionResult ScriptedActionPort::execute(const ActionProposal& proposal,
                                            std::chrono::milliseconds timeout,
                                            const CancellationToken& token) {
    ScriptedOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_executed.push_back(proposal);
        if (m_next < m_script.size()) {
            outcome = m_script[m_next++];
        }
    }

    const auto started = std::chrono::steady_clock::now();
    if (scriptedDelay(outcome.delay, timeout, token, actionKindToString(proposal.kind))) {
        return ExecutionResult::cancelled("emergency stop", std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    switch (outcome.status) {
        case ExecutionStatus::SUCCEEDED:
            return ExecutionResult::succeeded(elapsed);
        case ExecutionStatus::CANCELLED:
            return ExecutionResult::cancelled(outcome.reason, elapsed);
        case ExecutionStatus::FAILED:
        default:
            return ExecutionResult::failed(outcome.reason.empty() ? "scripted failure" : outcome.reason, elapsed);
    }
}

std::vector<ActionProposal> ScriptedActionPort::executed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_executed;
}

size_t ScriptedActionPort::executeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_executed.size();
}

// ScriptedTransport

ScriptedTransport::ScriptedTransport(std::map<std::string, ModelScript> scripts)
    : m_scripts(std::move(scripts)) {}

std::string ScriptedTransport::complete(const std::string& model,
                                        const nlohmann::json& payload,
                                        std::chrono::milliseconds timeout,
                                        const CancellationToken& token) {
    ScriptedReply reply;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callOrder.push_back(model);
        m_lastPayloads[model] = payload;

        auto it = m_scripts.find(model);
        if (it == m_scripts.end() || !it->second.available || it->second.replies.empty()) {
            reply.unavailable = true;
        } else {
            size_t& next = m_next[model];
            const auto& replies = it->second.replies;
            reply = replies[std::min(next, replies.size() - 1)];
            if (next < replies.size()) {
                next++;
            }
        }
    }

    if (reply.unavailable) {
        DESKPILOT_THROW(ErrorType::MODEL_UNAVAILABLE, ErrorSeverity::MEDIUM,
                        "Model not reachable", model, "ScriptedTransport");
    }
    if (scriptedDelay(reply.delay, timeout, token, model)) {
        throw std::runtime_error("inference cancelled");
    }
    if (!reply.error.empty()) {
        throw std::runtime_error(reply.error);
    }
    return reply.text;
}

bool ScriptedTransport::ping(const std::string& model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_scripts.find(model);
    return it != m_scripts.end() && it->second.available;
}

size_t ScriptedTransport::callCount(const std::string& model) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count(m_callOrder.begin(), m_callOrder.end(), model));
}

std::vector<std::string> ScriptedTransport::callOrder() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callOrder;
}

nlohmann::json ScriptedTransport::lastPayload(const std::string& model) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_lastPayloads.find(model);
    return it != m_lastPayloads.end() ? it->second : nlohmann::json();
}

// Scenario

std::vector<std::shared_ptr<ReasoningEndpoint>> Scenario::buildEndpoints(const RunConfig& config) const {
    std::vector<std::shared_ptr<ReasoningEndpoint>> endpoints;
    for (const auto& endpoint : config.endpoints) {
        endpoints.push_back(std::make_shared<ChatModelEndpoint>(endpoint, transport));
    }
    return endpoints;
}

Scenario Scenario::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        scenarioError("Scenario root must be a JSON object");
    }

    Scenario scenario;
    try {
        const auto& goal = document.at("goal");
        if (goal.is_string()) {
            scenario.goal.objective = goal.get<std::string>();
        } else {
            scenario.goal.objective = goal.at("objective").get<std::string>();
            scenario.goal.constraints = goal.value("constraints", nlohmann::json::object());
        }

        std::vector<ScriptedCapture> captures;
        const auto snapshots = document.value("snapshots", nlohmann::json::array());
        for (size_t i = 0; i < snapshots.size(); ++i) {
            ScriptedCapture capture;
            capture.snapshot = parseSnapshot(snapshots[i], i);
            capture.failure = snapshots[i].value("fail", "");
            capture.delay = delayOf(snapshots[i]);
            captures.push_back(std::move(capture));
        }

        std::map<std::string, ModelScript> models;
        const auto modelEntries = document.value("models", nlohmann::json::object());
        for (auto it = modelEntries.begin(); it != modelEntries.end(); ++it) {
            ModelScript script;
            script.available = it.value().value("available", true);
            for (const auto& entry : it.value().value("replies", nlohmann::json::array())) {
                ScriptedReply reply;
                if (entry.contains("reply")) {
                    reply.text = entry.at("reply").dump();
                } else {
                    reply.text = entry.value("text", "");
                }
                reply.error = entry.value("error", "");
                reply.unavailable = entry.value("unavailable", false);
                reply.delay = delayOf(entry);
                script.replies.push_back(std::move(reply));
            }
            models[it.key()] = std::move(script);
        }

        std::vector<ScriptedOutcome> outcomes;
        for (const auto& entry : document.value("actions", nlohmann::json::array())) {
            ScriptedOutcome outcome;
            outcome.status = parseStatus(entry.value("status", "succeeded"));
            outcome.reason = entry.value("reason", "");
            outcome.delay = delayOf(entry);
            outcomes.push_back(std::move(outcome));
        }

        scenario.perception = std::make_shared<ScriptedPerception>(std::move(captures));
        scenario.actions = std::make_shared<ScriptedActionPort>(std::move(outcomes));
        scenario.transport = std::make_shared<ScriptedTransport>(std::move(models));
    } catch (const nlohmann::json::exception& e) {
        scenarioError("Malformed scenario", e.what());
    }

    if (scenario.goal.objective.empty()) {
        scenarioError("Scenario goal is empty");
    }
    return scenario;
}

Scenario Scenario::load(const std::string& path) {
    nlohmann::json document;
    std::string error;
    if (!utils::FileUtils::loadJsonFromFile(path, document, &error)) {
        scenarioError("Cannot load scenario", error);
    }

    Scenario scenario = fromJson(document);
    SLOG_INFO().message("Scenario loaded")
        .context("path", path)
        .context("objective", scenario.goal.objective);
    return scenario;
}

} // namespace simulation
} // namespace deskpilot
