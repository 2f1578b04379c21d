#ifndef DESKPILOT_SCENARIO_H
#define DESKPILOT_SCENARIO_H

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/types.h"
#include "../common/run_config.h"
#include "../ports/perception_port.h"
#include "../ports/action_port.h"
#include "../model_gateway/chat_model_endpoint.h"

namespace deskpilot {
namespace simulation {

/**
 * @brief One scripted perception result
 *
 * With failure set, capture() throws it instead of returning the snapshot.
 */
struct ScriptedCapture {
    Snapshot snapshot;
    std::string failure;
    std::chrono::milliseconds delay{0};
};

/**
 * @brief Replays scripted snapshots in order; the last one repeats
 */
class ScriptedPerception : public PerceptionPort {
public:
    explicit ScriptedPerception(std::vector<ScriptedCapture> script);

    Snapshot capture(std::chrono::milliseconds timeout, const CancellationToken& token) override;

    size_t captureCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<ScriptedCapture> m_script;
    size_t m_next;
    size_t m_calls;
};

struct ScriptedOutcome {
    ExecutionStatus status = ExecutionStatus::SUCCEEDED;
    std::string reason;
    std::chrono::milliseconds delay{0};
};

/**
 * @brief Records every executed proposal and replies with scripted outcomes
 *
 * Once the script runs out every action succeeds.
 */
class ScriptedActionPort : public ActionPort {
public:
    explicit ScriptedActionPort(std::vector<ScriptedOutcome> script = {});

    ExecutionResult execute(const ActionProposal& proposal,
                            std::chrono::milliseconds timeout,
                            const CancellationToken& token) override;

    std::vector<ActionProposal> executed() const;
    size_t executeCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<ScriptedOutcome> m_script;
    size_t m_next;
    std::vector<ActionProposal> m_executed;
};

struct ScriptedReply {
    std::string text;
    std::string error;
    bool unavailable = false;
    std::chrono::milliseconds delay{0};
};

struct ModelScript {
    bool available = true;
    std::vector<ScriptedReply> replies;
};

/**
 * @brief InferenceTransport answering from per-model reply scripts
 *
 * Replies for a model are consumed in order and the last one repeats. A model
 * with no script is unreachable.
 */
class ScriptedTransport : public InferenceTransport {
public:
    explicit ScriptedTransport(std::map<std::string, ModelScript> scripts);

    std::string complete(const std::string& model,
                         const nlohmann::json& payload,
                         std::chrono::milliseconds timeout,
                         const CancellationToken& token) override;

    bool ping(const std::string& model) override;

    size_t callCount(const std::string& model) const;

    // Models in the order complete() was called
    std::vector<std::string> callOrder() const;

    nlohmann::json lastPayload(const std::string& model) const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, ModelScript> m_scripts;
    std::map<std::string, size_t> m_next;
    std::map<std::string, nlohmann::json> m_lastPayloads;
    std::vector<std::string> m_callOrder;
};

/**
 * @brief A scripted desktop: goal, screens, model replies and action outcomes
 *
 * Scenario files drive the command-line agent without a real desktop.
 */
struct Scenario {
    Goal goal;
    std::shared_ptr<ScriptedPerception> perception;
    std::shared_ptr<ScriptedActionPort> actions;
    std::shared_ptr<ScriptedTransport> transport;

    /**
     * @brief One ChatModelEndpoint per configured endpoint, all on the scripted transport
     */
    std::vector<std::shared_ptr<ReasoningEndpoint>> buildEndpoints(const RunConfig& config) const;

    /**
     * @throws DeskpilotException CONFIGURATION_ERROR on a malformed scenario
     */
    static Scenario fromJson(const nlohmann::json& document);
    static Scenario load(const std::string& path);
};

} // namespace simulation
} // namespace deskpilot

#endif // DESKPILOT_SCENARIO_H
