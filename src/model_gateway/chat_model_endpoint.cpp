#include "chat_model_endpoint.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"

namespace deskpilot {

ChatModelEndpoint::ChatModelEndpoint(const EndpointConfig& config,
                                     std::shared_ptr<InferenceTransport> transport)
    : m_config(config), m_transport(std::move(transport)) {
    if (!m_transport) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Model endpoint has no inference transport", m_config.name,
                        "ChatModelEndpoint");
    }
}

const std::string& ChatModelEndpoint::systemPrompt() {
    static const std::string prompt = [] {
        std::vector<std::string> kinds;
        for (ActionKind kind : allActionKinds()) {
            kinds.push_back(actionKindToString(kind));
        }
        return std::string(
            "You control a desktop computer to accomplish the user's goal. "
            "Each turn you receive the goal, the recent action history and a "
            "description of the current screen. Reply with exactly one JSON object "
            "and nothing else:\n"
            "{\"action\": <kind>, \"target\": {...}, \"rationale\": <string>, "
            "\"confidence\": <0..1>, \"risk_hint\": <0..3 optional>}\n"
            "Allowed kinds: ") + utils::StringUtils::join(kinds, ", ") + ".\n"
            "Targets: click/double_click/pointer_move use \"element\" or \"x\",\"y\"; "
            "drag uses \"x\",\"y\",\"end_x\",\"end_y\"; text_entry and password_entry "
            "use \"text\"; key_input uses \"key\"; launch_app and close_app use \"app\"; "
            "file_operation uses \"operation\" and \"path\"; system_command uses \"command\".\n"
            "When the goal is already achieved reply {\"action\": \"goal_satisfied\", "
            "\"rationale\": <why>, \"confidence\": <0..1>}. If the previous action "
            "failed, choose a different approach.";
    }();
    return prompt;
}

nlohmann::json ChatModelEndpoint::buildPayload(const ReasoningRequest& request) const {
    nlohmann::json userMessage = {
        {"role", "user"},
        {"content", request.toJson(m_config.vision).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)}
    };
    if (m_config.vision && !request.imageRef.empty()) {
        userMessage["images"] = nlohmann::json::array({request.imageRef});
    }

    return {
        {"model", m_config.model},
        {"stream", false},
        {"format", "json"},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", systemPrompt()}},
            userMessage
        })}
    };
}

bool ChatModelEndpoint::isAvailable() {
    return m_transport->ping(m_config.model);
}

std::string ChatModelEndpoint::infer(const ReasoningRequest& request,
                                     std::chrono::milliseconds timeout,
                                     const CancellationToken& token) {
    SLOG_DEBUG().message("Sending reasoning request")
        .context("endpoint", m_config.name)
        .context("model", m_config.model)
        .context("vision", m_config.vision)
        .cycle(request.sequence);

    return m_transport->complete(m_config.model, buildPayload(request), timeout, token);
}

} // namespace deskpilot
