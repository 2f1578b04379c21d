#include "proposal_parser.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"

namespace deskpilot {

namespace {
    void malformed(const std::string& message, const std::string& details = "") {
        DESKPILOT_THROW(ErrorType::MODEL_MALFORMED_RESPONSE, ErrorSeverity::LOW,
                        message, details, "ProposalParser");
    }

    bool hasNumber(const TargetDescriptor& target, const char* key) {
        return target.has(key) && target.parameters.at(key).is_number();
    }

    bool hasText(const TargetDescriptor& target, const char* key) {
        return target.has(key) && target.parameters.at(key).is_string() &&
               !target.parameters.at(key).get<std::string>().empty();
    }

    void requireText(ActionKind kind, const TargetDescriptor& target, const char* key) {
        if (!hasText(target, key)) {
            malformed("Target field missing for " + actionKindToString(kind), key);
        }
    }

    void requireNumber(ActionKind kind, const TargetDescriptor& target, const char* key) {
        if (!hasNumber(target, key)) {
            malformed("Target field missing for " + actionKindToString(kind), key);
        }
    }

    bool isSentinelAction(const std::string& action) {
        std::string lower = utils::StringUtils::toLowerCase(utils::StringUtils::trim(action));
        return lower == "goal_satisfied" || lower == "done";
    }
}

std::optional<std::string> ProposalParser::extractJsonObject(const std::string& text) {
    std::string source = text;

    // Prefer the body of the first fenced block; an unclosed fence runs to the end
    const std::string fence = "```";
    size_t open = text.find(fence);
    if (open != std::string::npos) {
        size_t body = open + fence.size();
        if (text.compare(body, 4, "json") == 0) {
            body += 4;
        }
        size_t close = text.find(fence, body);
        source = text.substr(body, close == std::string::npos ? std::string::npos : close - body);
    }

    size_t start = source.find('{');
    while (start != std::string::npos) {
        int depth = 0;
        bool inString = false;
        bool escaped = false;

        for (size_t i = start; i < source.size(); ++i) {
            char c = source[i];
            if (inString) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    inString = false;
                }
                continue;
            }
            if (c == '"') {
                inString = true;
            } else if (c == '{') {
                depth++;
            } else if (c == '}') {
                depth--;
                if (depth == 0) {
                    return source.substr(start, i - start + 1);
                }
            }
        }
        // Unbalanced from this brace; try the next one
        start = source.find('{', start + 1);
    }
    return std::nullopt;
}

void ProposalParser::validateTarget(ActionKind kind, const TargetDescriptor& target) {
    switch (kind) {
        case ActionKind::POINTER_MOVE:
        case ActionKind::CLICK:
        case ActionKind::DOUBLE_CLICK:
            if (target.element.empty() && !(hasNumber(target, "x") && hasNumber(target, "y"))) {
                malformed("Target needs an element or x and y for " + actionKindToString(kind));
            }
            break;
        case ActionKind::DRAG:
            requireNumber(kind, target, "x");
            requireNumber(kind, target, "y");
            requireNumber(kind, target, "end_x");
            requireNumber(kind, target, "end_y");
            break;
        case ActionKind::TEXT_ENTRY:
        case ActionKind::PASSWORD_ENTRY:
            requireText(kind, target, "text");
            break;
        case ActionKind::KEY_INPUT:
            requireText(kind, target, "key");
            break;
        case ActionKind::LAUNCH_APP:
        case ActionKind::CLOSE_APP:
            requireText(kind, target, "app");
            break;
        case ActionKind::FILE_OPERATION:
            requireText(kind, target, "operation");
            requireText(kind, target, "path");
            break;
        case ActionKind::SYSTEM_COMMAND:
            requireText(kind, target, "command");
            break;
        case ActionKind::SCROLL:
        case ActionKind::WAIT:
            break;
    }
}

ModelReply ProposalParser::parse(const std::string& text) {
    auto jsonText = extractJsonObject(text);
    if (!jsonText) {
        malformed("Model reply contains no JSON object", utils::StringUtils::truncate(text, 200));
    }

    ModelReply reply;
    try {
        reply.raw = nlohmann::json::parse(*jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        malformed("Model reply is not valid JSON", e.what());
    }

    const auto& j = reply.raw;
    std::string rationale;
    if (j.contains("rationale") && j["rationale"].is_string()) {
        rationale = j["rationale"].get<std::string>();
    } else if (j.contains("reasoning") && j["reasoning"].is_string()) {
        rationale = j["reasoning"].get<std::string>();
    }

    std::optional<double> confidence;
    if (j.contains("confidence")) {
        if (!j["confidence"].is_number()) {
            malformed("confidence must be a number");
        }
        confidence = j["confidence"].get<double>();
        if (*confidence < 0.0 || *confidence > 1.0) {
            malformed("confidence outside [0,1]", std::to_string(*confidence));
        }
    }

    std::string action;
    if (j.contains("action") && j["action"].is_string()) {
        action = j["action"].get<std::string>();
    }

    bool goalSatisfied = j.contains("goal_satisfied") && j["goal_satisfied"].is_boolean() &&
                         j["goal_satisfied"].get<bool>();
    if (goalSatisfied || isSentinelAction(action)) {
        reply.proposal = ActionProposal::goalSatisfiedSentinel(rationale, confidence.value_or(1.0));
        return reply;
    }

    if (action.empty()) {
        malformed("Model reply has no action");
    }
    auto kind = actionKindFromString(action);
    if (!kind) {
        malformed("Unknown action kind", action);
    }
    if (!confidence) {
        malformed("Model reply has no confidence");
    }

    TargetDescriptor target;
    if (j.contains("target")) {
        const auto& t = j["target"];
        if (t.is_object()) {
            target.parameters = t;
            if (t.contains("element") && t["element"].is_string()) {
                target.element = t["element"].get<std::string>();
                target.parameters.erase("element");
            }
        } else if (t.is_string()) {
            target.element = t.get<std::string>();
        } else if (!t.is_null()) {
            malformed("target must be an object or a string");
        }
    }
    validateTarget(*kind, target);

    reply.proposal.kind = *kind;
    reply.proposal.target = target;
    reply.proposal.rationale = rationale;
    reply.proposal.confidence = *confidence;

    if (j.contains("risk_hint") && !j["risk_hint"].is_null()) {
        if (!j["risk_hint"].is_number_integer()) {
            malformed("risk_hint must be an integer 0..3");
        }
        auto hint = riskLevelFromInt(j["risk_hint"].get<int>());
        if (!hint) {
            malformed("risk_hint outside 0..3");
        }
        reply.proposal.riskHint = hint;
    }

    return reply;
}

} // namespace deskpilot
