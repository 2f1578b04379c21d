#ifndef DESKPILOT_PROPOSAL_PARSER_H
#define DESKPILOT_PROPOSAL_PARSER_H

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/types.h"

namespace deskpilot {

struct ModelReply {
    ActionProposal proposal;
    nlohmann::json raw;
};

/**
 * @brief Turns raw model text into an ActionProposal
 *
 * Expected reply object:
 * @code
 * {"action": "click", "target": {"x": 10, "y": 20}, "rationale": "...",
 *  "confidence": 0.9, "risk_hint": 0, "goal_satisfied": false}
 * @endcode
 * "action": "goal_satisfied" (or "done") and "goal_satisfied": true both
 * produce the goal-satisfied sentinel.
 */
class ProposalParser {
public:
    /**
     * @throws DeskpilotException MODEL_MALFORMED_RESPONSE when the text holds
     *         no JSON object, the action kind is unknown, confidence is outside
     *         [0,1] or a target field required by the kind is missing
     */
    static ModelReply parse(const std::string& text);

    /**
     * @brief Locate the reply object: a fenced ```json block if present,
     *        otherwise the first balanced {...} in the text
     */
    static std::optional<std::string> extractJsonObject(const std::string& text);

    /**
     * @throws DeskpilotException MODEL_MALFORMED_RESPONSE naming the missing field
     */
    static void validateTarget(ActionKind kind, const TargetDescriptor& target);
};

} // namespace deskpilot

#endif // DESKPILOT_PROPOSAL_PARSER_H
