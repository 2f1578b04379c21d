#include "reasoning_endpoint.h"

namespace deskpilot {

nlohmann::json ReasoningRequest::toJson(bool includeImage) const {
    nlohmann::json historyJson = nlohmann::json::array();
    for (const auto& record : history) {
        nlohmann::json entry = {
            {"sequence", record.sequence},
            {"action", record.proposal.toJson()},
            {"decision", safetyVerdictToString(record.decision.verdict)}
        };
        if (record.execution) {
            entry["result"] = executionStatusToString(record.execution->status);
            if (!record.execution->reason.empty()) {
                entry["result_reason"] = record.execution->reason;
            }
        }
        historyJson.push_back(entry);
    }

    nlohmann::json j = {
        {"goal", goal.toJson()},
        {"cycle", sequence},
        {"history", historyJson},
        {"screen", snapshot.toJson()}
    };
    if (includeImage && !imageRef.empty()) {
        j["image_ref"] = imageRef;
    }
    if (lastFailure) {
        j["last_failure"] = *lastFailure;
    }
    return j;
}

} // namespace deskpilot
