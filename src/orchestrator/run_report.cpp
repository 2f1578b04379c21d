#include "run_report.h"

namespace deskpilot {

nlohmann::json RunReport::toJson() const {
    nlohmann::json models = nlohmann::json::object();
    for (const auto& entry : modelUsage) {
        const auto& usage = entry.second;
        models[entry.first] = {
            {"attempts", usage.attempts},
            {"successes", usage.successes},
            {"avg_latency_ms", usage.attempts > 0
                ? static_cast<double>(usage.totalLatency.count()) / static_cast<double>(usage.attempts)
                : 0.0}
        };
    }

    return {
        {"run_id", runId},
        {"objective", objective},
        {"started_at", formatIsoTimestamp(startedAt)},
        {"duration_ms", duration.count()},
        {"cycles", cycles},
        {"actions", {
            {"succeeded", actionsSucceeded},
            {"failed", actionsFailed},
            {"cancelled", actionsCancelled}
        }},
        {"denials", denials},
        {"confirmations", {
            {"requested", confirmationsRequested},
            {"approved", confirmationsApproved},
            {"timed_out", confirmationTimeouts}
        }},
        {"perception_failures", perceptionFailures},
        {"reasoning_exhaustions", reasoningExhaustions},
        {"pauses", pauses},
        {"models", models},
        {"termination", termination ? terminationReasonToString(*termination) : "none"}
    };
}

} // namespace deskpilot
