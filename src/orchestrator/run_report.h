#ifndef DESKPILOT_RUN_REPORT_H
#define DESKPILOT_RUN_REPORT_H

#include <map>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/types.h"

namespace deskpilot {

/**
 * @brief Summary of one run, returned with every RunOutcome
 */
struct RunReport {
    struct EndpointUsage {
        size_t attempts = 0;
        size_t successes = 0;
        std::chrono::milliseconds totalLatency{0};
    };

    std::string runId;
    std::string objective;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::milliseconds duration{0};

    uint64_t cycles = 0;
    size_t actionsSucceeded = 0;
    size_t actionsFailed = 0;
    size_t actionsCancelled = 0;
    size_t denials = 0;
    size_t confirmationsRequested = 0;
    size_t confirmationsApproved = 0;
    size_t confirmationTimeouts = 0;
    size_t perceptionFailures = 0;
    size_t reasoningExhaustions = 0;
    size_t pauses = 0;

    std::map<std::string, EndpointUsage> modelUsage;
    std::optional<TerminationReason> termination;

    nlohmann::json toJson() const;
};

} // namespace deskpilot

#endif // DESKPILOT_RUN_REPORT_H
