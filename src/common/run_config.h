#ifndef DESKPILOT_RUN_CONFIG_H
#define DESKPILOT_RUN_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstdint>
#include "types.h"

namespace deskpilot {

struct EndpointConfig {
    std::string name;
    std::string model;
    std::chrono::milliseconds timeout{20000};
    bool vision = false;
};

struct RetryPolicy {
    int perceptionMaxAttempts = 3;
    int reasoningMaxAttempts = 2;
    int executionMaxConsecutiveFailures = 3;
    int maxConsecutiveFailures = 5;
    std::chrono::milliseconds initialBackoff{200};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoff{5000};

    /**
     * @brief Delay before retry number attempt (0-based), capped at maxBackoff
     */
    std::chrono::milliseconds backoffFor(int attempt) const;
};

/**
 * @brief Mapping from action kind to risk level
 *
 * A table loaded from configuration must be total over allActionKinds();
 * levelFor() still answers REQUIRES_CONFIRMATION for a kind it does not hold.
 */
class RiskTable {
public:
    static RiskTable defaults();

    void set(ActionKind kind, RiskLevel level);
    RiskLevel levelFor(ActionKind kind) const;
    bool contains(ActionKind kind) const;
    bool isTotal() const;
    std::vector<ActionKind> missingKinds() const;

    nlohmann::json toJson() const;

private:
    std::map<ActionKind, RiskLevel> m_levels;
};

std::vector<std::string> defaultDenylist();

/**
 * @brief Immutable per-run configuration
 *
 * Built by ConfigManager::buildRunConfig() or RunConfig::defaults(); a run
 * copies it at start and never observes later edits.
 */
struct RunConfig {
    size_t historyCapacity = 20;
    size_t workerThreads = 4;

    uint64_t maxCycles = 50;
    std::chrono::milliseconds maxRunDuration{600000};

    std::chrono::milliseconds perceptionTimeout{5000};
    std::chrono::milliseconds executionTimeout{10000};
    std::chrono::milliseconds confirmationWindow{30000};
    std::chrono::milliseconds cancellationPoll{25};

    RetryPolicy retry;
    RiskTable riskTable = RiskTable::defaults();
    std::vector<std::string> denylist = defaultDenylist();

    std::vector<EndpointConfig> endpoints;

    size_t metricsQueueCapacity = 1024;
    std::string metricsFile;

    static RunConfig defaults();

    /**
     * @brief Check every bound
     * @throws DeskpilotException with CONFIGURATION_ERROR on the first violation
     */
    void validate() const;

    nlohmann::json toJson() const;
};

} // namespace deskpilot

#endif // DESKPILOT_RUN_CONFIG_H
