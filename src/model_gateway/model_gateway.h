#ifndef DESKPILOT_MODEL_GATEWAY_H
#define DESKPILOT_MODEL_GATEWAY_H

#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include "reasoning_endpoint.h"
#include "../common/thread_pool.h"
#include "../metrics/metrics_sink.h"

namespace deskpilot {

enum class AttemptOutcome {
    SUCCEEDED,
    TIMED_OUT,
    UNAVAILABLE,
    MALFORMED,
    FAILED,
    CANCELLED
};

std::string attemptOutcomeToString(AttemptOutcome outcome);

struct ModelAttempt {
    std::string endpoint;
    AttemptOutcome outcome = AttemptOutcome::FAILED;
    std::chrono::milliseconds latency{0};
    std::string detail;

    bool succeeded() const { return outcome == AttemptOutcome::SUCCEEDED; }
};

enum class GatewayStatus {
    OK,
    EXHAUSTED,
    CANCELLED
};

struct GatewayResult {
    GatewayStatus status = GatewayStatus::EXHAUSTED;
    std::optional<ActionProposal> proposal;
    std::string endpoint;
    std::vector<ModelAttempt> attempts;
};

/**
 * @brief Ordered fallback over reasoning endpoints
 *
 * Endpoints are tried strictly in order; the next one is called only after the
 * current one timed out, reported unavailable, failed or replied with a
 * malformed proposal. Each call runs on the pool and is abandoned (not
 * interrupted) on timeout or cancellation.
 */
class ModelGateway {
public:
    ModelGateway(std::vector<std::shared_ptr<ReasoningEndpoint>> endpoints,
                 ThreadPool& pool,
                 std::shared_ptr<MetricsSink> metrics,
                 std::chrono::milliseconds pollInterval = std::chrono::milliseconds(25));

    /**
     * @brief Ask each endpoint in turn for a proposal
     *
     * Every attempt is recorded as a ModelAttempt event, whatever the overall
     * result. Returns CANCELLED as soon as the token fires.
     */
    GatewayResult invoke(const ReasoningRequest& request,
                         std::shared_ptr<const CancellationToken> token);

    size_t endpointCount() const { return m_endpoints.size(); }
    std::vector<std::string> endpointNames() const;

private:
    ModelAttempt attempt(const std::shared_ptr<ReasoningEndpoint>& endpoint,
                         const ReasoningRequest& request,
                         const std::shared_ptr<const CancellationToken>& token,
                         std::optional<ActionProposal>& proposal);

    void report(const ReasoningRequest& request, const ModelAttempt& attempt, size_t position);

    std::vector<std::shared_ptr<ReasoningEndpoint>> m_endpoints;
    ThreadPool& m_pool;
    std::shared_ptr<MetricsSink> m_metrics;
    std::chrono::milliseconds m_pollInterval;
};

} // namespace deskpilot

#endif // DESKPILOT_MODEL_GATEWAY_H
