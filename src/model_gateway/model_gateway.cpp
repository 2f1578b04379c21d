#include "model_gateway.h"
#include "proposal_parser.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace deskpilot {

namespace {
    struct EndpointReply {
        bool available = true;
        std::string text;
    };
}

std::string attemptOutcomeToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::SUCCEEDED: return "succeeded";
        case AttemptOutcome::TIMED_OUT: return "timeout";
        case AttemptOutcome::UNAVAILABLE: return "unavailable";
        case AttemptOutcome::MALFORMED: return "malformed";
        case AttemptOutcome::FAILED: return "error";
        case AttemptOutcome::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

ModelGateway::ModelGateway(std::vector<std::shared_ptr<ReasoningEndpoint>> endpoints,
                           ThreadPool& pool,
                           std::shared_ptr<MetricsSink> metrics,
                           std::chrono::milliseconds pollInterval)
    : m_endpoints(std::move(endpoints))
    , m_pool(pool)
    , m_metrics(std::move(metrics))
    , m_pollInterval(pollInterval) {
    if (m_endpoints.empty()) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Model gateway needs at least one endpoint", "", "ModelGateway");
    }
    for (const auto& endpoint : m_endpoints) {
        if (!endpoint) {
            DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                            "Model gateway endpoint is null", "", "ModelGateway");
        }
    }
}

std::vector<std::string> ModelGateway::endpointNames() const {
    std::vector<std::string> names;
    for (const auto& endpoint : m_endpoints) {
        names.push_back(endpoint->name());
    }
    return names;
}

GatewayResult ModelGateway::invoke(const ReasoningRequest& request,
                                   std::shared_ptr<const CancellationToken> token) {
    GatewayResult result;

    for (size_t i = 0; i < m_endpoints.size(); ++i) {
        if (token->isCancelled()) {
            result.status = GatewayStatus::CANCELLED;
            return result;
        }

        std::optional<ActionProposal> proposal;
        ModelAttempt current = attempt(m_endpoints[i], request, token, proposal);
        result.attempts.push_back(current);
        report(request, current, i);

        if (current.outcome == AttemptOutcome::CANCELLED) {
            result.status = GatewayStatus::CANCELLED;
            return result;
        }
        if (current.succeeded()) {
            result.status = GatewayStatus::OK;
            result.proposal = proposal;
            result.endpoint = current.endpoint;
            return result;
        }

        SLOG_WARNING().message("Model endpoint failed, falling back")
            .context("endpoint", current.endpoint)
            .context("outcome", attemptOutcomeToString(current.outcome))
            .context("detail", current.detail)
            .cycle(request.sequence);
    }

    result.status = GatewayStatus::EXHAUSTED;
    return result;
}

ModelAttempt ModelGateway::attempt(const std::shared_ptr<ReasoningEndpoint>& endpoint,
                                   const ReasoningRequest& request,
                                   const std::shared_ptr<const CancellationToken>& token,
                                   std::optional<ActionProposal>& proposal) {
    ModelAttempt record;
    record.endpoint = endpoint->name();

    const auto timeout = endpoint->timeout();
    const auto started = std::chrono::steady_clock::now();

    // The task owns copies of everything it touches so an abandoned call stays valid
    auto future = m_pool.submit([endpoint, request, token, timeout]() {
        EndpointReply reply;
        if (!endpoint->isAvailable()) {
            reply.available = false;
            return reply;
        }
        reply.text = endpoint->infer(request, timeout, *token);
        return reply;
    });

    AwaitStatus status = awaitWithCancellation(future, timeout, *token, m_pollInterval);
    record.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (status == AwaitStatus::CANCELLED) {
        record.outcome = AttemptOutcome::CANCELLED;
        record.detail = "emergency stop";
        return record;
    }
    if (status == AwaitStatus::TIMED_OUT) {
        record.outcome = AttemptOutcome::TIMED_OUT;
        record.detail = "no reply within " + std::to_string(timeout.count()) + " ms";
        return record;
    }

    EndpointReply reply;
    try {
        reply = future.get();
    } catch (const DeskpilotException& e) {
        record.outcome = e.type() == ErrorType::MODEL_UNAVAILABLE
            ? AttemptOutcome::UNAVAILABLE : AttemptOutcome::FAILED;
        record.detail = e.what();
        return record;
    } catch (const std::exception& e) {
        record.outcome = AttemptOutcome::FAILED;
        record.detail = e.what();
        return record;
    }

    if (!reply.available) {
        record.outcome = AttemptOutcome::UNAVAILABLE;
        record.latency = std::chrono::milliseconds(0);
        record.detail = "unavailable";
        return record;
    }

    try {
        ModelReply parsed = ProposalParser::parse(reply.text);
        proposal = parsed.proposal;
        record.outcome = AttemptOutcome::SUCCEEDED;
    } catch (const DeskpilotException& e) {
        record.outcome = AttemptOutcome::MALFORMED;
        record.detail = e.getErrorInfo().details.empty()
            ? e.what() : std::string(e.what()) + ": " + e.getErrorInfo().details;
    }
    return record;
}

void ModelGateway::report(const ReasoningRequest& request, const ModelAttempt& attempt, size_t position) {
    if (!m_metrics) {
        return;
    }
    nlohmann::json data = {
        {"endpoint", attempt.endpoint},
        {"position", position},
        {"success", attempt.succeeded()},
        {"outcome", attemptOutcomeToString(attempt.outcome)},
        {"latency_ms", attempt.latency.count()}
    };
    if (!attempt.detail.empty()) {
        data["detail"] = attempt.detail;
    }
    m_metrics->record(MetricsEvent(MetricsEventKind::MODEL_ATTEMPT, request.runId, request.sequence, data));
}

} // namespace deskpilot
