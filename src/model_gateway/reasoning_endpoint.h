#ifndef DESKPILOT_REASONING_ENDPOINT_H
#define DESKPILOT_REASONING_ENDPOINT_H

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/types.h"
#include "../common/cancellation.h"

namespace deskpilot {

/**
 * @brief Everything a model sees for one cycle
 */
struct ReasoningRequest {
    std::string runId;
    uint64_t sequence = 0;
    Goal goal;
    std::vector<CycleRecord> history;
    SnapshotSummary snapshot;
    std::string imageRef;
    std::optional<std::string> lastFailure;

    /**
     * @param includeImage Attach the snapshot image reference (vision endpoints only)
     */
    nlohmann::json toJson(bool includeImage) const;
};

/**
 * @brief One backing model
 *
 * infer() returns the raw model text; the gateway parses it. Failures are
 * reported by throwing: DeskpilotException(MODEL_UNAVAILABLE) when the model
 * cannot be reached, any other exception for transport errors. Implementations
 * should give up on their own once timeout passes or token is cancelled.
 */
class ReasoningEndpoint {
public:
    virtual ~ReasoningEndpoint() = default;

    virtual const std::string& name() const = 0;
    virtual std::chrono::milliseconds timeout() const = 0;
    virtual bool supportsVision() const { return false; }

    // Health check; false skips the endpoint for this attempt
    virtual bool isAvailable() { return true; }

    virtual std::string infer(const ReasoningRequest& request,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& token) = 0;
};

} // namespace deskpilot

#endif // DESKPILOT_REASONING_ENDPOINT_H
