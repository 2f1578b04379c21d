#ifndef DESKPILOT_PERCEPTION_PORT_H
#define DESKPILOT_PERCEPTION_PORT_H

#include <chrono>
#include "../common/types.h"
#include "../common/cancellation.h"

namespace deskpilot {

/**
 * @brief Produces a Snapshot of the current interface state on demand
 *
 * capture() throws DeskpilotException(PERCEPTION_FAILURE) (or any other
 * exception) on failure. The orchestrator abandons a capture that outlives the
 * timeout or the token, so implementations should stop on their own as well.
 */
class PerceptionPort {
public:
    virtual ~PerceptionPort() = default;

    virtual Snapshot capture(std::chrono::milliseconds timeout, const CancellationToken& token) = 0;
};

} // namespace deskpilot

#endif // DESKPILOT_PERCEPTION_PORT_H
