#ifndef DESKPILOT_ACTION_PORT_H
#define DESKPILOT_ACTION_PORT_H

#include <chrono>
#include "../common/types.h"
#include "../common/cancellation.h"

namespace deskpilot {

/**
 * @brief Executes an approved action
 *
 * Failures are reported through ExecutionResult::failed(); a thrown exception
 * is recorded as a failure too. An implementation that notices the token
 * should return ExecutionResult::cancelled().
 */
class ActionPort {
public:
    virtual ~ActionPort() = default;

    virtual ExecutionResult execute(const ActionProposal& proposal,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken& token) = 0;
};

} // namespace deskpilot

#endif // DESKPILOT_ACTION_PORT_H
