#ifndef DESKPILOT_CONFIRMATION_CHANNEL_H
#define DESKPILOT_CONFIRMATION_CHANNEL_H

#include <mutex>
#include <chrono>
#include <cstdint>
#include <optional>
#include <functional>
#include <condition_variable>
#include "../common/types.h"
#include "../common/cancellation.h"

namespace deskpilot {

enum class ConfirmationResult {
    APPROVED,
    DENIED,
    TIMED_OUT,
    CANCELLED
};

std::string confirmationResultToString(ConfirmationResult result);

/**
 * @brief Operator approve/deny answers, correlated by cycle sequence number
 *
 * Only the cycle currently waiting can be answered, and only once. Answers
 * for cycles that are not pending (resolved, or not yet asked) are refused.
 */
class ConfirmationChannel {
public:
    using RequestListener = std::function<void(uint64_t sequence,
                                               const ActionProposal& proposal,
                                               const SafetyDecision& decision)>;

    ConfirmationChannel();

    /**
     * @return false unless sequence is the pending request and still unanswered
     */
    bool deliver(uint64_t sequence, bool approved);

    /**
     * @brief Called on the waiting thread when a confirmation is requested. Must not block.
     */
    void setRequestListener(RequestListener listener);

    /**
     * @brief Block until an answer for sequence arrives, the window passes or the token fires
     */
    ConfirmationResult awaitDecision(uint64_t sequence,
                                     const ActionProposal& proposal,
                                     const SafetyDecision& decision,
                                     std::chrono::milliseconds window,
                                     const CancellationToken& token,
                                     std::chrono::milliseconds pollInterval);

    std::optional<uint64_t> pendingSequence() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::optional<uint64_t> m_pending;
    std::optional<bool> m_answer;
    RequestListener m_listener;
};

} // namespace deskpilot

#endif // DESKPILOT_CONFIRMATION_CHANNEL_H
