#include "confirmation_channel.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace deskpilot {

std::string confirmationResultToString(ConfirmationResult result) {
    switch (result) {
        case ConfirmationResult::APPROVED: return "approved";
        case ConfirmationResult::DENIED: return "denied";
        case ConfirmationResult::TIMED_OUT: return "timed_out";
        case ConfirmationResult::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

ConfirmationChannel::ConfirmationChannel() = default;

bool ConfirmationChannel::deliver(uint64_t sequence, bool approved) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pending != sequence || m_answer.has_value()) {
            SLOG_WARNING().message("Confirmation ignored: no request pending for this cycle")
                .context("pending", m_pending ? nlohmann::json(*m_pending) : nlohmann::json(nullptr))
                .cycle(sequence);
            return false;
        }
        m_answer = approved;
    }
    m_condition.notify_all();
    return true;
}

void ConfirmationChannel::setRequestListener(RequestListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

std::optional<uint64_t> ConfirmationChannel::pendingSequence() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

ConfirmationResult ConfirmationChannel::awaitDecision(uint64_t sequence,
                                                      const ActionProposal& proposal,
                                                      const SafetyDecision& decision,
                                                      std::chrono::milliseconds window,
                                                      const CancellationToken& token,
                                                      std::chrono::milliseconds pollInterval) {
    RequestListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending = sequence;
        m_answer.reset();
        listener = m_listener;
    }
    if (listener) {
        listener(sequence, proposal, decision);
    }

    if (pollInterval.count() <= 0) {
        pollInterval = std::chrono::milliseconds(1);
    }
    const auto deadline = std::chrono::steady_clock::now() + window;

    std::unique_lock<std::mutex> lock(m_mutex);
    ConfirmationResult result = ConfirmationResult::TIMED_OUT;
    while (true) {
        if (m_answer) {
            result = *m_answer ? ConfirmationResult::APPROVED : ConfirmationResult::DENIED;
            break;
        }
        if (token.isCancelled()) {
            result = ConfirmationResult::CANCELLED;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result = ConfirmationResult::TIMED_OUT;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        m_condition.wait_for(lock, std::min(remaining, pollInterval));
    }

    m_pending.reset();
    m_answer.reset();
    return result;
}

} // namespace deskpilot
