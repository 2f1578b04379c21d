#include "safety_gate.h"
#include "../common/string_utils.h"

namespace deskpilot {

SafetyGate::SafetyGate(const RiskTable& riskTable, const std::vector<std::string>& denylist)
    : m_riskTable(riskTable) {
    for (const auto& term : denylist) {
        std::string trimmed = utils::StringUtils::trim(term);
        if (!trimmed.empty()) {
            m_denylist.push_back(trimmed);
        }
    }
}

RiskLevel SafetyGate::effectiveLevel(const ActionProposal& proposal) const {
    RiskLevel level = m_riskTable.levelFor(proposal.kind);
    if (proposal.riskHint && static_cast<int>(*proposal.riskHint) > static_cast<int>(level)) {
        level = *proposal.riskHint;
    }
    return level;
}

std::string SafetyGate::findDeniedTerm(const ActionProposal& proposal) const {
    const std::string targetText = proposal.target.describe();
    for (const auto& term : m_denylist) {
        if (utils::StringUtils::containsIgnoreCase(proposal.rationale, term) ||
            utils::StringUtils::containsIgnoreCase(targetText, term)) {
            return term;
        }
    }
    return "";
}

SafetyDecision SafetyGate::evaluate(const ActionProposal& proposal) const {
    SafetyDecision decision;
    decision.level = effectiveLevel(proposal);

    std::string term = findDeniedTerm(proposal);
    if (!term.empty()) {
        decision.verdict = SafetyVerdict::DENIED;
        decision.matchedTerm = term;
        decision.reason = "denylist term '" + term + "'";
        return decision;
    }

    switch (decision.level) {
        case RiskLevel::SAFE:
            decision.verdict = SafetyVerdict::APPROVED;
            decision.reason = "risk level 0";
            break;
        case RiskLevel::LOW:
            decision.verdict = SafetyVerdict::APPROVED_WITH_LOG;
            decision.reason = "risk level 1";
            break;
        case RiskLevel::MEDIUM:
            decision.verdict = SafetyVerdict::APPROVED_WITH_LOG;
            decision.audit = true;
            decision.reason = "risk level 2";
            break;
        case RiskLevel::REQUIRES_CONFIRMATION:
        default:
            decision.verdict = SafetyVerdict::PENDING_CONFIRMATION;
            decision.reason = "risk level 3 requires confirmation";
            break;
    }
    return decision;
}

SafetyDecision SafetyGate::resolveConfirmation(const SafetyDecision& pending,
                                               const std::optional<bool>& approved) const {
    SafetyDecision decision = pending;
    decision.audit = true;

    if (!approved) {
        decision.verdict = SafetyVerdict::DENIED;
        decision.reason = "confirmation window expired";
    } else if (*approved) {
        decision.verdict = SafetyVerdict::APPROVED_WITH_LOG;
        decision.reason = "confirmed by operator";
    } else {
        decision.verdict = SafetyVerdict::DENIED;
        decision.reason = "denied by operator";
    }
    return decision;
}

} // namespace deskpilot
