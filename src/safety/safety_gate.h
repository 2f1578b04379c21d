#ifndef DESKPILOT_SAFETY_GATE_H
#define DESKPILOT_SAFETY_GATE_H

#include <string>
#include <vector>
#include "../common/types.h"
#include "../common/run_config.h"

namespace deskpilot {

/**
 * @brief Classifies a proposal and decides whether it may run
 *
 * | level | decision (denylist clear)            |
 * |-------|--------------------------------------|
 * | 0     | approved                             |
 * | 1     | approved_with_log                    |
 * | 2     | approved_with_log, audit             |
 * | 3     | pending_confirmation                 |
 *
 * A denylist match in the rationale or target text denies regardless of level.
 * The model's risk hint can raise the configured level, never lower it.
 */
class SafetyGate {
public:
    SafetyGate(const RiskTable& riskTable, const std::vector<std::string>& denylist);

    SafetyDecision evaluate(const ActionProposal& proposal) const;

    /**
     * @brief Final decision for a pending proposal once the confirmation wait ends
     * @param approved Operator answer, empty when the window expired
     */
    SafetyDecision resolveConfirmation(const SafetyDecision& pending,
                                       const std::optional<bool>& approved) const;

    RiskLevel effectiveLevel(const ActionProposal& proposal) const;

    /**
     * @return The first denylist term found (case-insensitive), or empty
     */
    std::string findDeniedTerm(const ActionProposal& proposal) const;

private:
    RiskTable m_riskTable;
    std::vector<std::string> m_denylist;
};

} // namespace deskpilot

#endif // DESKPILOT_SAFETY_GATE_H
