#include "cycle_history.h"
#include <stdexcept>
#include <string>

namespace deskpilot {

CycleHistory::CycleHistory(size_t capacity)
    : m_capacity(capacity == 0 ? 1 : capacity)
    , m_lastSequence(0)
    , m_evicted(0) {}

void CycleHistory::append(CycleRecord record) {
    if (!m_records.empty() && record.sequence <= m_lastSequence) {
        throw std::invalid_argument("Cycle history out of order: " + std::to_string(record.sequence) +
                                    " after " + std::to_string(m_lastSequence));
    }

    m_lastSequence = record.sequence;
    m_records.push_back(std::move(record));
    while (m_records.size() > m_capacity) {
        m_records.pop_front();
        m_evicted++;
    }
}

const CycleRecord* CycleHistory::latest() const {
    if (m_records.empty()) {
        return nullptr;
    }
    return &m_records.back();
}

std::vector<CycleRecord> CycleHistory::records() const {
    return std::vector<CycleRecord>(m_records.begin(), m_records.end());
}

std::vector<CycleRecord> CycleHistory::recent(size_t count) const {
    size_t start = m_records.size() > count ? m_records.size() - count : 0;
    return std::vector<CycleRecord>(m_records.begin() + static_cast<std::ptrdiff_t>(start), m_records.end());
}

void CycleHistory::clear() {
    m_records.clear();
}

} // namespace deskpilot
