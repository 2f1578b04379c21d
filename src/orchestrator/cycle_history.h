#ifndef DESKPILOT_CYCLE_HISTORY_H
#define DESKPILOT_CYCLE_HISTORY_H

#include <deque>
#include <vector>
#include <cstdint>
#include "../common/types.h"

namespace deskpilot {

/**
 * @brief Bounded FIFO of completed cycles
 *
 * Appending past capacity evicts the oldest record. Records must be appended
 * in increasing sequence order. Single writer; not synchronized.
 */
class CycleHistory {
public:
    explicit CycleHistory(size_t capacity);

    /**
     * @throws std::invalid_argument if record.sequence is not greater than the last one
     */
    void append(CycleRecord record);

    size_t size() const { return m_records.size(); }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_records.empty(); }
    uint64_t evictedCount() const { return m_evicted; }

    const CycleRecord* latest() const;
    std::vector<CycleRecord> records() const;

    // Newest count records, oldest first
    std::vector<CycleRecord> recent(size_t count) const;

    void clear();

private:
    size_t m_capacity;
    std::deque<CycleRecord> m_records;
    uint64_t m_lastSequence;
    uint64_t m_evicted;
};

} // namespace deskpilot

#endif // DESKPILOT_CYCLE_HISTORY_H
