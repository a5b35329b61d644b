#pragma once

#include "ops/Operation.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace ops {

/**
 * Outcome of undo / redo. On success, operation is the entry that moved
 * and previousState the state it had before moving.
 */
struct HistoryResult {
    OperationPtr operation;
    OperationState previousState = OperationState::Queued;
    std::optional<HistoryError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * Ordered log of operations for one dataset plus its redo buffer.
 *
 * - entries hold every non-undone operation in creation order; the
 *   Executed ones always form a contiguous prefix
 * - the redo buffer holds undone operations, most recently undone first
 * - appending a new operation discards the redo buffer
 *
 * Not thread-safe: owned and mutated by the session's control thread.
 */
class OperationHistory {
public:
    /// Throws std::invalid_argument if the id is already present
    void append(OperationPtr operation);

    HistoryResult undo();
    HistoryResult redo();

    /// Entries in order, without Undone ones
    std::vector<OperationPtr> activeEntries() const;
    const std::vector<OperationPtr>& entries() const { return m_entries; }
    const std::deque<OperationPtr>& redoBuffer() const { return m_redoBuffer; }

    OperationPtr find(const std::string& id) const;
    /// Position among active entries
    std::optional<size_t> position(const std::string& id) const;

    /// Swap an entry for a new operation with the same id, keeping its sequence number
    bool replace(const std::string& id, OperationPtr operation);
    /// Remove an entry without parking it in the redo buffer
    OperationPtr remove(const std::string& id);
    /// Drop every Queued entry; returns the removed operations
    std::vector<OperationPtr> clearQueued();

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    size_t queuedCount() const;
    size_t executedCount() const;
    bool canUndo() const { return !m_entries.empty(); }
    bool canRedo() const { return !m_redoBuffer.empty(); }

private:
    std::vector<OperationPtr> m_entries;
    std::deque<OperationPtr> m_redoBuffer;
    uint64_t m_nextSeq = 1;
};

} // namespace ops
