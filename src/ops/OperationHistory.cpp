#include "ops/OperationHistory.hpp"
#include <algorithm>
#include <stdexcept>

namespace ops {

void OperationHistory::append(OperationPtr operation) {
    if (!operation) {
        throw std::invalid_argument("Cannot append null operation");
    }
    const auto& id = operation->id();
    auto sameId = [&id](const OperationPtr& op) { return op->id() == id; };
    if (std::any_of(m_entries.begin(), m_entries.end(), sameId)
        || std::any_of(m_redoBuffer.begin(), m_redoBuffer.end(), sameId)) {
        throw std::invalid_argument("Operation '" + id + "' already in history");
    }

    operation->setCreatedAtSeq(m_nextSeq++);
    operation->setState(OperationState::Queued);
    m_entries.push_back(std::move(operation));

    for (auto& discarded : m_redoBuffer) {
        discarded->setState(OperationState::Undone);
    }
    m_redoBuffer.clear();
}

HistoryResult OperationHistory::undo() {
    HistoryResult result;
    if (m_entries.empty()) {
        result.error = HistoryError::NothingToUndo;
        return result;
    }

    result.operation = m_entries.back();
    result.previousState = result.operation->state();
    m_entries.pop_back();

    result.operation->setState(OperationState::Undone);
    m_redoBuffer.push_front(result.operation);
    return result;
}

HistoryResult OperationHistory::redo() {
    HistoryResult result;
    if (m_redoBuffer.empty()) {
        result.error = HistoryError::NothingToRedo;
        return result;
    }

    result.operation = m_redoBuffer.front();
    result.previousState = result.operation->state();
    m_redoBuffer.pop_front();

    // Re-entered at the tail as Queued; original sequence number kept
    result.operation->setState(OperationState::Queued);
    m_entries.push_back(result.operation);
    return result;
}

std::vector<OperationPtr> OperationHistory::activeEntries() const {
    std::vector<OperationPtr> active;
    active.reserve(m_entries.size());
    for (const auto& op : m_entries) {
        if (op->state() != OperationState::Undone) {
            active.push_back(op);
        }
    }
    return active;
}

OperationPtr OperationHistory::find(const std::string& id) const {
    for (const auto& op : m_entries) {
        if (op->id() == id) return op;
    }
    for (const auto& op : m_redoBuffer) {
        if (op->id() == id) return op;
    }
    return nullptr;
}

std::optional<size_t> OperationHistory::position(const std::string& id) const {
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i]->id() == id) return i;
    }
    return std::nullopt;
}

bool OperationHistory::replace(const std::string& id, OperationPtr operation) {
    if (!operation || operation->id() != id) {
        throw std::invalid_argument("Replacement must carry id '" + id + "'");
    }
    auto pos = position(id);
    if (!pos) return false;

    operation->setCreatedAtSeq(m_entries[*pos]->createdAtSeq());
    m_entries[*pos] = std::move(operation);
    return true;
}

OperationPtr OperationHistory::remove(const std::string& id) {
    auto pos = position(id);
    if (!pos) return nullptr;

    auto removed = m_entries[*pos];
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(*pos));
    return removed;
}

std::vector<OperationPtr> OperationHistory::clearQueued() {
    std::vector<OperationPtr> removed;
    auto it = std::stable_partition(m_entries.begin(), m_entries.end(), [](const OperationPtr& op) {
        return op->state() != OperationState::Queued;
    });
    removed.assign(it, m_entries.end());
    m_entries.erase(it, m_entries.end());
    return removed;
}

size_t OperationHistory::queuedCount() const {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(), [](const OperationPtr& op) {
        return op->state() == OperationState::Queued;
    }));
}

size_t OperationHistory::executedCount() const {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(), [](const OperationPtr& op) {
        return op->state() == OperationState::Executed;
    }));
}

} // namespace ops
