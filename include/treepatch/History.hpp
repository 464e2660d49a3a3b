/**
 * @file History.hpp
 * @brief Sequenced undo/redo log of committed batches
 *
 * Each commit records the forward batch together with its inverses and a
 * monotonic sequence number starting at 1. Late joiners catch up with
 * since(), which returns every entry newer than the sequence they hold.
 */

#ifndef TREEPATCH_HISTORY_HPP
#define TREEPATCH_HISTORY_HPP

#include "treepatch/Instruction.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace treepatch {

/**
 * @brief One committed batch
 */
struct HistoryEntry {
    std::uint64_t sequence = 0;
    std::vector<Instruction> forward;
    /// Undo batch, already in application order
    std::vector<Instruction> inverse;
    /// Milliseconds since the Unix epoch at commit time
    std::int64_t timestamp_ms = 0;
    std::string author;
};

class History {
public:
    /**
     * @param capacity Maximum number of undoable entries kept; 0 means
     *        unbounded. The oldest entry is dropped first.
     */
    explicit History(std::size_t capacity = 0);

    /**
     * @brief Apply a batch and record it
     *
     * Inverses are derived before the batch runs. On success the redo
     * stack is cleared and the new tree returned; on failure nothing is
     * recorded.
     */
    Result<Value> commit(const Value& document, std::vector<Instruction> batch,
                         std::string author = {});

    /**
     * @brief Apply the latest entry's inverse batch
     *
     * On failure (or when there is nothing to undo) the stacks are left
     * as they were.
     */
    Result<Value> undo(const Value& document);

    /// Re-apply the most recently undone batch
    Result<Value> redo(const Value& document);

    bool can_undo() const noexcept {
        return !done_.empty();
    }

    bool can_redo() const noexcept {
        return !undone_.empty();
    }

    /**
     * @brief Entries committed after a given sequence, oldest first
     *
     * Only entries still on the undo stack are returned.
     */
    std::vector<HistoryEntry> since(std::uint64_t sequence) const;

    /// Sequence of the latest commit, 0 before the first
    std::uint64_t last_sequence() const noexcept {
        return next_sequence_ - 1;
    }

    std::size_t size() const noexcept {
        return done_.size();
    }

    void clear();

private:
    std::size_t capacity_;
    std::uint64_t next_sequence_ = 1;
    std::deque<HistoryEntry> done_;
    std::vector<HistoryEntry> undone_;
};

} // namespace treepatch

#endif // TREEPATCH_HISTORY_HPP
