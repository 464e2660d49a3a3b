/**
 * @file History.cpp
 * @brief Implementation of the undo/redo log
 */

#include "treepatch/History.hpp"
#include "treepatch/Batch.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace treepatch {

namespace {

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

History::History(std::size_t capacity) : capacity_(capacity) {}

Result<Value> History::commit(const Value& document, std::vector<Instruction> batch,
                              std::string author) {
    auto undo_batch = inverse_all(document, batch);
    if (!undo_batch) {
        return undo_batch.error();
    }
    auto result = apply_all(document, batch);
    if (!result) {
        return result.error();
    }

    HistoryEntry entry;
    entry.sequence = next_sequence_++;
    entry.forward = std::move(batch);
    entry.inverse = std::move(undo_batch).value();
    entry.timestamp_ms = now_ms();
    entry.author = std::move(author);

    VLOG(1) << "History commit #" << entry.sequence << " (" << entry.forward.size()
            << " instructions" << (entry.author.empty() ? "" : ", by " + entry.author) << ")";

    done_.push_back(std::move(entry));
    undone_.clear();
    if (capacity_ > 0 && done_.size() > capacity_) {
        done_.pop_front();
    }
    return result;
}

Result<Value> History::undo(const Value& document) {
    if (done_.empty()) {
        return Error(ErrorKind::validation, "Nothing to undo");
    }
    auto result = apply_all(document, done_.back().inverse);
    if (!result) {
        VLOG(1) << "Undo of #" << done_.back().sequence << " failed: "
                << result.error().message;
        return result;
    }
    undone_.push_back(std::move(done_.back()));
    done_.pop_back();
    return result;
}

Result<Value> History::redo(const Value& document) {
    if (undone_.empty()) {
        return Error(ErrorKind::validation, "Nothing to redo");
    }
    auto result = apply_all(document, undone_.back().forward);
    if (!result) {
        VLOG(1) << "Redo of #" << undone_.back().sequence << " failed: "
                << result.error().message;
        return result;
    }
    done_.push_back(std::move(undone_.back()));
    undone_.pop_back();
    return result;
}

std::vector<HistoryEntry> History::since(std::uint64_t sequence) const {
    auto first = std::upper_bound(done_.begin(), done_.end(), sequence,
                                  [](std::uint64_t seq, const HistoryEntry& entry) {
                                      return seq < entry.sequence;
                                  });
    return std::vector<HistoryEntry>(first, done_.end());
}

void History::clear() {
    done_.clear();
    undone_.clear();
}

} // namespace treepatch
