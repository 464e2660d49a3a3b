/**
 * @file Apply.hpp
 * @brief Forward applier: produce a new tree with one instruction applied
 *
 * apply() copies the caller's tree, resolves the instruction's path in the
 * copy, asks the optional guard for permission and performs the edit. The
 * caller's tree is never modified, and on failure no partially edited copy
 * escapes.
 *
 * Index rules:
 * - insert-like positions (array_insert, sequence destinations):
 *   0 <= i <= length
 * - element positions (array_remove_at, array_move from/to, set/remove on
 *   a sequence element): 0 <= i < length
 * - string offsets count UTF-8 bytes; remove/replace-range need
 *   offset + length <= size
 */

#ifndef TREEPATCH_APPLY_HPP
#define TREEPATCH_APPLY_HPP

#include "treepatch/Instruction.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace treepatch {

/**
 * @brief Pre-commit veto hook
 *
 * Receives the container that holds the edited slot (nullptr when the
 * instruction targets the root). Returning false skips the edit.
 */
using BeforeApply = std::function<bool(const Value* parent)>;

enum class ApplyStatus : std::uint8_t {
    applied,
    vetoed,
};

/**
 * @brief Successful outcome of apply()
 *
 * When status is vetoed, document equals the input tree.
 */
struct Applied {
    Value document;
    ApplyStatus status = ApplyStatus::applied;

    bool vetoed() const noexcept {
        return status == ApplyStatus::vetoed;
    }
};

/**
 * @brief Apply one instruction to a copy of a tree
 *
 * @param document Tree to edit (not modified)
 * @param instruction Edit to perform
 * @param before_apply Optional guard; for move/insert_move it is asked for
 *        the source parent and then for the destination parent
 * @return New tree and status, or an Error (validation, navigation,
 *         shape or range)
 *
 * Call it qualified: Value takes std templates as arguments, so an
 * unqualified call also finds std::apply through argument-dependent lookup.
 *
 * Example:
 * ```cpp
 * Value doc = {{"items", {"a", "b", "c", "d"}}};
 * auto r = treepatch::apply(doc, instruction().key("items").array_move(1, 3));
 * // r.value().document == {"items": ["a", "c", "d", "b"]}
 * ```
 */
Result<Applied> apply(const Value& document, const Instruction& instruction,
                      const BeforeApply& before_apply = {});

/**
 * @brief Apply in place on a tree the caller owns exclusively
 *
 * Used by apply() on its private copy and by the batch applier. On
 * exception the tree may be partially edited and must be discarded.
 *
 * @return false if the guard vetoed the edit
 * @throws PatchError
 */
bool apply_in_place(Value& document, const Instruction& instruction,
                    const BeforeApply& before_apply = {});

/**
 * @brief Guard that only lets edits through on the expected element
 *
 * Vetoes when the parent is a mapping whose `field` is present and differs
 * from `expected`. Sequences, scalars, the root and mappings without the
 * field pass.
 */
BeforeApply identifier_guard(std::string expected, std::string field = "identifier");

} // namespace treepatch

#endif // TREEPATCH_APPLY_HPP
