/**
 * @file Inverse.hpp
 * @brief Inverse deriver: compute the instruction that undoes an edit
 *
 * The inverse must be derived from the tree *before* the edit, because
 * several inverses carry the value the edit destroys (set, remove, pop,
 * shift, remove_at, string remove, merge, move).
 *
 * Round-trip law, for every valid instruction I applicable to T:
 * ```cpp
 * auto after = treepatch::apply(T, I).value().document;
 * auto undo  = inverse(T, I).value();
 * treepatch::apply(after, undo).value().document == T;
 * ```
 */

#ifndef TREEPATCH_INVERSE_HPP
#define TREEPATCH_INVERSE_HPP

#include "treepatch/Instruction.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

namespace treepatch {

/**
 * @brief Derive the undo instruction for an edit
 *
 * Rules per kind:
 * - set → set(old value), or remove if the key did not exist
 * - remove → array_insert(index, old) on a sequence, set(old) on a mapping
 * - array_append → array_remove_at(length)
 * - array_insert(i) → array_remove_at(i)
 * - array_pop → array_append(last); array_shift → array_unshift(first);
 *   array_unshift → array_shift
 * - array_remove_at(i) → array_insert(i, old)
 * - array_move(f, t) → array_move(t, f)
 * - string_insert(i, text) → string_remove(i, |text|)
 * - string_append(text) → string_remove(old length, |text|)
 * - string_remove(i, l) → string_insert(i, removed text)
 * - string_replace_range(i, l, text) → string_replace_range(i, |text|, old text)
 * - string_replace_first/all(s, r) → same kind with (r, s) when that
 *   provably restores the string, otherwise set(old string)
 * - bool_toggle → bool_toggle
 * - object_merge → merge of prior values, erasing keys it introduced;
 *   remove if the target was absent; set(old) if it was not a mapping
 * - move(dest) → move(dest → source), backfilling the destination's
 *   prior value when the move overwrote one
 * - insert_move(dest, i) → move(dest + [i] → source)
 *
 * @param before Tree the instruction will be applied to
 * @param instruction Edit to invert
 * @return Inverse instruction, or the Error apply() would report
 */
Result<Instruction> inverse(const Value& before, const Instruction& instruction);

/**
 * @brief Throwing form of inverse() for use inside the engine
 * @throws PatchError
 */
Instruction derive_inverse(const Value& before, const Instruction& instruction);

} // namespace treepatch

#endif // TREEPATCH_INVERSE_HPP
