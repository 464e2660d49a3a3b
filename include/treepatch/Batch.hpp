/**
 * @file Batch.hpp
 * @brief All-or-nothing application of instruction sequences
 */

#ifndef TREEPATCH_BATCH_HPP
#define TREEPATCH_BATCH_HPP

#include "treepatch/Apply.hpp"
#include "treepatch/Instruction.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

#include <vector>

namespace treepatch {

/**
 * @brief Apply instructions in order, threading each result into the next
 *
 * Vetoed steps are no-ops. The first failing step aborts the batch: the
 * returned Error carries the zero-based step and a message prefixed with
 * "Failed at instruction <i>: ". No intermediate tree is returned.
 *
 * @param document Starting tree (not modified)
 * @param instructions Steps to apply
 * @param before_apply Guard consulted for every step
 * @return Final tree or the first failure
 */
Result<Value> apply_all(const Value& document, const std::vector<Instruction>& instructions,
                        const BeforeApply& before_apply = {});

/**
 * @brief Inverses of a batch, in undo order
 *
 * Each inverse is derived against the tree its step will actually see, so
 * applying the returned list to apply_all()'s result restores `document`.
 * Errors are reported the same way as apply_all().
 */
Result<std::vector<Instruction>> inverse_all(const Value& document,
                                             const std::vector<Instruction>& instructions);

} // namespace treepatch

#endif // TREEPATCH_BATCH_HPP
