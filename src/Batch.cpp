/**
 * @file Batch.cpp
 * @brief Implementation of batch apply and batch inverse
 */

#include "treepatch/Batch.hpp"
#include "treepatch/Inverse.hpp"
#include "treepatch/Path.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <utility>

namespace treepatch {

namespace {

Error at_step(const PatchError& e, std::size_t step) {
    Error err = e.to_error();
    err.message = "Failed at instruction " + std::to_string(step) + ": " + err.message;
    err.step = step;
    return err;
}

} // anonymous namespace

Result<Value> apply_all(const Value& document, const std::vector<Instruction>& instructions,
                        const BeforeApply& before_apply) {
    Value work = document;
    for (std::size_t i = 0; i < instructions.size(); ++i) {
        try {
            if (!apply_in_place(work, instructions[i], before_apply)) {
                VLOG(1) << "Batch step " << i << " (" << op_name(kind_of(instructions[i]))
                        << ") vetoed by guard";
            }
        } catch (const PatchError& e) {
            VLOG(1) << "Batch aborted at step " << i << " of " << instructions.size() << ": "
                    << e.what();
            return at_step(e, i);
        }
    }
    return work;
}

Result<std::vector<Instruction>> inverse_all(const Value& document,
                                             const std::vector<Instruction>& instructions) {
    std::vector<Instruction> undo;
    undo.reserve(instructions.size());

    Value work = document;
    for (std::size_t i = 0; i < instructions.size(); ++i) {
        try {
            undo.push_back(derive_inverse(work, instructions[i]));
            apply_in_place(work, instructions[i]);
        } catch (const PatchError& e) {
            VLOG(1) << "Batch inverse aborted at step " << i << ": " << e.what();
            return at_step(e, i);
        }
    }
    std::reverse(undo.begin(), undo.end());
    return undo;
}

} // namespace treepatch
