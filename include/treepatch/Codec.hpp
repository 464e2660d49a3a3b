/**
 * @file Codec.hpp
 * @brief Compact wire/storage form of instructions
 *
 * Instructions travel as small JSON objects with one- or two-letter keys:
 *
 * | key | meaning                                                        |
 * |-----|----------------------------------------------------------------|
 * | o   | operation code (1..19, see OpKind)                             |
 * | p   | path, array of strings (omitted for the root)                  |
 * | v   | value / text / merge entries / move backfill                   |
 * | i   | index or offset                                                |
 * | l   | length                                                         |
 * | s   | search string                                                  |
 * | r   | replacement string                                             |
 * | f   | from index (array move)                                        |
 * | t   | to index (array move)                                          |
 * | d   | destination path                                               |
 * | x   | merge erase list                                               |
 *
 * Decoding ignores keys it does not know (forward compatibility) but
 * rejects an instruction missing a field its operation requires.
 *
 * Example:
 * ```cpp
 * auto inst = instruction().key("items").array_move(1, 3);
 * encode_string(inst);   // {"f":1,"o":17,"p":["items"],"t":3}
 * ```
 */

#ifndef TREEPATCH_CODEC_HPP
#define TREEPATCH_CODEC_HPP

#include "treepatch/Instruction.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

#include <string>
#include <vector>

namespace treepatch {

/**
 * @brief Encode an instruction to its compact JSON object
 */
Value encode(const Instruction& instruction);

/**
 * @brief Encode an instruction to compact JSON text
 */
std::string encode_string(const Instruction& instruction);

/**
 * @brief Decode a compact JSON object
 *
 * The result is also passed through validate().
 *
 * @return Instruction, or a validation Error naming the offending field
 */
Result<Instruction> decode(const Value& encoded);

/**
 * @brief Parse and decode compact JSON text
 */
Result<Instruction> decode_string(const std::string& text);

/**
 * @brief Encode a batch as a JSON array
 */
Value encode_batch(const std::vector<Instruction>& batch);

/**
 * @brief Decode a JSON array of instructions
 *
 * A single instruction object is accepted as a batch of one. On failure
 * the Error's step names the offending element.
 */
Result<std::vector<Instruction>> decode_batch(const Value& encoded);

} // namespace treepatch

#endif // TREEPATCH_CODEC_HPP
