/**
 * @file Instruction.hpp
 * @brief Operation catalog: the closed set of edit kinds
 *
 * An Instruction is a path plus one of nineteen operation structs. Each
 * struct carries exactly the fields its kind needs, so "set requires a
 * value" or "a range op requires index and length" is enforced by the
 * type system. The remaining rules (non-empty search string, merge
 * payload is a mapping, ...) are checked by validate().
 *
 * The numeric codes are the wire protocol's operation codes and must not
 * change.
 */

#ifndef TREEPATCH_INSTRUCTION_HPP
#define TREEPATCH_INSTRUCTION_HPP

#include "treepatch/Value.hpp"
#include "treepatch/Errors.hpp"
#include "treepatch/Result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace treepatch {

/**
 * @brief Operation kind with its wire code
 */
enum class OpKind : int {
    set = 1,
    remove = 2,
    array_append = 3,
    array_insert = 4,
    string_replace_first = 5,
    string_replace_all = 6,
    array_pop = 7,
    array_shift = 8,
    array_unshift = 9,
    string_append = 10,
    string_remove = 11,
    string_replace_range = 12,
    bool_toggle = 13,
    array_remove_at = 14,
    object_merge = 15,
    string_insert = 16,
    array_move = 17,
    move = 18,
    insert_move = 19,
};

namespace op {

/// Replace (or create) the value at the path
struct Set {
    static constexpr OpKind kind = OpKind::set;
    Value value;
};

/// Remove the value at the path; later sequence elements shift down
struct Remove {
    static constexpr OpKind kind = OpKind::remove;
};

struct ArrayAppend {
    static constexpr OpKind kind = OpKind::array_append;
    Value value;
};

/// Insert before position index (index == length appends)
struct ArrayInsert {
    static constexpr OpKind kind = OpKind::array_insert;
    std::size_t index = 0;
    Value value;
};

struct StringReplaceFirst {
    static constexpr OpKind kind = OpKind::string_replace_first;
    std::string search;
    std::string replacement;
};

struct StringReplaceAll {
    static constexpr OpKind kind = OpKind::string_replace_all;
    std::string search;
    std::string replacement;
};

struct ArrayPop {
    static constexpr OpKind kind = OpKind::array_pop;
};

struct ArrayShift {
    static constexpr OpKind kind = OpKind::array_shift;
};

struct ArrayUnshift {
    static constexpr OpKind kind = OpKind::array_unshift;
    Value value;
};

struct StringAppend {
    static constexpr OpKind kind = OpKind::string_append;
    std::string text;
};

/// Remove length bytes starting at byte offset index
struct StringRemove {
    static constexpr OpKind kind = OpKind::string_remove;
    std::size_t index = 0;
    std::size_t length = 0;
};

/// Replace length bytes at byte offset index with text
struct StringReplaceRange {
    static constexpr OpKind kind = OpKind::string_replace_range;
    std::size_t index = 0;
    std::size_t length = 0;
    std::string text;
};

struct BoolToggle {
    static constexpr OpKind kind = OpKind::bool_toggle;
};

struct ArrayRemoveAt {
    static constexpr OpKind kind = OpKind::array_remove_at;
    std::size_t index = 0;
};

/**
 * @brief Shallow merge into a mapping
 *
 * Keys listed in erase are removed first, then every key of entries is
 * written. Other keys of the target are left untouched.
 */
struct ObjectMerge {
    static constexpr OpKind kind = OpKind::object_merge;
    Value entries = Value::object();
    std::vector<std::string> erase;
};

/// Insert text before byte offset index
struct StringInsert {
    static constexpr OpKind kind = OpKind::string_insert;
    std::size_t index = 0;
    std::string text;
};

/// Move the element at from so that it ends up at position to
struct ArrayMove {
    static constexpr OpKind kind = OpKind::array_move;
    std::size_t from = 0;
    std::size_t to = 0;
};

/**
 * @brief Relocate the value at the path to destination
 *
 * A mapping destination is assigned (replacing what was there); a
 * sequence destination is inserted at its index. With backfill, the
 * source mapping field is kept and receives the backfill value instead
 * of being removed.
 */
struct Move {
    static constexpr OpKind kind = OpKind::move;
    Path destination;
    std::optional<Value> backfill;
};

/// Relocate the value at the path into the destination sequence
struct InsertMove {
    static constexpr OpKind kind = OpKind::insert_move;
    Path destination;
    /// Insert position; appends when absent
    std::optional<std::size_t> index;
};

} // namespace op

using Operation = std::variant<
    op::Set,
    op::Remove,
    op::ArrayAppend,
    op::ArrayInsert,
    op::StringReplaceFirst,
    op::StringReplaceAll,
    op::ArrayPop,
    op::ArrayShift,
    op::ArrayUnshift,
    op::StringAppend,
    op::StringRemove,
    op::StringReplaceRange,
    op::BoolToggle,
    op::ArrayRemoveAt,
    op::ObjectMerge,
    op::StringInsert,
    op::ArrayMove,
    op::Move,
    op::InsertMove
>;

/**
 * @brief One described edit
 *
 * path may be empty, meaning the whole document. For move and
 * insert_move the path is the source.
 */
struct Instruction {
    Operation op;
    Path path;
};

/**
 * @brief Kind of the operation held by an instruction
 */
OpKind kind_of(const Operation& operation);

inline OpKind kind_of(const Instruction& instruction) {
    return kind_of(instruction.op);
}

/**
 * @brief snake_case name of a kind, e.g. "array_insert"
 */
std::string_view op_name(OpKind kind) noexcept;

constexpr int op_code(OpKind kind) noexcept {
    return static_cast<int>(kind);
}

/**
 * @brief Map a wire code to a kind
 * @return The kind, or nullopt for codes outside 1..19
 */
std::optional<OpKind> kind_from_code(int code) noexcept;

/**
 * @brief Check the rules the type system cannot express
 *
 * - remove, move and insert_move need a non-empty (source) path
 * - move and insert_move need a non-empty destination that does not lie
 *   inside the source
 * - replace-first/replace-all need a non-empty search string
 * - merge entries must be a mapping and must not name an erased key
 *
 * @return ok, or a validation Error
 */
Status validate(const Instruction& instruction);

/**
 * @brief Throwing form of validate() for use inside the engine
 * @throws ValidationError
 */
void require_valid(const Instruction& instruction);

/**
 * @brief Structural equality (paths, kinds and every payload field)
 */
bool operator==(const Instruction& a, const Instruction& b);

inline bool operator!=(const Instruction& a, const Instruction& b) {
    return !(a == b);
}

} // namespace treepatch

#endif // TREEPATCH_INSTRUCTION_HPP
