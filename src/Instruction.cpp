/**
 * @file Instruction.cpp
 * @brief Operation catalog helpers and instruction validation
 */

#include "treepatch/Instruction.hpp"
#include "treepatch/Path.hpp"

#include <algorithm>
#include <type_traits>

namespace treepatch {

OpKind kind_of(const Operation& operation) {
    return std::visit([](const auto& o) { return std::decay_t<decltype(o)>::kind; }, operation);
}

std::string_view op_name(OpKind kind) noexcept {
    switch (kind) {
        case OpKind::set:                  return "set";
        case OpKind::remove:               return "remove";
        case OpKind::array_append:         return "array_append";
        case OpKind::array_insert:         return "array_insert";
        case OpKind::string_replace_first: return "string_replace_first";
        case OpKind::string_replace_all:   return "string_replace_all";
        case OpKind::array_pop:            return "array_pop";
        case OpKind::array_shift:          return "array_shift";
        case OpKind::array_unshift:        return "array_unshift";
        case OpKind::string_append:        return "string_append";
        case OpKind::string_remove:        return "string_remove";
        case OpKind::string_replace_range: return "string_replace_range";
        case OpKind::bool_toggle:          return "bool_toggle";
        case OpKind::array_remove_at:      return "array_remove_at";
        case OpKind::object_merge:         return "object_merge";
        case OpKind::string_insert:        return "string_insert";
        case OpKind::array_move:           return "array_move";
        case OpKind::move:                 return "move";
        case OpKind::insert_move:          return "insert_move";
    }
    return "unknown";
}

std::optional<OpKind> kind_from_code(int code) noexcept {
    if (code < op_code(OpKind::set) || code > op_code(OpKind::insert_move)) {
        return std::nullopt;
    }
    return static_cast<OpKind>(code);
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void require_source(const Instruction& inst) {
    if (inst.path.empty()) {
        throw ValidationError(std::string("Cannot ") + std::string(op_name(kind_of(inst))) +
                              " the root element");
    }
}

/**
 * A destination below the source is only reachable after detachment when
 * the source slot survives as a backfilled mapping field, or when it is a
 * sequence element whose later siblings shift into its index.
 */
void require_destination(const Instruction& inst, const Path& destination, bool backfilled) {
    require_source(inst);
    if (destination.empty()) {
        throw ValidationError("Missing destination path for " +
                              std::string(op_name(kind_of(inst))), inst.path);
    }
    if (backfilled || is_index_segment(inst.path.back())) {
        return;
    }
    if (starts_with(destination, inst.path) && destination.size() > inst.path.size()) {
        throw ValidationError("Destination '" + join_path(destination) +
                              "' lies inside source '" + join_path(inst.path) + "'",
                              inst.path);
    }
}

void require_search(const Instruction& inst, const std::string& search) {
    if (search.empty()) {
        throw ValidationError("Missing search string for " +
                              std::string(op_name(kind_of(inst))), inst.path);
    }
}

} // anonymous namespace

void require_valid(const Instruction& inst) {
    switch (kind_of(inst)) {
        case OpKind::remove:
            require_source(inst);
            break;

        case OpKind::string_replace_first:
            require_search(inst, std::get<op::StringReplaceFirst>(inst.op).search);
            break;

        case OpKind::string_replace_all:
            require_search(inst, std::get<op::StringReplaceAll>(inst.op).search);
            break;

        case OpKind::object_merge: {
            const auto& merge = std::get<op::ObjectMerge>(inst.op);
            if (!merge.entries.is_object()) {
                throw ValidationError("Merge entries must be an object, got " +
                                      type_name(merge.entries), inst.path);
            }
            for (const auto& key : merge.erase) {
                if (merge.entries.contains(key)) {
                    throw ValidationError("Merge key '" + key +
                                          "' is both written and erased", inst.path);
                }
            }
            break;
        }

        case OpKind::move: {
            const auto& move = std::get<op::Move>(inst.op);
            require_destination(inst, move.destination, move.backfill.has_value());
            break;
        }

        case OpKind::insert_move:
            require_destination(inst, std::get<op::InsertMove>(inst.op).destination, false);
            break;

        default:
            break;
    }
}

Status validate(const Instruction& instruction) {
    try {
        require_valid(instruction);
    } catch (const PatchError& e) {
        return e.to_error();
    }
    return ok_status();
}

// ============================================================================
// Equality
// ============================================================================

namespace {

bool same(const op::Set& a, const op::Set& b) { return a.value == b.value; }
bool same(const op::Remove&, const op::Remove&) { return true; }
bool same(const op::ArrayAppend& a, const op::ArrayAppend& b) { return a.value == b.value; }
bool same(const op::ArrayInsert& a, const op::ArrayInsert& b) {
    return a.index == b.index && a.value == b.value;
}
bool same(const op::StringReplaceFirst& a, const op::StringReplaceFirst& b) {
    return a.search == b.search && a.replacement == b.replacement;
}
bool same(const op::StringReplaceAll& a, const op::StringReplaceAll& b) {
    return a.search == b.search && a.replacement == b.replacement;
}
bool same(const op::ArrayPop&, const op::ArrayPop&) { return true; }
bool same(const op::ArrayShift&, const op::ArrayShift&) { return true; }
bool same(const op::ArrayUnshift& a, const op::ArrayUnshift& b) { return a.value == b.value; }
bool same(const op::StringAppend& a, const op::StringAppend& b) { return a.text == b.text; }
bool same(const op::StringRemove& a, const op::StringRemove& b) {
    return a.index == b.index && a.length == b.length;
}
bool same(const op::StringReplaceRange& a, const op::StringReplaceRange& b) {
    return a.index == b.index && a.length == b.length && a.text == b.text;
}
bool same(const op::BoolToggle&, const op::BoolToggle&) { return true; }
bool same(const op::ArrayRemoveAt& a, const op::ArrayRemoveAt& b) { return a.index == b.index; }
bool same(const op::ObjectMerge& a, const op::ObjectMerge& b) {
    auto ea = a.erase;
    auto eb = b.erase;
    std::sort(ea.begin(), ea.end());
    std::sort(eb.begin(), eb.end());
    return a.entries == b.entries && ea == eb;
}
bool same(const op::StringInsert& a, const op::StringInsert& b) {
    return a.index == b.index && a.text == b.text;
}
bool same(const op::ArrayMove& a, const op::ArrayMove& b) {
    return a.from == b.from && a.to == b.to;
}
bool same(const op::Move& a, const op::Move& b) {
    if (a.destination != b.destination || a.backfill.has_value() != b.backfill.has_value()) {
        return false;
    }
    return !a.backfill || *a.backfill == *b.backfill;
}
bool same(const op::InsertMove& a, const op::InsertMove& b) {
    return a.destination == b.destination && a.index == b.index;
}

} // anonymous namespace

bool operator==(const Instruction& a, const Instruction& b) {
    if (a.path != b.path || a.op.index() != b.op.index()) {
        return false;
    }
    return std::visit(
        [&b](const auto& lhs) {
            using T = std::decay_t<decltype(lhs)>;
            return same(lhs, std::get<T>(b.op));
        },
        a.op);
}

} // namespace treepatch
