/**
 * @file Inverse.cpp
 * @brief Implementation of the inverse deriver
 */

#include "treepatch/Inverse.hpp"
#include "treepatch/Apply.hpp"
#include "treepatch/Path.hpp"

#include <glog/logging.h>

#include <utility>

namespace treepatch {

namespace {

Path parent_path(const Path& path) {
    return Path(path.begin(), path.end() - 1);
}

/**
 * @brief Per-kind inverse rules
 *
 * Reads the pre-edit tree only; targets are checked the same way the
 * applier checks them so an instruction apply() would reject is rejected
 * here with the same kind of error.
 */
class Deriver {
public:
    Deriver(const Value& before, const Path& path) : before_(before), path_(path) {}

    Instruction operator()(const op::Set&) const {
        ConstLocation loc = resolve(before_, path_, false);
        if (loc.current == nullptr) {
            return at(op::Remove{});
        }
        return at(op::Set{*loc.current});
    }

    Instruction operator()(const op::Remove&) const {
        ConstLocation loc = resolve(before_, path_, true);
        if (loc.parent->is_array()) {
            return Instruction{op::ArrayInsert{*parse_index(loc.key), *loc.current},
                               parent_path(path_)};
        }
        return at(op::Set{*loc.current});
    }

    Instruction operator()(const op::ArrayAppend&) const {
        return at(op::ArrayRemoveAt{array_at("array_append").size()});
    }

    Instruction operator()(const op::ArrayInsert& o) const {
        const Value& arr = array_at("array_insert");
        if (o.index > arr.size()) {
            throw RangeError(path_, "Invalid index " + std::to_string(o.index) +
                                    " for array of length " + std::to_string(arr.size()));
        }
        return at(op::ArrayRemoveAt{o.index});
    }

    Instruction operator()(const op::StringReplaceFirst& o) const {
        string_at("string_replace_first");
        return swapped_or_restore(op::StringReplaceFirst{o.replacement, o.search}, o);
    }

    Instruction operator()(const op::StringReplaceAll& o) const {
        string_at("string_replace_all");
        return swapped_or_restore(op::StringReplaceAll{o.replacement, o.search}, o);
    }

    Instruction operator()(const op::ArrayPop&) const {
        const Value& arr = array_at("array_pop");
        if (arr.empty()) {
            throw RangeError(path_, "Cannot pop from empty array");
        }
        return at(op::ArrayAppend{arr.back()});
    }

    Instruction operator()(const op::ArrayShift&) const {
        const Value& arr = array_at("array_shift");
        if (arr.empty()) {
            throw RangeError(path_, "Cannot shift from empty array");
        }
        return at(op::ArrayUnshift{arr.front()});
    }

    Instruction operator()(const op::ArrayUnshift&) const {
        array_at("array_unshift");
        return at(op::ArrayShift{});
    }

    Instruction operator()(const op::StringAppend& o) const {
        const std::string& s = string_at("string_append");
        return at(op::StringRemove{s.size(), o.text.size()});
    }

    Instruction operator()(const op::StringRemove& o) const {
        const std::string& s = string_at("string_remove");
        check_range(s, o.index, o.length);
        return at(op::StringInsert{o.index, s.substr(o.index, o.length)});
    }

    Instruction operator()(const op::StringReplaceRange& o) const {
        const std::string& s = string_at("string_replace_range");
        check_range(s, o.index, o.length);
        return at(op::StringReplaceRange{o.index, o.text.size(), s.substr(o.index, o.length)});
    }

    Instruction operator()(const op::BoolToggle&) const {
        const Value& target = *resolve(before_, path_, true).current;
        if (!target.is_boolean()) {
            throw ShapeError(path_, "bool_toggle", "a boolean", type_name(target));
        }
        return at(op::BoolToggle{});
    }

    Instruction operator()(const op::ArrayRemoveAt& o) const {
        const Value& arr = array_at("array_remove_at");
        if (o.index >= arr.size()) {
            throw RangeError(path_, "Invalid index " + std::to_string(o.index) +
                                    " for array of length " + std::to_string(arr.size()));
        }
        return at(op::ArrayInsert{o.index, arr[o.index]});
    }

    Instruction operator()(const op::ObjectMerge& o) const {
        ConstLocation loc = resolve(before_, path_, false);
        if (loc.current == nullptr) {
            return at(op::Remove{});
        }
        const Value& target = *loc.current;
        if (!target.is_object()) {
            return at(op::Set{target});
        }

        op::ObjectMerge undo;
        for (auto it = o.entries.begin(); it != o.entries.end(); ++it) {
            auto prior = target.find(it.key());
            if (prior != target.end()) {
                undo.entries[it.key()] = *prior;
            } else {
                undo.erase.push_back(it.key());
            }
        }
        for (const auto& key : o.erase) {
            auto prior = target.find(key);
            if (prior != target.end()) {
                undo.entries[key] = *prior;
            }
        }
        return at(std::move(undo));
    }

    Instruction operator()(const op::StringInsert& o) const {
        const std::string& s = string_at("string_insert");
        if (o.index > s.size()) {
            throw RangeError(path_, "Invalid index " + std::to_string(o.index) +
                                    " for string of length " + std::to_string(s.size()));
        }
        return at(op::StringRemove{o.index, o.text.size()});
    }

    Instruction operator()(const op::ArrayMove& o) const {
        const Value& arr = array_at("array_move");
        if (o.from >= arr.size() || o.to >= arr.size()) {
            throw RangeError(path_, "Invalid from_index " + std::to_string(o.from) +
                                    " or to_index " + std::to_string(o.to) +
                                    " for array of length " + std::to_string(arr.size()));
        }
        return at(op::ArrayMove{o.to, o.from});
    }

    // Cross-location destinations are interpreted after the source has been
    // detached, so the inverse inspects a detached scratch copy.

    Instruction operator()(const op::Move& o) const {
        Value scratch = before_;
        detach(scratch, o.backfill);

        const Value& holder = *resolve(scratch, parent_path(o.destination), true).current;
        if (!is_container(holder)) {
            throw PathNotFound(o.destination,
                               "parent is " + type_name(holder) + ", not a container");
        }
        const std::string& key = o.destination.back();

        op::Move undo{path_, std::nullopt};
        if (holder.is_object()) {
            auto prior = holder.find(key);
            if (prior != holder.end()) {
                undo.backfill = *prior;
            }
        } else {
            auto idx = parse_index(key);
            if (!idx) {
                throw PathNotFound(o.destination, "'" + key + "' is not a sequence index");
            }
            if (*idx > holder.size()) {
                throw RangeError(o.destination, "Invalid index " + key +
                                                " for array of length " +
                                                std::to_string(holder.size()));
            }
        }
        return Instruction{std::move(undo), o.destination};
    }

    Instruction operator()(const op::InsertMove& o) const {
        Value scratch = before_;
        detach(scratch, std::nullopt);

        const Value& arr = *resolve(scratch, o.destination, true).current;
        if (!arr.is_array()) {
            throw ShapeError(o.destination, "insert_move", "an array", type_name(arr));
        }
        std::size_t idx = o.index.value_or(arr.size());
        if (idx > arr.size()) {
            throw RangeError(o.destination, "Invalid index " + std::to_string(idx) +
                                            " for array of length " + std::to_string(arr.size()));
        }
        Path source = o.destination;
        source.push_back(index_segment(idx));
        return Instruction{op::Move{path_, std::nullopt}, std::move(source)};
    }

private:
    template <typename Op>
    Instruction at(Op&& operation) const {
        return Instruction{std::forward<Op>(operation), path_};
    }

    const Value& array_at(const char* operation) const {
        const Value& target = *resolve(before_, path_, true).current;
        if (!target.is_array()) {
            throw ShapeError(path_, operation, "an array", type_name(target));
        }
        return target;
    }

    const std::string& string_at(const char* operation) const {
        const Value& target = *resolve(before_, path_, true).current;
        if (!target.is_string()) {
            throw ShapeError(path_, operation, "a string", type_name(target));
        }
        return target.get_ref<const std::string&>();
    }

    void check_range(const std::string& s, std::size_t index, std::size_t length) const {
        if (index > s.size() || length > s.size() - index) {
            throw RangeError(path_, "Invalid index " + std::to_string(index) + " or length " +
                                    std::to_string(length) + " for string of length " +
                                    std::to_string(s.size()));
        }
    }

    /**
     * @brief Remove (or backfill) the source slot in a scratch tree
     */
    void detach(Value& scratch, const std::optional<Value>& backfill) const {
        Location src = resolve(scratch, path_, true);
        if (backfill) {
            if (src.parent->is_array()) {
                throw ShapeError(path_, "Backfill is only supported for mapping sources");
            }
            *src.current = *backfill;
        } else if (src.parent->is_object()) {
            src.parent->erase(src.key);
        } else {
            src.parent->erase(*parse_index(src.key));
        }
    }

    /**
     * @brief Search/replace swapped, if re-applying it restores the string
     *
     * Swapping search and replacement only undoes the edit when the
     * replacement text does not occur elsewhere in the result. When it
     * would not, the prior string is restored with a set.
     */
    template <typename Swapped, typename Forward>
    Instruction swapped_or_restore(Swapped swapped, const Forward& forward) const {
        const std::string& original = string_at(op_name(Forward::kind).data());
        Value edited = original;
        apply_in_place(edited, Instruction{forward, {}});
        if (!swapped.search.empty()) {
            Value restored = edited;
            apply_in_place(restored, Instruction{swapped, {}});
            if (restored.get_ref<const std::string&>() == original) {
                return at(std::move(swapped));
            }
        }
        VLOG(1) << op_name(Forward::kind) << " at '" << join_path(path_)
                << "' is not reversible by swapping; inverse restores the prior string";
        return at(op::Set{original});
    }

    const Value& before_;
    const Path& path_;
};

} // anonymous namespace

Instruction derive_inverse(const Value& before, const Instruction& instruction) {
    require_valid(instruction);
    return std::visit(Deriver(before, instruction.path), instruction.op);
}

Result<Instruction> inverse(const Value& before, const Instruction& instruction) {
    try {
        return derive_inverse(before, instruction);
    } catch (const PatchError& e) {
        VLOG(1) << "No inverse for " << op_name(kind_of(instruction)) << " at '"
                << join_path(instruction.path) << "': " << e.what();
        return e.to_error();
    }
}

} // namespace treepatch
