/**
 * @file Apply.cpp
 * @brief Implementation of the forward applier
 */

#include "treepatch/Apply.hpp"
#include "treepatch/Path.hpp"

#include <glog/logging.h>

#include <cstddef>
#include <optional>
#include <utility>

namespace treepatch {

namespace {

bool allowed(const BeforeApply& guard, const Value* parent) {
    return !guard || guard(parent);
}

Path parent_path(const Path& path) {
    return Path(path.begin(), path.end() - 1);
}

/**
 * @brief Reference to the slot a location names, creating a mapping key
 *        when it is absent
 */
Value& slot(Value& document, const Location& loc) {
    if (loc.is_root()) {
        return document;
    }
    if (loc.parent->is_object()) {
        return (*loc.parent)[loc.key];
    }
    return *loc.current;
}

/**
 * @brief Remove the slot a location names from its parent container
 *
 * Later sequence elements shift down by one.
 */
void erase_slot(const Location& loc) {
    if (loc.parent->is_object()) {
        loc.parent->erase(loc.key);
        return;
    }
    auto idx = *parse_index(loc.key);
    loc.parent->erase(idx);
}

/**
 * @brief Per-kind edit logic
 *
 * Each call operator performs one operation kind on the document and
 * returns false when the guard vetoed it.
 */
class Applier {
public:
    Applier(Value& document, const Path& path, const BeforeApply& guard)
        : doc_(document), path_(path), guard_(guard) {}

    bool operator()(const op::Set& o) {
        Location loc = resolve(doc_, path_, false);
        if (!allowed(guard_, loc.parent)) return false;
        slot(doc_, loc) = o.value;
        return true;
    }

    bool operator()(const op::Remove&) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        erase_slot(loc);
        return true;
    }

    bool operator()(const op::ArrayAppend& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        array_at(loc, "array_append").push_back(o.value);
        return true;
    }

    bool operator()(const op::ArrayInsert& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& arr = array_at(loc, "array_insert");
        if (o.index > arr.size()) {
            throw RangeError(path_, "Invalid index " + std::to_string(o.index) +
                                    " for array of length " + std::to_string(arr.size()));
        }
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(o.index), o.value);
        return true;
    }

    bool operator()(const op::StringReplaceFirst& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        std::string& s = string_at(loc, "string_replace_first");
        auto pos = s.find(o.search);
        if (pos != std::string::npos) {
            s.replace(pos, o.search.size(), o.replacement);
        }
        return true;
    }

    bool operator()(const op::StringReplaceAll& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        std::string& s = string_at(loc, "string_replace_all");
        std::string::size_type pos = 0;
        while ((pos = s.find(o.search, pos)) != std::string::npos) {
            s.replace(pos, o.search.size(), o.replacement);
            pos += o.replacement.size();
        }
        return true;
    }

    bool operator()(const op::ArrayPop&) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& arr = array_at(loc, "array_pop");
        if (arr.empty()) {
            throw RangeError(path_, "Cannot pop from empty array");
        }
        arr.erase(arr.size() - 1);
        return true;
    }

    bool operator()(const op::ArrayShift&) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& arr = array_at(loc, "array_shift");
        if (arr.empty()) {
            throw RangeError(path_, "Cannot shift from empty array");
        }
        arr.erase(std::size_t{0});
        return true;
    }

    bool operator()(const op::ArrayUnshift& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& arr = array_at(loc, "array_unshift");
        arr.insert(arr.begin(), o.value);
        return true;
    }

    bool operator()(const op::StringAppend& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        string_at(loc, "string_append") += o.text;
        return true;
    }

    bool operator()(const op::StringRemove& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        std::string& s = string_at(loc, "string_remove");
        check_range(s, o.index, o.length);
        s.erase(o.index, o.length);
        return true;
    }

    bool operator()(const op::StringReplaceRange& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        std::string& s = string_at(loc, "string_replace_range");
        check_range(s, o.index, o.length);
        s.replace(o.index, o.length, o.text);
        return true;
    }

    bool operator()(const op::BoolToggle&) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& target = *loc.current;
        if (!target.is_boolean()) {
            throw ShapeError(path_, "bool_toggle", "a boolean", type_name(target));
        }
        target = !target.get<bool>();
        return true;
    }

    bool operator()(const op::ArrayRemoveAt& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& arr = array_at(loc, "array_remove_at");
        if (o.index >= arr.size()) {
            throw RangeError(path_, "Invalid index " + std::to_string(o.index) +
                                    " for array of length " + std::to_string(arr.size()));
        }
        arr.erase(o.index);
        return true;
    }

    bool operator()(const op::ObjectMerge& o) {
        Location loc = resolve(doc_, path_, false);
        if (!allowed(guard_, loc.parent)) return false;
        Value& target = slot(doc_, loc);
        if (!target.is_object()) {
            target = Value::object();
        }
        for (const auto& key : o.erase) {
            target.erase(key);
        }
        for (auto it = o.entries.begin(); it != o.entries.end(); ++it) {
            target[it.key()] = it.value();
        }
        return true;
    }

    bool operator()(const op::StringInsert& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        std::string& s = string_at(loc, "string_insert");
        if (o.index > s.size()) {
            throw RangeError(path_, "Invalid index " + std::to_string(o.index) +
                                    " for string of length " + std::to_string(s.size()));
        }
        s.insert(o.index, o.text);
        return true;
    }

    bool operator()(const op::ArrayMove& o) {
        Location loc = resolve(doc_, path_, true);
        if (!allowed(guard_, loc.parent)) return false;
        Value& arr = array_at(loc, "array_move");
        if (o.from >= arr.size() || o.to >= arr.size()) {
            throw RangeError(path_, "Invalid from_index " + std::to_string(o.from) +
                                    " or to_index " + std::to_string(o.to) +
                                    " for array of length " + std::to_string(arr.size()));
        }
        if (o.from == o.to) {
            return true;
        }
        Value element = std::move(arr[o.from]);
        arr.erase(o.from);
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(o.to), std::move(element));
        return true;
    }

    bool operator()(const op::Move& o) {
        std::optional<Value> backup;
        if (guard_) backup = doc_;

        Location src = resolve(doc_, path_, true);
        if (!allowed(guard_, src.parent)) return false;
        if (o.backfill && src.parent->is_array()) {
            throw ShapeError(path_, "Backfill is only supported for mapping sources");
        }

        Value moved = std::move(*src.current);
        if (o.backfill) {
            *src.current = *o.backfill;
        } else {
            erase_slot(src);
        }

        Value& parent = container_at(o.destination);
        if (!allowed(guard_, &parent)) {
            doc_ = std::move(*backup);
            return false;
        }
        const std::string& key = o.destination.back();
        if (parent.is_object()) {
            parent[key] = std::move(moved);
            return true;
        }
        auto idx = parse_index(key);
        if (!idx) {
            throw PathNotFound(o.destination, "'" + key + "' is not a sequence index");
        }
        if (*idx > parent.size()) {
            throw RangeError(o.destination, "Invalid index " + key + " for array of length " +
                                            std::to_string(parent.size()));
        }
        parent.insert(parent.begin() + static_cast<std::ptrdiff_t>(*idx), std::move(moved));
        return true;
    }

    bool operator()(const op::InsertMove& o) {
        std::optional<Value> backup;
        if (guard_) backup = doc_;

        Location src = resolve(doc_, path_, true);
        if (!allowed(guard_, src.parent)) return false;
        Value moved = std::move(*src.current);
        erase_slot(src);

        Location dst = resolve(doc_, o.destination, true);
        if (!allowed(guard_, dst.parent)) {
            doc_ = std::move(*backup);
            return false;
        }
        Value& arr = *dst.current;
        if (!arr.is_array()) {
            throw ShapeError(o.destination, "insert_move", "an array", type_name(arr));
        }
        std::size_t idx = o.index.value_or(arr.size());
        if (idx > arr.size()) {
            throw RangeError(o.destination, "Invalid index " + std::to_string(idx) +
                                            " for array of length " + std::to_string(arr.size()));
        }
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(idx), std::move(moved));
        return true;
    }

private:
    Value& array_at(const Location& loc, const char* operation) {
        Value& target = *loc.current;
        if (!target.is_array()) {
            throw ShapeError(path_, operation, "an array", type_name(target));
        }
        return target;
    }

    std::string& string_at(const Location& loc, const char* operation) {
        Value& target = *loc.current;
        if (!target.is_string()) {
            throw ShapeError(path_, operation, "a string", type_name(target));
        }
        return target.get_ref<std::string&>();
    }

    void check_range(const std::string& s, std::size_t index, std::size_t length) const {
        if (index > s.size() || length > s.size() - index) {
            throw RangeError(path_, "Invalid index " + std::to_string(index) + " or length " +
                                    std::to_string(length) + " for string of length " +
                                    std::to_string(s.size()));
        }
    }

    /**
     * @brief Container that will hold the last segment of a destination path
     */
    Value& container_at(const Path& destination) {
        Path holder = parent_path(destination);
        Value& node = *resolve(doc_, holder, true).current;
        if (!is_container(node)) {
            throw PathNotFound(destination, "parent is " + type_name(node) + ", not a container");
        }
        return node;
    }

    Value& doc_;
    const Path& path_;
    const BeforeApply& guard_;
};

} // anonymous namespace

bool apply_in_place(Value& document, const Instruction& instruction,
                    const BeforeApply& before_apply) {
    require_valid(instruction);
    Applier applier(document, instruction.path, before_apply);
    return std::visit(applier, instruction.op);
}

Result<Applied> apply(const Value& document, const Instruction& instruction,
                      const BeforeApply& before_apply) {
    try {
        Value copy = document;
        if (!apply_in_place(copy, instruction, before_apply)) {
            VLOG(1) << "Skipped " << op_name(kind_of(instruction)) << " at '"
                    << join_path(instruction.path) << "': vetoed by guard";
            return Applied{document, ApplyStatus::vetoed};
        }
        return Applied{std::move(copy), ApplyStatus::applied};
    } catch (const PatchError& e) {
        VLOG(1) << "Failed " << op_name(kind_of(instruction)) << " at '"
                << join_path(instruction.path) << "': " << e.what();
        return e.to_error();
    }
}

BeforeApply identifier_guard(std::string expected, std::string field) {
    return [expected = std::move(expected), field = std::move(field)](const Value* parent) {
        if (parent == nullptr || !parent->is_object()) {
            return true;
        }
        auto it = parent->find(field);
        if (it == parent->end()) {
            return true;
        }
        if (it->is_string() && it->get<std::string>() == expected) {
            return true;
        }
        VLOG(1) << "Guard rejected edit: " << field << " is " << it->dump()
                << ", expected \"" << expected << "\"";
        return false;
    };
}

} // namespace treepatch
