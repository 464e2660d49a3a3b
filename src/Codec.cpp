/**
 * @file Codec.cpp
 * @brief Implementation of the compact instruction codec
 */

#include "treepatch/Codec.hpp"

#include <cstdint>
#include <optional>
#include <type_traits>

namespace treepatch {

// ============================================================================
// Encoding
// ============================================================================

namespace {

Value path_to_json(const Path& path) {
    Value arr = Value::array();
    for (const auto& segment : path) {
        arr.push_back(segment);
    }
    return arr;
}

void encode_fields(Value& out, const op::Set& o) { out["v"] = o.value; }
void encode_fields(Value&, const op::Remove&) {}
void encode_fields(Value& out, const op::ArrayAppend& o) { out["v"] = o.value; }
void encode_fields(Value& out, const op::ArrayInsert& o) {
    out["i"] = o.index;
    out["v"] = o.value;
}
void encode_fields(Value& out, const op::StringReplaceFirst& o) {
    out["s"] = o.search;
    out["r"] = o.replacement;
}
void encode_fields(Value& out, const op::StringReplaceAll& o) {
    out["s"] = o.search;
    out["r"] = o.replacement;
}
void encode_fields(Value&, const op::ArrayPop&) {}
void encode_fields(Value&, const op::ArrayShift&) {}
void encode_fields(Value& out, const op::ArrayUnshift& o) { out["v"] = o.value; }
void encode_fields(Value& out, const op::StringAppend& o) { out["v"] = o.text; }
void encode_fields(Value& out, const op::StringRemove& o) {
    out["i"] = o.index;
    out["l"] = o.length;
}
void encode_fields(Value& out, const op::StringReplaceRange& o) {
    out["i"] = o.index;
    out["l"] = o.length;
    out["v"] = o.text;
}
void encode_fields(Value&, const op::BoolToggle&) {}
void encode_fields(Value& out, const op::ArrayRemoveAt& o) { out["i"] = o.index; }
void encode_fields(Value& out, const op::ObjectMerge& o) {
    out["v"] = o.entries;
    if (!o.erase.empty()) {
        out["x"] = o.erase;
    }
}
void encode_fields(Value& out, const op::StringInsert& o) {
    out["i"] = o.index;
    out["v"] = o.text;
}
void encode_fields(Value& out, const op::ArrayMove& o) {
    out["f"] = o.from;
    out["t"] = o.to;
}
void encode_fields(Value& out, const op::Move& o) {
    out["d"] = path_to_json(o.destination);
    if (o.backfill) {
        out["v"] = *o.backfill;
    }
}
void encode_fields(Value& out, const op::InsertMove& o) {
    out["d"] = path_to_json(o.destination);
    if (o.index) {
        out["i"] = *o.index;
    }
}

} // anonymous namespace

Value encode(const Instruction& instruction) {
    Value out = Value::object();
    out["o"] = op_code(kind_of(instruction));
    if (!instruction.path.empty()) {
        out["p"] = path_to_json(instruction.path);
    }
    std::visit([&out](const auto& o) { encode_fields(out, o); }, instruction.op);
    return out;
}

std::string encode_string(const Instruction& instruction) {
    return encode(instruction).dump();
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

/**
 * @brief Typed field access over an encoded instruction
 *
 * Every accessor raises ValidationError naming the field, so the
 * decoder body reads as a list of requirements.
 */
class FieldReader {
public:
    explicit FieldReader(const Value& obj) : obj_(obj) {}

    /// Present and not null
    bool has(const char* key) const {
        auto it = obj_.find(key);
        return it != obj_.end() && !it->is_null();
    }

    /// Present, null included
    bool contains(const char* key) const {
        return obj_.contains(key);
    }

    const Value& value(const char* key) const {
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            throw ValidationError(std::string("Missing field '") + key + "'");
        }
        return *it;
    }

    std::string string(const char* key) const {
        const Value& v = value(key);
        if (!v.is_string()) {
            throw ValidationError(std::string("Field '") + key + "' must be a string, got " +
                                  type_name(v));
        }
        return v.get<std::string>();
    }

    std::size_t index(const char* key) const {
        const Value& v = value(key);
        if (v.is_number_unsigned()) {
            return v.get<std::size_t>();
        }
        if (v.is_number_integer()) {
            auto n = v.get<std::int64_t>();
            if (n < 0) {
                throw ValidationError(std::string("Field '") + key +
                                      "' must not be negative, got " + std::to_string(n));
            }
            return static_cast<std::size_t>(n);
        }
        throw ValidationError(std::string("Field '") + key + "' must be an integer, got " +
                              type_name(v));
    }

    Path path(const char* key) const {
        const Value& v = value(key);
        if (!v.is_array()) {
            throw ValidationError(std::string("Field '") + key + "' must be an array, got " +
                                  type_name(v));
        }
        Path out;
        out.reserve(v.size());
        for (const auto& segment : v) {
            if (!segment.is_string()) {
                throw ValidationError(std::string("Field '") + key +
                                      "' must contain only strings, got " + type_name(segment));
            }
            out.push_back(segment.get<std::string>());
        }
        return out;
    }

    std::vector<std::string> strings(const char* key) const {
        return path(key);
    }

private:
    const Value& obj_;
};

Operation decode_operation(OpKind kind, const FieldReader& in) {
    switch (kind) {
        case OpKind::set:
            return op::Set{in.value("v")};
        case OpKind::remove:
            return op::Remove{};
        case OpKind::array_append:
            return op::ArrayAppend{in.value("v")};
        case OpKind::array_insert:
            return op::ArrayInsert{in.index("i"), in.value("v")};
        case OpKind::string_replace_first:
            return op::StringReplaceFirst{in.string("s"), in.string("r")};
        case OpKind::string_replace_all:
            return op::StringReplaceAll{in.string("s"), in.string("r")};
        case OpKind::array_pop:
            return op::ArrayPop{};
        case OpKind::array_shift:
            return op::ArrayShift{};
        case OpKind::array_unshift:
            return op::ArrayUnshift{in.value("v")};
        case OpKind::string_append:
            return op::StringAppend{in.string("v")};
        case OpKind::string_remove:
            return op::StringRemove{in.index("i"), in.index("l")};
        case OpKind::string_replace_range:
            return op::StringReplaceRange{in.index("i"), in.index("l"), in.string("v")};
        case OpKind::bool_toggle:
            return op::BoolToggle{};
        case OpKind::array_remove_at:
            return op::ArrayRemoveAt{in.index("i")};
        case OpKind::object_merge: {
            op::ObjectMerge merge;
            merge.entries = in.value("v");
            if (in.has("x")) {
                merge.erase = in.strings("x");
            }
            return merge;
        }
        case OpKind::string_insert:
            return op::StringInsert{in.index("i"), in.string("v")};
        case OpKind::array_move:
            return op::ArrayMove{in.index("f"), in.index("t")};
        case OpKind::move: {
            op::Move move;
            move.destination = in.path("d");
            // A null backfill is a real prior value
            if (in.contains("v")) {
                move.backfill = in.value("v");
            }
            return move;
        }
        case OpKind::insert_move: {
            op::InsertMove insert;
            insert.destination = in.path("d");
            if (in.has("i")) {
                insert.index = in.index("i");
            }
            return insert;
        }
    }
    throw ValidationError("Unknown operation type");
}

Instruction decode_or_throw(const Value& encoded) {
    if (!encoded.is_object()) {
        throw ValidationError("Instruction must be an object, got " + type_name(encoded));
    }
    FieldReader in(encoded);

    const Value& code = in.value("o");
    if (!code.is_number_integer()) {
        throw ValidationError("Invalid operation type: " + code.dump());
    }
    std::optional<OpKind> kind;
    if (code.is_number_unsigned()) {
        auto n = code.get<std::uint64_t>();
        if (n <= static_cast<std::uint64_t>(op_code(OpKind::insert_move))) {
            kind = kind_from_code(static_cast<int>(n));
        }
    } else {
        auto n = code.get<std::int64_t>();
        if (n >= op_code(OpKind::set) && n <= op_code(OpKind::insert_move)) {
            kind = kind_from_code(static_cast<int>(n));
        }
    }
    if (!kind) {
        throw ValidationError("Unknown operation type: " + code.dump());
    }

    Instruction inst{decode_operation(*kind, in), {}};
    if (in.has("p")) {
        inst.path = in.path("p");
    }
    require_valid(inst);
    return inst;
}

} // anonymous namespace

Result<Instruction> decode(const Value& encoded) {
    try {
        return decode_or_throw(encoded);
    } catch (const PatchError& e) {
        return e.to_error();
    }
}

Result<Instruction> decode_string(const std::string& text) {
    Value parsed;
    try {
        parsed = Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorKind::validation, std::string("Invalid instruction format: ") + e.what());
    }
    return decode(parsed);
}

Value encode_batch(const std::vector<Instruction>& batch) {
    Value arr = Value::array();
    for (const auto& inst : batch) {
        arr.push_back(encode(inst));
    }
    return arr;
}

Result<std::vector<Instruction>> decode_batch(const Value& encoded) {
    if (encoded.is_object()) {
        auto single = decode(encoded);
        if (!single) {
            Error err = single.error();
            err.step = 0;
            return err;
        }
        return std::vector<Instruction>{std::move(single).value()};
    }
    if (!encoded.is_array()) {
        return Error(ErrorKind::validation,
                     "Instruction batch must be an array, got " + type_name(encoded));
    }

    std::vector<Instruction> batch;
    batch.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        auto decoded = decode(encoded[i]);
        if (!decoded) {
            Error err = decoded.error();
            err.message = "Invalid instruction " + std::to_string(i) + ": " + err.message;
            err.step = i;
            return err;
        }
        batch.push_back(std::move(decoded).value());
    }
    return batch;
}

} // namespace treepatch
