/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "treepatch/Loader.hpp"
#include "treepatch/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace treepatch {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert a toml++ node to a Value
 */
Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

// ---- Value -> TOML ---------------------------------------------------------

toml::table make_table(const Value& obj, const std::string& where);
toml::array make_array(const Value& arr, const std::string& where);

std::string child(const std::string& where, const std::string& key) {
    return where.empty() ? key : where + "." + key;
}

std::int64_t to_toml_integer(const Value& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::runtime_error("Integer " + v.dump() + " is out of range for TOML");
        }
        return static_cast<std::int64_t>(u);
    }
    return v.get<std::int64_t>();
}

/**
 * @brief Append a value to anything with push_back (toml::array) or
 *        insert a keyed value into a toml::table
 */
template <typename Sink>
void emit(const Value& v, const std::string& where, Sink&& sink) {
    switch (v.type()) {
        case Value::value_t::object:
            sink(make_table(v, where));
            break;
        case Value::value_t::array:
            sink(make_array(v, where));
            break;
        case Value::value_t::string:
            sink(v.get<std::string>());
            break;
        case Value::value_t::boolean:
            sink(v.get<bool>());
            break;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            sink(to_toml_integer(v));
            break;
        case Value::value_t::number_float:
            sink(v.get<double>());
            break;
        default:
            throw std::runtime_error("TOML cannot represent " + type_name(v) + " at '" +
                                     where + "'");
    }
}

toml::table make_table(const Value& obj, const std::string& where) {
    toml::table tbl;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string& key = it.key();
        emit(it.value(), child(where, key),
             [&tbl, &key](auto&& node) { tbl.insert_or_assign(key, std::move(node)); });
    }
    return tbl;
}

toml::array make_array(const Value& arr, const std::string& where) {
    toml::array out;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        emit(arr[i], child(where, std::to_string(i)),
             [&out](auto&& node) { out.push_back(std::move(node)); });
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Loading
// ============================================================================

std::string format_for_path(const std::string& path) {
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".json") return "json";
    if (ext == ".toml") return "toml";
    return "";
}

Value parse_document(const std::string& text, const std::string& format,
                     const std::string& source) {
    if (format == "json") {
        try {
            return Value::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw DocumentParseError(source, e.what());
        }
    }
    if (format == "toml") {
        try {
            toml::table table = toml::parse(text, source);
            return toml_to_value(table);
        } catch (const toml::parse_error& e) {
            std::ostringstream details;
            details << e.description() << " (line " << e.source().begin.line << ", column "
                    << e.source().begin.column << ")";
            throw DocumentParseError(source, details.str());
        }
    }
    throw std::runtime_error("Unsupported document format: '" + format +
                             "' (expected json or toml)");
}

Value load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    std::string format = format_for_path(path);
    if (format.empty()) {
        throw std::runtime_error("Unsupported document type: " +
                                 fs::path(path).extension().string() +
                                 " (expected .json or .toml)");
    }
    return parse_document(read_file(path), format, path);
}

// ============================================================================
// Writing
// ============================================================================

std::string dump_document(const Value& document, const std::string& format, int indent) {
    if (format == "json") {
        return document.dump(indent);
    }
    if (format == "toml") {
        if (!document.is_object()) {
            throw std::runtime_error("TOML documents must be a mapping at the root, got " +
                                     type_name(document));
        }
        std::ostringstream ss;
        ss << make_table(document, "");
        return ss.str();
    }
    throw std::runtime_error("Unsupported document format: '" + format +
                             "' (expected json or toml)");
}

void write_document(const std::string& path, const Value& document, int indent) {
    std::string format = format_for_path(path);
    if (format.empty()) {
        throw std::runtime_error("Unsupported document type: " +
                                 fs::path(path).extension().string() +
                                 " (expected .json or .toml)");
    }
    std::string text = dump_document(document, format, indent);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open for write: " + path);
    }
    out << text << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write: " + path);
    }
}

} // namespace treepatch
