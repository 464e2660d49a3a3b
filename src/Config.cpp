/**
 * @file Config.cpp
 * @brief Implementation of layered settings loading
 */

#include "treepatch/Config.hpp"
#include "treepatch/Apply.hpp"
#include "treepatch/Errors.hpp"
#include "treepatch/Loader.hpp"
#include "treepatch/Path.hpp"
#include "treepatch/PathBuilder.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

#ifdef _WIN32
    #include <stdlib.h>
    #define TREEPATCH_ENVIRON _environ
#else
    extern char** environ;
    #define TREEPATCH_ENVIRON environ
#endif

namespace treepatch {

namespace {

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    std::string::size_type pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::vector<std::pair<std::string, std::string>> environment() {
    std::vector<std::pair<std::string, std::string>> vars;
    for (char** entry = TREEPATCH_ENVIRON; entry != nullptr && *entry != nullptr; ++entry) {
        std::string line(*entry);
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        vars.emplace_back(line.substr(0, eq), line.substr(eq + 1));
    }
    return vars;
}

// ============================================================================
// Writing layers through the engine
// ============================================================================

/**
 * @brief Set a dotted key, creating intermediate mappings as needed
 */
void assign(Value& tree, const std::string& key, const Value& value) {
    Path path = split_path(key);
    if (path.empty()) {
        throw SettingsError(key, "empty key");
    }
    try {
        PathBuilder builder;
        for (std::size_t depth = 0; depth + 1 < path.size(); ++depth) {
            builder.key(path[depth]);
            const Value* node = get(tree, builder.path());
            if (node == nullptr) {
                apply_in_place(tree, builder.set(Value::object()));
            } else if (!node->is_object()) {
                throw SettingsError(key, "'" + join_path(builder.path()) + "' is " +
                                         type_name(*node) + ", not a mapping");
            }
        }
        apply_in_place(tree, builder.key(path.back()).set(value));
    } catch (const PatchError& e) {
        throw SettingsError(key, e.what());
    }
}

/**
 * @brief Write every leaf of a layer; arrays and empty mappings count as
 *        leaves
 */
void assign_leaves(Value& tree, const Value& layer, const std::string& prefix) {
    for (auto it = layer.begin(); it != layer.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (it.value().is_object() && !it.value().empty()) {
            assign_leaves(tree, it.value(), key);
        } else {
            assign(tree, key, it.value());
        }
    }
}

// ============================================================================
// Reading typed values
// ============================================================================

const Value* lookup(const Value& tree, const char* key) {
    return get(tree, split_path(key));
}

int read_int(const Value& tree, const char* key, int fallback, int minimum) {
    const Value* node = lookup(tree, key);
    if (node == nullptr) return fallback;
    if (!node->is_number_integer()) {
        throw SettingsError(key, "expected an integer, got " + type_name(*node));
    }
    if (node->is_number_unsigned()) {
        auto u = node->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw SettingsError(key, "value " + node->dump() + " is out of range");
        }
        return static_cast<int>(u);
    }
    auto n = node->get<std::int64_t>();
    if (n < minimum || n > std::numeric_limits<int>::max()) {
        throw SettingsError(key, "value " + node->dump() + " is out of range");
    }
    return static_cast<int>(n);
}

std::string read_string(const Value& tree, const char* key, const std::string& fallback) {
    const Value* node = lookup(tree, key);
    if (node == nullptr) return fallback;
    if (!node->is_string()) {
        throw SettingsError(key, "expected a string, got " + type_name(*node));
    }
    return node->get<std::string>();
}

bool read_bool(const Value& tree, const char* key, bool fallback) {
    const Value* node = lookup(tree, key);
    if (node == nullptr) return fallback;
    if (!node->is_boolean()) {
        throw SettingsError(key, "expected a boolean, got " + type_name(*node));
    }
    return node->get<bool>();
}

} // anonymous namespace

// ============================================================================
// Value typing and env names
// ============================================================================

Value parse_value(const std::string& text) {
    if (text.empty()) {
        return "";
    }

    std::string lower = to_lower(text);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    static const std::regex integer_re("^-?[0-9]+$");
    static const std::regex float_re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");

    if (std::regex_match(text, integer_re)) {
        try {
            return static_cast<std::int64_t>(std::stoll(text));
        } catch (const std::out_of_range&) {
            // Too large for an integer; falls through to the raw string
        }
    }

    if (std::regex_match(text, float_re)) {
        try {
            return std::stod(text);
        } catch (const std::out_of_range&) {
            // Falls through to the raw string
        }
    }

    if ((text.front() == '{' && text.back() == '}') ||
        (text.front() == '[' && text.back() == ']') ||
        (text.size() >= 2 && text.front() == '"' && text.back() == '"')) {
        try {
            return Value::parse(text);
        } catch (const nlohmann::json::parse_error&) {
            // Not JSON after all; keep the raw text
        }
    }

    return text;
}

std::string env_key(const std::string& name, const std::string& prefix) {
    std::string rest = name;
    if (!prefix.empty()) {
        std::string normalized = prefix;
        while (!normalized.empty() && normalized.back() == '_') {
            normalized.pop_back();
        }
        normalized += "_";
        if (name.size() <= normalized.size() ||
            to_lower(name.substr(0, normalized.size())) != to_lower(normalized)) {
            return "";
        }
        rest = name.substr(normalized.size());
    }

    const std::string marker = "\x1F";
    rest = replace_all(to_lower(rest), "__", marker);
    rest = replace_all(rest, "_", ".");
    return replace_all(rest, marker, "_");
}

// ============================================================================
// Loading
// ============================================================================

Value default_settings_tree() {
    Settings defaults;
    Value tree = Value::object();
    tree["output"]["indent"] = defaults.indent;
    tree["output"]["format"] = defaults.format;
    tree["log"]["verbosity"] = defaults.verbosity;
    tree["apply"]["check_round_trip"] = defaults.check_round_trip;
    return tree;
}

Value load_settings_tree(const LoadOptions& options) {
    // 1) defaults
    Value tree = default_settings_tree();

    // 2) file
    if (options.file_path && !options.file_path->empty()) {
        Value file = load_document(*options.file_path);
        if (!file.is_object()) {
            throw SettingsError(*options.file_path,
                                "settings file must hold a mapping, got " + type_name(file));
        }
        assign_leaves(tree, file, "");
    }

    // 3) env
    if (options.prefix && !options.prefix->empty()) {
        for (const auto& [name, raw] : environment()) {
            std::string key = env_key(name, *options.prefix);
            if (key.empty()) continue;
            VLOG(1) << "Setting " << key << " from " << name;
            assign(tree, key, parse_value(raw));
        }
    }

    // 4) overrides
    for (const auto& [key, raw] : options.overrides) {
        assign(tree, key, parse_value(raw));
    }

    return tree;
}

Settings settings_from_tree(const Value& tree) {
    Settings defaults;
    Settings s;
    s.indent = read_int(tree, "output.indent", defaults.indent, -1);
    s.format = read_string(tree, "output.format", defaults.format);
    s.verbosity = read_int(tree, "log.verbosity", defaults.verbosity, 0);
    s.check_round_trip = read_bool(tree, "apply.check_round_trip", defaults.check_round_trip);

    if (s.format != "json" && s.format != "toml") {
        throw SettingsError("output.format", "expected \"json\" or \"toml\", got \"" +
                                             s.format + "\"");
    }
    return s;
}

Settings load_settings(const LoadOptions& options) {
    return settings_from_tree(load_settings_tree(options));
}

} // namespace treepatch
