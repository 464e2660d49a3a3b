/**
 * @file Config.hpp
 * @brief Layered settings for the treepatch tool
 *
 * Precedence, lowest first:
 * 1. built-in defaults
 * 2. settings file (.json or .toml)
 * 3. environment variables PREFIX_* (TREEPATCH_OUTPUT_INDENT -> output.indent)
 * 4. explicit key=value overrides
 *
 * Every layer is written into the settings tree as set instructions run
 * through the engine, so settings keys follow the same path rules as
 * documents.
 *
 * Recognised keys:
 *
 * | key                    | type    | default |
 * |------------------------|---------|---------|
 * | output.indent          | integer | 2       |
 * | output.format          | string  | "json"  |
 * | log.verbosity          | integer | 0       |
 * | apply.check_round_trip | boolean | false   |
 */

#ifndef TREEPATCH_CONFIG_HPP
#define TREEPATCH_CONFIG_HPP

#include "treepatch/Value.hpp"

#include <map>
#include <optional>
#include <string>

namespace treepatch {

struct Settings {
    /// JSON output indentation; negative prints compact JSON
    int indent = 2;
    /// Output format for documents written to stdout: "json" or "toml"
    std::string format = "json";
    /// glog verbosity (FLAGS_v)
    int verbosity = 0;
    /// Verify the round-trip law after every apply
    bool check_round_trip = false;
};

/**
 * @brief Options for load_settings()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    /// Environment variable prefix; nullopt disables the environment layer
    std::optional<std::string> prefix = std::string("TREEPATCH");
    /// Dotted key to raw string value, typed with parse_value()
    std::map<std::string, std::string> overrides;
};

/**
 * @brief Build the merged settings tree
 *
 * @throws FileNotFoundError, DocumentParseError from the file layer
 * @throws SettingsError if a layer cannot be written (e.g. a key nests
 *         below a scalar)
 */
Value load_settings_tree(const LoadOptions& options);

/**
 * @brief Read typed settings out of a tree; unknown keys are ignored
 * @throws SettingsError on a wrongly typed or out-of-range value
 */
Settings settings_from_tree(const Value& tree);

/// load_settings_tree() followed by settings_from_tree()
Settings load_settings(const LoadOptions& options);

/// Built-in defaults as a tree
Value default_settings_tree();

/**
 * @brief Type a raw string from the environment or the command line
 *
 * - "true"/"false" (any case) -> boolean
 * - "null" (any case) -> null
 * - decimal integer -> integer; decimal with fraction/exponent -> float
 * - text starting with { or [ that parses as JSON -> that JSON
 * - a JSON-quoted string -> the unescaped string
 * - anything else -> the raw string
 */
Value parse_value(const std::string& text);

/**
 * @brief Settings key for an environment variable name
 *
 * Strips PREFIX_ (case-insensitive), lower-cases, turns single
 * underscores into dots and double underscores into a literal underscore.
 *
 * @return Dotted key, or an empty string if the name lacks the prefix
 */
std::string env_key(const std::string& name, const std::string& prefix);

} // namespace treepatch

#endif // TREEPATCH_CONFIG_HPP
