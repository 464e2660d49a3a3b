/**
 * @file Value.hpp
 * @brief Document tree value type
 *
 * Uses nlohmann::json as the underlying tree model:
 * - Scalars: null, bool, integer, float, string
 * - Sequence: JSON array (ordered, addressed by decimal index segments)
 * - Mapping: JSON object (unique string keys, order irrelevant)
 */

#ifndef TREEPATCH_VALUE_HPP
#define TREEPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace treepatch {

/**
 * @brief Document tree node
 *
 * Alias for nlohmann::json. Copies are deep, which is what gives apply()
 * its copy-on-write contract: the engine edits a copy and never the
 * caller's tree.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value can be traversed by a path segment
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace treepatch

#endif // TREEPATCH_VALUE_HPP
