/**
 * @file Path.hpp
 * @brief Path vocabulary and resolver for document trees
 *
 * A Path is an ordered list of string segments. A segment addressing a
 * sequence element is the canonical decimal form of its zero-based index;
 * a segment addressing a mapping field is the field name. An empty path
 * addresses the whole document.
 *
 * Resolution rules:
 * - Every segment but the last must exist and lead through a mapping or
 *   sequence, otherwise PathNotFound names the failing prefix
 * - The last segment's parent must be a container
 * - On a sequence parent the last segment must be an index segment;
 *   an index past the end is a RangeError
 * - With require_last=true a missing last key is PathNotFound;
 *   with require_last=false the Location reports current == nullptr
 */

#ifndef TREEPATCH_PATH_HPP
#define TREEPATCH_PATH_HPP

#include "treepatch/Value.hpp"
#include "treepatch/Errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace treepatch {

/**
 * @brief Resolved position of a path inside a tree
 *
 * parent is null when the path is empty (the root). current is null when
 * the last key does not exist yet (only possible with require_last=false).
 */
template <typename V>
struct BasicLocation {
    V* parent = nullptr;
    std::string key;
    V* current = nullptr;

    bool is_root() const noexcept {
        return parent == nullptr;
    }
};

using Location = BasicLocation<Value>;
using ConstLocation = BasicLocation<const Value>;

/**
 * @brief Split a dot-separated path into segments
 *
 * Examples:
 * - "graph.nodes.0.label" → ["graph", "nodes", "0", "label"]
 * - "" → []
 */
Path split_path(const std::string& text);

/**
 * @brief Join path segments with dots (diagnostics only)
 */
std::string join_path(const Path& path);

/**
 * @brief Check if a segment is a canonical sequence index
 *
 * Digits only, no sign, no leading zero except "0" itself.
 */
bool is_index_segment(const std::string& segment);

/**
 * @brief Parse a canonical index segment
 * @return The index, or nullopt if the segment is not an index
 */
std::optional<std::size_t> parse_index(const std::string& segment);

/**
 * @brief Render an index as a path segment
 */
std::string index_segment(std::size_t index);

/**
 * @brief Check whether prefix is a proper or equal prefix of path
 */
bool starts_with(const Path& path, const Path& prefix);

/**
 * @brief Resolve a path inside a mutable tree
 *
 * @param root Tree to walk
 * @param path Path to resolve
 * @param require_last Whether the final segment must already exist
 * @return Location of the final segment
 * @throws PathNotFound if a segment is missing or crosses a scalar
 * @throws RangeError if a final sequence index is past the end
 *
 * Example:
 * ```cpp
 * Value doc = {{"items", {"a", "b"}}};
 * auto loc = resolve(doc, {"items", "1"}, true);
 * // loc.parent == &doc["items"], loc.key == "1", *loc.current == "b"
 * ```
 */
Location resolve(Value& root, const Path& path, bool require_last);

/**
 * @brief Resolve a path inside a const tree
 * @see resolve(Value&, const Path&, bool)
 */
ConstLocation resolve(const Value& root, const Path& path, bool require_last);

/**
 * @brief Look up the value at a path without raising
 * @return Pointer into root, or nullptr if the path does not resolve
 */
const Value* get(const Value& root, const Path& path);

} // namespace treepatch

#endif // TREEPATCH_PATH_HPP
