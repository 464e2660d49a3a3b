/**
 * @file Path.cpp
 * @brief Implementation of the path resolver
 */

#include "treepatch/Path.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace treepatch {

Path split_path(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    Path segments;
    std::string current;

    for (char c : text) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_path(const Path& path) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << '.';
        oss << path[i];
    }
    return oss.str();
}

bool is_index_segment(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::size_t> parse_index(const std::string& segment) {
    if (!is_index_segment(segment)) {
        return std::nullopt;
    }
    // 20 digits can overflow size_t; anything that long is out of range anyway
    if (segment.size() > std::numeric_limits<std::size_t>::digits10) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoull(segment));
}

std::string index_segment(std::size_t index) {
    return std::to_string(index);
}

bool starts_with(const Path& path, const Path& prefix) {
    if (prefix.size() > path.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

namespace {

Path prefix_of(const Path& path, std::size_t count) {
    return Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(count));
}

/**
 * @brief Step from a container into one of its children
 * @return Child pointer, or nullptr if the segment does not exist
 */
template <typename V>
V* child(V* container, const std::string& segment) {
    if (container->is_object()) {
        auto it = container->find(segment);
        return it == container->end() ? nullptr : &*it;
    }
    auto idx = parse_index(segment);
    if (!idx || *idx >= container->size()) {
        return nullptr;
    }
    return &(*container)[*idx];
}

template <typename V>
BasicLocation<V> resolve_impl(V& root, const Path& path, bool require_last) {
    BasicLocation<V> loc;
    if (path.empty()) {
        loc.current = &root;
        return loc;
    }

    V* node = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        if (!is_container(*node)) {
            throw PathNotFound(prefix_of(path, i + 1),
                               "cannot traverse into " + type_name(*node));
        }
        V* next = child(node, path[i]);
        if (next == nullptr) {
            throw PathNotFound(prefix_of(path, i + 1), "missing segment '" + path[i] + "'");
        }
        node = next;
    }

    const std::string& last = path.back();
    if (!is_container(*node)) {
        throw PathNotFound(path, "parent is " + type_name(*node) + ", not a container");
    }

    loc.parent = node;
    loc.key = last;

    if (node->is_array()) {
        auto idx = parse_index(last);
        if (!idx) {
            throw PathNotFound(path, "'" + last + "' is not a sequence index");
        }
        if (*idx >= node->size()) {
            throw RangeError(path, "Invalid index " + last + " for array of length " +
                                   std::to_string(node->size()));
        }
        loc.current = &(*node)[*idx];
        return loc;
    }

    loc.current = child(node, last);
    if (loc.current == nullptr && require_last) {
        throw PathNotFound(path, "missing segment '" + last + "'");
    }
    return loc;
}

} // anonymous namespace

Location resolve(Value& root, const Path& path, bool require_last) {
    return resolve_impl<Value>(root, path, require_last);
}

ConstLocation resolve(const Value& root, const Path& path, bool require_last) {
    return resolve_impl<const Value>(root, path, require_last);
}

const Value* get(const Value& root, const Path& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!is_container(*node)) {
            return nullptr;
        }
        node = child(node, segment);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

} // namespace treepatch
