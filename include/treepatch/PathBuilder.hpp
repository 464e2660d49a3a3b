/**
 * @file PathBuilder.hpp
 * @brief Fluent construction of instructions
 *
 * Segments are accumulated with key()/index(); a terminal call names the
 * operation and returns the finished Instruction. Terminals leave the
 * builder untouched, so one prefix can produce several instructions:
 *
 * ```cpp
 * auto todos = instruction().key("todos");
 * Instruction add  = todos.array_append({{"title", "Buy milk"}});
 * Instruction drop = todos.array_remove_at(0);
 * ```
 */

#ifndef TREEPATCH_PATH_BUILDER_HPP
#define TREEPATCH_PATH_BUILDER_HPP

#include "treepatch/Instruction.hpp"
#include "treepatch/Value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace treepatch {

class PathBuilder {
public:
    PathBuilder() = default;
    explicit PathBuilder(Path prefix) : path_(std::move(prefix)) {}

    // ========================================================================
    // Segments
    // ========================================================================

    /// Append a mapping key (or a raw segment)
    PathBuilder& key(std::string segment);

    /// Append a sequence index
    PathBuilder& index(std::size_t position);

    const Path& path() const noexcept {
        return path_;
    }

    // ========================================================================
    // Terminals
    // ========================================================================

    Instruction set(Value value) const;
    Instruction remove() const;

    Instruction array_append(Value value) const;
    Instruction array_insert(std::size_t index, Value value) const;
    Instruction array_pop() const;
    Instruction array_shift() const;
    Instruction array_unshift(Value value) const;
    Instruction array_remove_at(std::size_t index) const;
    Instruction array_move(std::size_t from, std::size_t to) const;

    Instruction string_insert(std::size_t index, std::string text) const;
    Instruction string_append(std::string text) const;
    Instruction string_remove(std::size_t index, std::size_t length) const;
    Instruction string_replace_range(std::size_t index, std::size_t length,
                                     std::string text) const;
    Instruction string_replace_first(std::string search, std::string replacement) const;
    Instruction string_replace_all(std::string search, std::string replacement) const;

    Instruction bool_toggle() const;

    /**
     * @param entries Mapping of keys to write
     * @param erase Keys to remove before writing
     */
    Instruction object_merge(Value entries, std::vector<std::string> erase = {}) const;

    /// Relocate the built path to destination
    Instruction move(Path destination) const;

    /// Relocate the built path into the destination sequence
    Instruction insert_move(Path destination,
                            std::optional<std::size_t> index = std::nullopt) const;

private:
    template <typename Op>
    Instruction finish(Op operation) const {
        return Instruction{std::move(operation), path_};
    }

    Path path_;
};

/// Start a builder at the document root
inline PathBuilder instruction() {
    return PathBuilder();
}

} // namespace treepatch

#endif // TREEPATCH_PATH_BUILDER_HPP
