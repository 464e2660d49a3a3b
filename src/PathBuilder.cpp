/**
 * @file PathBuilder.cpp
 * @brief Implementation of the instruction builder
 */

#include "treepatch/PathBuilder.hpp"
#include "treepatch/Path.hpp"

#include <utility>

namespace treepatch {

PathBuilder& PathBuilder::key(std::string segment) {
    path_.push_back(std::move(segment));
    return *this;
}

PathBuilder& PathBuilder::index(std::size_t position) {
    path_.push_back(index_segment(position));
    return *this;
}

Instruction PathBuilder::set(Value value) const {
    return finish(op::Set{std::move(value)});
}

Instruction PathBuilder::remove() const {
    return finish(op::Remove{});
}

Instruction PathBuilder::array_append(Value value) const {
    return finish(op::ArrayAppend{std::move(value)});
}

Instruction PathBuilder::array_insert(std::size_t index, Value value) const {
    return finish(op::ArrayInsert{index, std::move(value)});
}

Instruction PathBuilder::array_pop() const {
    return finish(op::ArrayPop{});
}

Instruction PathBuilder::array_shift() const {
    return finish(op::ArrayShift{});
}

Instruction PathBuilder::array_unshift(Value value) const {
    return finish(op::ArrayUnshift{std::move(value)});
}

Instruction PathBuilder::array_remove_at(std::size_t index) const {
    return finish(op::ArrayRemoveAt{index});
}

Instruction PathBuilder::array_move(std::size_t from, std::size_t to) const {
    return finish(op::ArrayMove{from, to});
}

Instruction PathBuilder::string_insert(std::size_t index, std::string text) const {
    return finish(op::StringInsert{index, std::move(text)});
}

Instruction PathBuilder::string_append(std::string text) const {
    return finish(op::StringAppend{std::move(text)});
}

Instruction PathBuilder::string_remove(std::size_t index, std::size_t length) const {
    return finish(op::StringRemove{index, length});
}

Instruction PathBuilder::string_replace_range(std::size_t index, std::size_t length,
                                              std::string text) const {
    return finish(op::StringReplaceRange{index, length, std::move(text)});
}

Instruction PathBuilder::string_replace_first(std::string search, std::string replacement) const {
    return finish(op::StringReplaceFirst{std::move(search), std::move(replacement)});
}

Instruction PathBuilder::string_replace_all(std::string search, std::string replacement) const {
    return finish(op::StringReplaceAll{std::move(search), std::move(replacement)});
}

Instruction PathBuilder::bool_toggle() const {
    return finish(op::BoolToggle{});
}

Instruction PathBuilder::object_merge(Value entries, std::vector<std::string> erase) const {
    return finish(op::ObjectMerge{std::move(entries), std::move(erase)});
}

Instruction PathBuilder::move(Path destination) const {
    return finish(op::Move{std::move(destination), std::nullopt});
}

Instruction PathBuilder::insert_move(Path destination, std::optional<std::size_t> index) const {
    return finish(op::InsertMove{std::move(destination), index});
}

} // namespace treepatch
