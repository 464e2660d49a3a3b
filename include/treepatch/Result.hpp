/**
 * @file Result.hpp
 * @brief Two-variant success/failure return type
 *
 * Every public engine operation returns a Result instead of throwing.
 *
 * Example:
 * ```cpp
 * auto r = treepatch::apply(doc, instruction);
 * if (!r) {
 *     std::cerr << r.error().message << "\n";
 *     return;
 * }
 * doc = std::move(r).value().document;
 * ```
 */

#ifndef TREEPATCH_RESULT_HPP
#define TREEPATCH_RESULT_HPP

#include "treepatch/Errors.hpp"

#include <utility>
#include <variant>

namespace treepatch {

template <typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept {
        return state_.index() == 0;
    }

    explicit operator bool() const noexcept {
        return ok();
    }

    /**
     * @throws std::bad_variant_access if the result holds an error
     */
    const T& value() const& {
        return std::get<0>(state_);
    }

    T& value() & {
        return std::get<0>(state_);
    }

    T&& value() && {
        return std::get<0>(std::move(state_));
    }

    /**
     * @throws std::bad_variant_access if the result holds a value
     */
    const Error& error() const {
        return std::get<1>(state_);
    }

    Error& error() {
        return std::get<1>(state_);
    }

private:
    std::variant<T, Error> state_;
};

/// Result of an operation that produces nothing but success or an Error
using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status(std::monostate{});
}

} // namespace treepatch

#endif // TREEPATCH_RESULT_HPP
