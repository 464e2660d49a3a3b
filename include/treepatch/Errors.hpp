/**
 * @file Errors.hpp
 * @brief Error taxonomy for the mutation engine
 *
 * Two layers:
 * - Error: plain value carried by a failed Result (what callers see)
 * - PatchError and subclasses: raised internally while an instruction is
 *   being applied or inverted, converted to Error at every public entry point
 *
 * Categories:
 * - validation: malformed instruction, rejected before the tree is touched
 * - navigation: a path segment is missing or crosses a non-container
 * - shape:      the target has the wrong type for the operation
 * - range:      index, offset or length outside the target's bounds
 *
 * Loader/Config failures (FileNotFoundError, DocumentParseError,
 * SettingsError) are not
 * engine errors and propagate as exceptions, like any other I/O failure.
 */

#ifndef TREEPATCH_ERRORS_HPP
#define TREEPATCH_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treepatch {

using Path = std::vector<std::string>;

/**
 * @brief Error category
 */
enum class ErrorKind : std::uint8_t {
    validation,
    navigation,
    shape,
    range,
};

/**
 * @brief Stable lower-case name of an ErrorKind
 */
constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::validation: return "validation";
        case ErrorKind::navigation: return "navigation";
        case ErrorKind::shape:      return "shape";
        case ErrorKind::range:      return "range";
    }
    return "unknown";
}

/**
 * @brief Failure payload of a Result
 */
struct Error {
    ErrorKind kind = ErrorKind::validation;
    std::string message;
    /// Path (or failing path prefix) the error refers to, empty for root
    Path path;
    /// Zero-based position inside a batch, when the error came from one
    std::optional<std::size_t> step;

    Error() = default;
    Error(ErrorKind k, std::string msg, Path p = {})
        : kind(k), message(std::move(msg)), path(std::move(p)) {}
};

// ============================================================================
// Internal exception hierarchy
// ============================================================================

/**
 * @brief Base class for engine exceptions
 */
class PatchError : public std::runtime_error {
public:
    PatchError(ErrorKind kind, const std::string& message, Path path = {})
        : std::runtime_error(message)
        , kind_(kind)
        , path_(std::move(path))
    {}

    ErrorKind kind() const noexcept {
        return kind_;
    }

    const Path& path() const noexcept {
        return path_;
    }

    /**
     * @brief Convert to the value type returned across the engine boundary
     */
    Error to_error() const {
        return Error(kind_, what(), path_);
    }

private:
    ErrorKind kind_;
    Path path_;
};

/**
 * @brief Malformed instruction
 */
class ValidationError : public PatchError {
public:
    explicit ValidationError(const std::string& message, Path path = {})
        : PatchError(ErrorKind::validation, message, std::move(path))
    {}
};

/**
 * @brief Path segment not found during traversal
 *
 * Raised when a segment does not exist, or when traversal reaches a
 * value that is not a mapping or sequence before the path ends.
 */
class PathNotFound : public PatchError {
public:
    /**
     * @param prefix Path up to and including the failing segment
     * @param reason Short description of why traversal stopped
     */
    PathNotFound(Path prefix, const std::string& reason)
        : PatchError(ErrorKind::navigation,
                     "Path not found at '" + render(prefix) + "': " + reason,
                     prefix)
    {}

private:
    static std::string render(const Path& p) {
        std::string out;
        for (std::size_t i = 0; i < p.size(); ++i) {
            if (i > 0) out += '.';
            out += p[i];
        }
        return out;
    }
};

/**
 * @brief Target has the wrong type for the operation
 */
class ShapeError : public PatchError {
public:
    /**
     * @param path Path of the target
     * @param operation Operation name (e.g. "array_pop")
     * @param expected Expected type (e.g. "array")
     * @param actual Actual type found (see type_name())
     */
    ShapeError(Path path, const std::string& operation,
               const std::string& expected, const std::string& actual)
        : PatchError(ErrorKind::shape,
                     "Target is not " + expected + " for " + operation +
                     " (found " + actual + ")",
                     std::move(path))
    {}

    ShapeError(Path path, const std::string& message)
        : PatchError(ErrorKind::shape, message, std::move(path))
    {}
};

/**
 * @brief Index, offset or length out of bounds
 */
class RangeError : public PatchError {
public:
    RangeError(Path path, const std::string& message)
        : PatchError(ErrorKind::range, message, std::move(path))
    {}
};

// ============================================================================
// I/O errors (Loader / Config)
// ============================================================================

/**
 * @brief Document or settings file not found
 */
class FileNotFoundError : public std::runtime_error {
public:
    explicit FileNotFoundError(std::string path)
        : std::runtime_error("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief JSON/TOML syntax error while loading a file
 */
class DocumentParseError : public std::runtime_error {
public:
    DocumentParseError(std::string file, std::string details)
        : std::runtime_error("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief A settings key holds a value of the wrong type, or a layer could
 *        not be applied
 */
class SettingsError : public std::runtime_error {
public:
    SettingsError(std::string key, const std::string& message)
        : std::runtime_error("Invalid setting '" + key + "': " + message)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

} // namespace treepatch

#endif // TREEPATCH_ERRORS_HPP
