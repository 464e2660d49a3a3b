/**
 * @file Loader.hpp
 * @brief Reading and writing documents as JSON or TOML
 *
 * The format is chosen by file extension (.json or .toml, case-insensitive).
 * TOML documents are converted to the same Value tree as JSON ones; dates
 * and times become their TOML text form.
 */

#ifndef TREEPATCH_LOADER_HPP
#define TREEPATCH_LOADER_HPP

#include "treepatch/Value.hpp"

#include <string>

namespace treepatch {

/**
 * @brief Load a document from a .json or .toml file
 *
 * @param path File to read
 * @return Parsed tree
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the content is not valid for its format
 * @throws std::runtime_error for any other extension
 */
Value load_document(const std::string& path);

/**
 * @brief Parse document text in the given format ("json" or "toml")
 *
 * @param source Name used in error messages
 * @throws DocumentParseError
 */
Value parse_document(const std::string& text, const std::string& format,
                     const std::string& source = "<string>");

/**
 * @brief Render a document
 *
 * @param document Tree to render
 * @param format "json" or "toml"
 * @param indent JSON indentation; negative gives the compact form. Ignored
 *        for TOML.
 * @throws std::runtime_error if format is unknown, or the tree cannot be
 *         represented in TOML (non-mapping root, null values)
 */
std::string dump_document(const Value& document, const std::string& format, int indent = 2);

/**
 * @brief Write a document, choosing the format from the extension
 * @throws std::runtime_error on I/O failure
 */
void write_document(const std::string& path, const Value& document, int indent = 2);

/// Lower-cased format name for a file path ("json", "toml" or "")
std::string format_for_path(const std::string& path);

} // namespace treepatch

#endif // TREEPATCH_LOADER_HPP
