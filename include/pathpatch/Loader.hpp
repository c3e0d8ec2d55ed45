/**
 * @file Loader.hpp
 * @brief Reading and writing document files
 *
 * Supported formats, chosen by file extension:
 * - .json (nlohmann::json)
 * - .toml (toml++)
 */

#ifndef PATHPATCH_LOADER_HPP
#define PATHPATCH_LOADER_HPP

#include "pathpatch/Value.hpp"
#include <string>

namespace pathpatch {

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Read a file into a byte buffer
 *
 * @param path File path
 * @return File contents
 * @throws FileNotFoundError if the file does not exist or cannot be opened
 */
Bytes read_file_bytes(const std::string& path);

/**
 * @brief Load a document from a JSON or TOML file
 *
 * TOML dates and times are converted to their TOML text form.
 *
 * @param path Path to the document file
 * @return Parsed document
 * @throws FileNotFoundError if the file does not exist
 * @throws DocumentParseError on a syntax error
 * @throws UnsupportedFormatError if the extension is not .json or .toml
 */
Value load_document_file(const std::string& path);

/**
 * @brief Render a document as TOML
 *
 * TOML requires a table at the root: a non-object document is wrapped
 * under the key "value". TOML has no null: null members are omitted,
 * null array elements are written as empty strings.
 */
std::string to_toml_string(const Value& document);

/**
 * @brief Write a document to a JSON or TOML file
 *
 * @param path Destination; the format follows its extension
 * @param document Document to write
 * @param indent JSON indentation
 * @throws UnsupportedFormatError if the extension is not .json or .toml
 * @throws DocumentError if the file cannot be opened for writing
 */
void write_document_file(const std::string& path, const Value& document, int indent = 2);

} // namespace pathpatch

#endif // PATHPATCH_LOADER_HPP
