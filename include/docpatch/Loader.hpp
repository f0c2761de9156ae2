/**
 * @file Loader.hpp
 * @brief Document loading and rendering
 *
 * Input documents come from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++), converted to the JSON value model
 * - Standard input ("-"), JSON only
 *
 * Output documents are rendered as JSON text or as TOML.
 */

#ifndef DOCPATCH_LOADER_HPP
#define DOCPATCH_LOADER_HPP

#include "docpatch/Value.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace docpatch {

/// Path argument that selects standard input
inline constexpr const char* kStdinPath = "-";

// ============================================================================
// Input
// ============================================================================

/**
 * @brief Load a document from a JSON file
 *
 * @param path Path to the JSON file
 * @return Parsed document
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the JSON is invalid (with line and column)
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file
 *
 * Tables become objects, arrays stay arrays, and dates and times become
 * their TOML text form.
 *
 * @param path Path to the TOML file
 * @return Parsed document (always an object)
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the TOML is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, picking the format from the path
 *
 * - "-": one JSON value from standard input
 * - ".toml": TOML
 * - anything else: JSON
 *
 * Example:
 * ```cpp
 * Value left = load_document("before.json");
 * Value right = load_document("after.toml");
 * ```
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the content is invalid
 */
Value load_document(const std::string& path);

/**
 * @brief Read several consecutive JSON values from one stream
 *
 * Values may be separated by whitespace. Used when two inputs both come
 * from standard input.
 *
 * @param in Stream to read from
 * @param count Number of values to read
 * @param source Name used in error messages
 * @return The values, in stream order
 * @throws DocumentParseError if a value is invalid or the stream holds
 *         fewer than count values
 */
std::vector<Value> read_documents(std::istream& in, std::size_t count,
                                  const std::string& source = "<stdin>");

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Output
// ============================================================================

/**
 * @brief Render a document as JSON text
 * @param indent Spaces per level, or a negative value for compact output
 */
std::string to_json_string(const Value& doc, int indent = 2);

/**
 * @brief Render a document as TOML
 *
 * TOML has no null, so nulls are written as empty strings.
 *
 * @throws Error if doc is not an object (TOML documents are tables)
 */
std::string to_toml_string(const Value& doc);

} // namespace docpatch

#endif // DOCPATCH_LOADER_HPP
