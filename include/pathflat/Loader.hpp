/**
 * @file Loader.hpp
 * @brief Read JSON and TOML documents into the generic tree
 *
 * Implements loading from:
 * - JSON files (using nlohmann::json, member order preserved)
 * - TOML files (using toml++)
 * - In-memory text in either format (used for stdin)
 */

#ifndef PATHFLAT_LOADER_HPP
#define PATHFLAT_LOADER_HPP

#include "pathflat/Value.hpp"
#include <string>

namespace pathflat {

/**
 * @brief Supported document formats
 */
enum class DocumentFormat {
    Json,
    Toml
};

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value (any JSON value, not only objects)
 * @throws DocumentNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Tables become objects and arrays become arrays. Dates, times and
 * date-times have no JSON counterpart and become their TOML text form.
 *
 * @param path Path to the TOML file
 * @return Parsed Value (always an object)
 * @throws DocumentNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension.
 *
 * @param path Path ending in .json or .toml (case-insensitive)
 * @return Parsed Value
 * @throws DocumentNotFoundError if file doesn't exist
 * @throws DocumentParseError if file has syntax errors
 * @throws UnsupportedFormatError if extension is not .json or .toml
 */
Value load_document(const std::string& path);

/**
 * @brief Parse a document held in memory.
 *
 * @param text Document text
 * @param format Format of @p text
 * @param source_name Name used in error messages (e.g., "<stdin>")
 * @throws DocumentParseError if text has syntax errors
 */
Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& source_name = "<memory>");

/**
 * @brief Map a file extension to a document format.
 *
 * @throws UnsupportedFormatError if extension is not .json or .toml
 */
DocumentFormat format_of(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace pathflat

#endif // PATHFLAT_LOADER_HPP
