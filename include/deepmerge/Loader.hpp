/**
 * @file Loader.hpp
 * @brief Reading and writing documents for the untyped merge path
 *
 * Supported formats:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * The format is picked from the file extension (.json / .toml, any case).
 */

#ifndef DEEPMERGE_LOADER_HPP
#define DEEPMERGE_LOADER_HPP

#include "deepmerge/Value.hpp"

#include <string>

namespace deepmerge {

/**
 * @brief Serialization formats understood by the loader
 */
enum class DocumentFormat {
    Json,
    Toml
};

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Map a path's extension to a format
 * @throws UnsupportedFormatError if the extension is not .json or .toml
 */
DocumentFormat format_from_extension(const std::string& path);

/**
 * @brief Map a format name ("json" or "toml", any case) to a format
 * @throws UnsupportedFormatError for any other name
 */
DocumentFormat format_from_name(const std::string& name);

/**
 * @brief Parse in-memory text
 *
 * @param text Document text
 * @param format Format of the text
 * @param origin Name used in error messages (file path or "<stdin>")
 * @return Parsed document
 * @throws DocumentParseError if the text has syntax errors
 */
Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& origin = "<string>");

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 *
 * Tables become objects. Dates, times and date-times become strings.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file, detecting the format by extension
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if file has syntax errors
 * @throws UnsupportedFormatError if extension is not .json or .toml
 */
Value load_document(const std::string& path);

/**
 * @brief Serialize a document
 *
 * JSON output uses `indent` spaces (negative = compact). TOML output needs
 * an object at the root. TOML has no null, so null members are left out.
 *
 * @throws UnsupportedFormatError if the value cannot be expressed in TOML
 *         (non-object root, null inside an array)
 */
std::string dump_document(const Value& document, DocumentFormat format, int indent = 2);

/**
 * @brief Write a document, detecting the format by extension
 *
 * @throws UnsupportedFormatError if extension is not .json or .toml, or
 *         the value cannot be expressed in that format
 * @throws DeepMergeError if the file cannot be opened or the write fails
 */
void write_document(const std::string& path, const Value& document, int indent = 2);

/**
 * @brief Write a document in an explicit format, whatever the extension
 *
 * @throws UnsupportedFormatError if the value cannot be expressed in TOML
 * @throws DeepMergeError if the file cannot be opened or the write fails
 */
void write_document(const std::string& path, const Value& document, DocumentFormat format,
                    int indent = 2);

} // namespace deepmerge

#endif // DEEPMERGE_LOADER_HPP
