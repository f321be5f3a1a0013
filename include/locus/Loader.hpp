/**
 * @file Loader.hpp
 * @brief Document loading into Value trees
 *
 * Loads the documents that ValueDeserializer decodes from:
 * - JSON text and files (using nlohmann::json)
 * - TOML text and files (using toml++)
 *
 * Syntax errors are raised as ParseError before any decoding happens, so
 * they never carry a path.
 */

#ifndef LOCUS_LOADER_HPP
#define LOCUS_LOADER_HPP

#include "locus/Value.hpp"

#include <string>
#include <string_view>

namespace locus {

/**
 * @brief Document format
 */
enum class Format {
    Auto,  ///< Detect from the file extension
    Json,
    Toml
};

/**
 * @brief Options for document loading
 */
struct LoadOptions {
    /// Format of the document (Auto: by extension, .json or .toml)
    Format format = Format::Auto;

    /// Accept `//` and `/* */` comments in JSON
    bool ignore_comments = false;
};

// ============================================================================
// Text
// ============================================================================

/**
 * @brief Parse JSON text
 *
 * @param text JSON document
 * @param options ignore_comments is honored, format is ignored
 * @param source Name used in error messages
 * @throws ParseError if the JSON syntax is invalid
 */
Value parse_json(std::string_view text, const LoadOptions& options = {},
                 const std::string& source = "<string>");

/**
 * @brief Parse TOML text
 *
 * Tables become objects; dates and times become strings in their TOML
 * notation.
 *
 * @throws ParseError if the TOML syntax is invalid
 */
Value parse_toml(std::string_view text, const std::string& source = "<string>");

// ============================================================================
// Files
// ============================================================================

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path, const LoadOptions& options = {});

/**
 * @brief Load a TOML file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting its format unless options.format says
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the document has syntax errors
 * @throws Error if the format is Auto and the extension is not .json/.toml
 */
Value load_document(const std::string& path, const LoadOptions& options = {});

/**
 * @brief Get file extension (lowercase)
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace locus

#endif // LOCUS_LOADER_HPP
