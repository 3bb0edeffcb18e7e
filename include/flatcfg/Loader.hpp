/**
 * @file Loader.hpp
 * @brief Building a Properties store from files and the environment
 *
 * Supported file formats, chosen by extension:
 * - .properties: Java properties syntax (parse_properties_text)
 * - .json: nlohmann::json, flattened with flatten_json()
 * - .toml: toml++, converted to JSON then flattened
 *
 * Structured documents become flat keys: object members are joined with
 * '.', array elements get "[i]". So {"a": {"b": [{"c": 1}]}} loads as
 * a.b[0].c = 1, which decode_list(props, "a.b") can read back.
 */

#ifndef FLATCFG_LOADER_HPP
#define FLATCFG_LOADER_HPP

#include "flatcfg/Value.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flatcfg {

// ============================================================================
// Properties files
// ============================================================================

/**
 * @brief Parse Java properties text
 *
 * - Lines whose first non-blank character is '#' or '!' are comments.
 * - The key ends at the first unescaped '=', ':' or whitespace; one
 *   separator and surrounding whitespace are skipped.
 * - A line ending in an odd number of backslashes continues on the next
 *   line; leading whitespace of the continuation is dropped.
 * - Escapes: \\t \\n \\r \\f \\uXXXX (stored as UTF-8); any other
 *   escaped character stands for itself.
 * - For duplicate keys the last one wins.
 *
 * All values are stored as strings.
 *
 * @param source Name used in error messages
 * @throws ConfigParseError on a malformed \\uXXXX escape
 */
Properties parse_properties_text(const std::string& text,
                                 const std::string& source = "<string>");

/**
 * @throws FileNotFoundError if path does not exist
 * @throws ConfigParseError on malformed content
 */
Properties load_properties_file(const std::filesystem::path& path);

// ============================================================================
// Structured files
// ============================================================================

/**
 * @brief Flatten a JSON document into flat keys
 *
 * Leaves map to Value alternatives: null, bool, int64 (integers),
 * double, string. Empty objects and arrays have no leaves and are kept
 * as opaque json values under their own key.
 *
 * @throws InvalidArgumentError if doc is not an object
 */
Properties flatten_json(const nlohmann::json& doc);

/**
 * @throws FileNotFoundError if path does not exist
 * @throws ConfigParseError on syntax errors or a non-object document
 */
Properties load_json_file(const std::filesystem::path& path);

/**
 * @brief Load a TOML file
 *
 * Dates and times are stored as their TOML text form.
 *
 * @throws FileNotFoundError if path does not exist
 * @throws ConfigParseError on syntax errors
 */
Properties load_toml_file(const std::filesystem::path& path);

/**
 * @brief Load any supported file, dispatching on its extension
 * @throws FileNotFoundError if path does not exist
 * @throws ConfigError for an unsupported extension
 */
Properties load_config_file(const std::filesystem::path& path);

/**
 * @brief Lowercase extension including the dot (".json"), or empty
 */
std::string get_file_extension(const std::filesystem::path& path);

// ============================================================================
// Candidate files
// ============================================================================

/**
 * @brief Typical config file locations, in priority order
 *
 * ./application.properties, then src/main/resources/application.properties;
 * both absolute and normalized, duplicates removed.
 */
std::vector<std::filesystem::path> candidate_config_files();

/**
 * @brief First candidate that exists, absolute and normalized
 * @return nullopt when none exists
 * @throws InvalidArgumentError if candidates is empty
 */
std::optional<std::filesystem::path>
first_existing_file(const std::vector<std::filesystem::path>& candidates);

// ============================================================================
// Layered loading
// ============================================================================

/**
 * @brief Sources for load(), lowest precedence first
 */
struct LoadOptions {
    /// Baseline values
    Properties defaults;

    /// Explicit config file; when unset the first existing candidate is used
    std::optional<std::filesystem::path> file_path;

    /// Searched when file_path is unset; no file is loaded if none exists
    std::vector<std::filesystem::path> candidates;

    /// Overlay PREFIX_* environment variables (see env_overlay())
    std::optional<std::string> env_prefix;

    /// Highest precedence values
    Properties overrides;
};

/**
 * @brief Merge defaults, file, environment and overrides
 *
 * Later layers replace earlier values key by key.
 *
 * @throws FileNotFoundError if an explicit file_path does not exist
 */
Properties load(const LoadOptions& options);

} // namespace flatcfg

#endif // FLATCFG_LOADER_HPP
