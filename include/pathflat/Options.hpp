/**
 * @file Options.hpp
 * @brief Options for the pathflat tool, read from a config tree or file
 *
 * Precedence (lowest to highest):
 * 1. Built-in defaults (ToolOptions{})
 * 2. Options file (JSON or TOML)
 * 3. Command-line flags (applied by the caller)
 *
 * Recognised keys, at the top level or inside a "flatten" table (the table
 * wins when both are present):
 * - root                   (string)
 * - include_null_and_empty (boolean)
 * - key_policy             ("reject" | "escape" | "verbatim", any case)
 * - indent                 (integer, -1 for compact output)
 *
 * Unknown keys are ignored.
 *
 * Example TOML:
 * ```toml
 * [flatten]
 * root = "/users"
 * include_null_and_empty = false
 * key_policy = "escape"
 * ```
 */

#ifndef PATHFLAT_OPTIONS_HPP
#define PATHFLAT_OPTIONS_HPP

#include "pathflat/Flatten.hpp"
#include "pathflat/Value.hpp"
#include <string>

namespace pathflat {

/**
 * @brief Everything the command-line tool needs for one run
 */
struct ToolOptions {
    FlattenOptions flatten;
    int indent = 2;
};

/**
 * @brief Parse a key policy name (case-insensitive)
 * @throws OptionsError for unknown names
 */
KeyPolicy parse_key_policy(const std::string& name);

/**
 * @brief Lowercase name of a key policy ("reject", "escape", "verbatim")
 */
std::string key_policy_name(KeyPolicy policy);

/**
 * @brief Overlay options found in a config tree onto @p options
 *
 * @param options Options to update in place
 * @param config Config tree, must be an object
 * @throws OptionsError if config is not an object, or a recognised key has
 *         the wrong type or an invalid value
 */
void apply_options(ToolOptions& options, const Value& config);

/**
 * @brief Load an options file on top of @p base
 *
 * @param path JSON or TOML file
 * @param base Options to start from
 * @return base with the file's options applied
 * @throws DocumentNotFoundError, DocumentParseError, UnsupportedFormatError
 *         from loading, OptionsError from apply_options
 */
ToolOptions load_options_file(const std::string& path, const ToolOptions& base = ToolOptions{});

} // namespace pathflat

#endif // PATHFLAT_OPTIONS_HPP
