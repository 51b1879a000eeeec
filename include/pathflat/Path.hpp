/**
 * @file Path.hpp
 * @brief Slash-path utilities used to build flattened keys
 *
 * Paths have the form `<root><segment>(/<segment>)*`, where the root is the
 * caller's prefix with trailing slashes removed and each segment is an
 * object key or a decimal array index.
 *
 * A leading slash is never inserted: a root of "users" produces
 * root-relative paths such as "users/name". Pass "/users" for absolute
 * Firebase-style paths.
 */

#ifndef PATHFLAT_PATH_HPP
#define PATHFLAT_PATH_HPP

#include "Errors.hpp"
#include <string>
#include <vector>

namespace pathflat {

/**
 * @brief How object keys that cannot form a clean segment are handled
 *
 * A key is unclean when it is empty or contains the '/' separator.
 */
enum class KeyPolicy {
    Reject,   ///< Throw InvalidKeyError (default)
    Escape,   ///< Percent-encode '%' and '/'; empty keys still throw
    Verbatim  ///< Copy the key unchanged, even if the path becomes ambiguous
};

/**
 * @brief Remove all trailing '/' characters from a root prefix
 *
 * Examples:
 * - "/users/" → "/users"
 * - "/users" → "/users"
 * - "/" → ""
 * - "users//" → "users"
 */
std::string trim_root(const std::string& root);

/**
 * @brief Split a slash-path into segments
 *
 * Empty segments (leading, trailing, or doubled slashes) are dropped.
 *
 * Examples:
 * - "/users/0/name" → ["users", "0", "name"]
 * - "" → []
 * - "/" → []
 */
std::vector<std::string> split_path(const std::string& path);

/**
 * @brief Percent-encode the separator in a key
 *
 * '%' becomes "%25" and '/' becomes "%2F"; everything else is kept.
 */
std::string escape_segment(const std::string& key);

/**
 * @brief Reverse escape_segment
 *
 * Only "%25" and "%2F" (either case) are decoded; any other '%' sequence is
 * kept as is.
 */
std::string unescape_segment(const std::string& segment);

/**
 * @brief Apply a key policy to one object key
 *
 * @param parent Path of the object holding the key (for error messages)
 * @param key Object key
 * @param policy Policy to apply
 * @return Segment to append to parent
 * @throws InvalidKeyError if the key is empty (Reject, Escape) or contains
 *         '/' (Reject)
 */
std::string check_key(const std::string& parent, const std::string& key,
                      KeyPolicy policy);

/**
 * @brief Check whether a string is empty or only whitespace
 *
 * Whitespace is the Unicode White_Space set, decoded from UTF-8. A string
 * with invalid UTF-8 is never blank.
 */
bool is_blank(const std::string& text);

} // namespace pathflat

#endif // PATHFLAT_PATH_HPP
