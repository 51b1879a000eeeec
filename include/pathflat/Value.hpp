/**
 * @file Value.hpp
 * @brief Generic tree type consumed by the flattener
 *
 * Uses nlohmann::ordered_json as the underlying value model so that object
 * members keep the order in which the serializer produced them:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t), Unsigned (uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef PATHFLAT_VALUE_HPP
#define PATHFLAT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace pathflat {

/**
 * @brief JSON-like tree value
 *
 * Alias for nlohmann::ordered_json. Any type with a `to_json` overload
 * (found by ADL, or generated with NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE)
 * converts to it, which is how native values enter the flattener.
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Flattened result: path string -> leaf value (scalar or null)
 *
 * Enumeration order is lexicographic and carries no meaning.
 */
using FlatMap = std::map<std::string, Value>;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "unsigned",
 *         "float", "string", "array", "object", "binary")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_unsigned()) return "unsigned";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    if (val.is_binary()) return "binary";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace pathflat

#endif // PATHFLAT_VALUE_HPP
