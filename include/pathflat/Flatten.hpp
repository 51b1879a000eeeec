/**
 * @file Flatten.hpp
 * @brief Flatten a tree value into a map of slash-paths to leaf values
 *
 * The result is shaped for multi-path updates in path-addressed stores
 * (e.g. Firebase Realtime Database), which accept a flat map of absolute
 * paths to leaf values.
 *
 * Rules:
 * - Object members produce `<path>/<key>`, array elements `<path>/<index>`
 * - Only scalars and nulls appear as values; empty containers produce nothing
 * - With include_null_and_empty=false, null leaves and strings that are empty
 *   or whitespace-only are omitted (absent, not present with a null value)
 * - Trailing '/' is stripped from the root; a leading '/' is never added
 * - A leaf or null input produces a single entry keyed by the trimmed root
 *
 * Examples:
 * ```cpp
 * Value v = {{"name", "John"}, {"age", 30}};
 * flatten(v);                  // {"/age": 30, "/name": "John"}
 * flatten(v, "/users/42");     // {"/users/42/age": 30, "/users/42/name": "John"}
 * flatten(nullptr, true, "/x/"); // {"/x": null}
 * ```
 */

#ifndef PATHFLAT_FLATTEN_HPP
#define PATHFLAT_FLATTEN_HPP

#include "pathflat/Value.hpp"
#include "pathflat/Path.hpp"
#include "pathflat/Errors.hpp"

#include <functional>
#include <string>
#include <typeinfo>

namespace pathflat {

/**
 * @brief Options controlling a flatten call
 */
struct FlattenOptions {
    /// Keep null leaves and empty/whitespace strings
    bool include_null_and_empty = true;
    /// Prefix of every produced path; trailing '/' is trimmed
    std::string root = "/";
    /// Handling of empty keys and keys containing '/'
    KeyPolicy key_policy = KeyPolicy::Reject;
};

/**
 * @brief Receives one (path, leaf) pair per emitted entry
 */
using LeafCallback = std::function<void(const std::string& path, const Value& leaf)>;

/**
 * @brief Walk a tree and report every retained leaf in traversal order
 *
 * Traversal is depth-first in declared order (object members as stored,
 * array elements by ascending index) and uses an explicit stack, so input
 * depth is not limited by the call stack.
 *
 * @param tree Tree to walk
 * @param options Inclusion policy, root prefix and key policy
 * @param on_leaf Called once per retained leaf
 * @throws InvalidKeyError if a key is rejected by options.key_policy
 */
void for_each_leaf(const Value& tree, const FlattenOptions& options,
                   const LeafCallback& on_leaf);

/**
 * @brief Flatten a tree with explicit options
 *
 * Under KeyPolicy::Verbatim, colliding paths keep the last value visited.
 *
 * @throws InvalidKeyError if a key is rejected by options.key_policy
 */
FlatMap flatten(const Value& value, const FlattenOptions& options);

/**
 * @brief Flatten a tree (fully general form)
 *
 * @param value Tree to flatten
 * @param include_null_and_empty Keep null and empty/whitespace string leaves
 * @param root Path prefix, e.g. "/users". Trailing '/' is trimmed and no
 *             leading '/' is inserted.
 */
FlatMap flatten(const Value& value, bool include_null_and_empty, const std::string& root);

/// Flatten with nulls/empties included and root "/".
FlatMap flatten(const Value& value);

/// Flatten under @p root with nulls/empties included.
FlatMap flatten(const Value& value, const std::string& root);

/// Flatten under @p root with nulls/empties included.
/// Keeps string literals from converting to the bool overload.
FlatMap flatten(const Value& value, const char* root);

/// Flatten with root "/".
FlatMap flatten(const Value& value, bool include_null_and_empty);

/**
 * @brief Human-readable name of a native type, e.g. "shop::Customer"
 *
 * Demangles on compilers with the Itanium ABI; elsewhere the
 * implementation's own name is returned.
 */
std::string readable_type_name(const std::type_info& type);

/**
 * @brief Convert a native value into the generic tree
 *
 * Uses nlohmann's serializer (`to_json` found by ADL, standard containers,
 * scalars). A serializer exception becomes SerializationFailure naming the
 * native type.
 *
 * @throws SerializationFailure if conversion fails
 */
template <typename T>
Value to_tree(const T& value) {
    try {
        return Value(value);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationFailure(readable_type_name(typeid(T)), e.what());
    }
}

// Native-value overloads: serialize first, then flatten the tree.

template <typename T>
FlatMap flatten(const T& value, const FlattenOptions& options) {
    return flatten(to_tree(value), options);
}

template <typename T>
FlatMap flatten(const T& value, bool include_null_and_empty, const std::string& root) {
    return flatten(to_tree(value), include_null_and_empty, root);
}

template <typename T>
FlatMap flatten(const T& value) {
    return flatten(to_tree(value));
}

template <typename T>
FlatMap flatten(const T& value, const std::string& root) {
    return flatten(to_tree(value), root);
}

template <typename T>
FlatMap flatten(const T& value, const char* root) {
    return flatten(to_tree(value), root);
}

template <typename T>
FlatMap flatten(const T& value, bool include_null_and_empty) {
    return flatten(to_tree(value), include_null_and_empty);
}

/**
 * @brief Build the JSON body of a multi-path update
 *
 * Members are sorted by path, the same order as FlatMap.
 *
 * @param flat Result of flatten()
 * @return Object with one member per path
 */
nlohmann::json to_update_object(const FlatMap& flat);

} // namespace pathflat

#endif // PATHFLAT_FLATTEN_HPP
