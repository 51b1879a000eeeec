/**
 * @file Flatten.cpp
 * @brief Implementation of tree flattening
 */

#include "pathflat/Flatten.hpp"
#include <cstdlib>
#include <memory>
#include <vector>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace pathflat {

namespace {
    enum class Edge {
        Root,
        Member,
        Element
    };

    /**
     * @brief Pending node on the traversal stack
     *
     * The path is kept in one shared buffer. A frame records the length of
     * its parent's path; when it is popped the buffer is cut back to that
     * length and the frame's own segment is appended. Frames are pushed in
     * reverse order, so every node between a parent and this frame is a
     * descendant of the parent and the prefix is still intact.
     */
    struct Frame {
        const Value* node;
        size_t parent_len;
        Edge edge;
        const std::string* key;
        size_t index;
    };
}

std::string readable_type_name(const std::type_info& type) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return type.name();
}

void for_each_leaf(const Value& tree, const FlattenOptions& options,
                   const LeafCallback& on_leaf) {
    std::string path = trim_root(options.root);
    std::vector<Frame> stack;
    stack.push_back({&tree, path.size(), Edge::Root, nullptr, 0});

    while (!stack.empty()) {
        const Frame frame = stack.back();
        stack.pop_back();

        path.resize(frame.parent_len);
        if (frame.edge == Edge::Member) {
            const std::string segment = check_key(path, *frame.key, options.key_policy);
            path += '/';
            path += segment;
        } else if (frame.edge == Edge::Element) {
            path += '/';
            path += std::to_string(frame.index);
        }

        const Value& node = *frame.node;

        if (is_container(node)) {
            if (node.is_object()) {
                for (auto it = node.rbegin(); it != node.rend(); ++it) {
                    stack.push_back({&it.value(), path.size(), Edge::Member, &it.key(), 0});
                }
            } else {
                for (size_t i = node.size(); i-- > 0;) {
                    stack.push_back({&node[i], path.size(), Edge::Element, nullptr, i});
                }
            }
            continue;
        }

        if (!options.include_null_and_empty) {
            if (node.is_null()) {
                continue;
            }
            if (node.is_string() && is_blank(node.get_ref<const std::string&>())) {
                continue;
            }
        }

        on_leaf(path, node);
    }
}

FlatMap flatten(const Value& value, const FlattenOptions& options) {
    FlatMap result;
    for_each_leaf(value, options, [&result](const std::string& path, const Value& leaf) {
        result[path] = leaf;
    });
    return result;
}

FlatMap flatten(const Value& value, bool include_null_and_empty, const std::string& root) {
    FlattenOptions options;
    options.include_null_and_empty = include_null_and_empty;
    options.root = root;
    return flatten(value, options);
}

FlatMap flatten(const Value& value) {
    return flatten(value, true, "/");
}

FlatMap flatten(const Value& value, const std::string& root) {
    return flatten(value, true, root);
}

FlatMap flatten(const Value& value, const char* root) {
    return flatten(value, true, std::string(root));
}

FlatMap flatten(const Value& value, bool include_null_and_empty) {
    return flatten(value, include_null_and_empty, "/");
}

nlohmann::json to_update_object(const FlatMap& flat) {
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [path, leaf] : flat) {
        body[path] = leaf;
    }
    return body;
}

} // namespace pathflat
