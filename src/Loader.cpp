/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * JSON is parsed with nlohmann::ordered_json so that member order in the
 * file is the order in which paths are visited. TOML is parsed with toml++
 * and converted node by node.
 */

#include "pathflat/Loader.hpp"
#include "pathflat/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace pathflat {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DocumentNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
std::string to_text(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

/**
 * @brief Convert toml++ node to Value.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(to_text(node.as_date()->get()));

        case toml::node_type::time:
            return Value(to_text(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(to_text(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Value parse_json_text(const std::string& text, const std::string& source_name) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        // nlohmann reports the byte offset; line and column are in what()
        throw DocumentParseError(source_name, 0, 0, e.what());
    }
}

Value parse_toml_text(const std::string& text, const std::string& source_name) {
    try {
        toml::table table = toml::parse(text, source_name);
        return toml_node_to_value(table);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            source_name,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

} // anonymous namespace

// ============================================================================
// File loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw DocumentNotFoundError(path);
    }
    return parse_json_text(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw DocumentNotFoundError(path);
    }
    return parse_toml_text(read_file(path), path);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

DocumentFormat format_of(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return DocumentFormat::Json;
    }
    if (ext == ".toml") {
        return DocumentFormat::Toml;
    }
    throw UnsupportedFormatError(path, ext);
}

Value load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw DocumentNotFoundError(path);
    }

    if (format_of(path) == DocumentFormat::Toml) {
        return load_toml_file(path);
    }
    return load_json_file(path);
}

Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& source_name) {
    if (format == DocumentFormat::Toml) {
        return parse_toml_text(text, source_name);
    }
    return parse_json_text(text, source_name);
}

} // namespace pathflat
