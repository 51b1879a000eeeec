/**
 * @file Options.cpp
 * @brief Implementation of tool options
 */

#include "pathflat/Options.hpp"
#include "pathflat/Loader.hpp"
#include "pathflat/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace pathflat {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    void expect_type(const std::string& key, const Value& val, bool ok,
                     const std::string& expected) {
        if (!ok) {
            throw OptionsError(key, "expected " + expected + ", got " + type_name(val));
        }
    }

    void apply_table(ToolOptions& options, const Value& table) {
        auto it = table.find("root");
        if (it != table.end()) {
            expect_type("root", *it, it->is_string(), "string");
            options.flatten.root = it->get<std::string>();
        }

        it = table.find("include_null_and_empty");
        if (it != table.end()) {
            expect_type("include_null_and_empty", *it, it->is_boolean(), "boolean");
            options.flatten.include_null_and_empty = it->get<bool>();
        }

        it = table.find("key_policy");
        if (it != table.end()) {
            expect_type("key_policy", *it, it->is_string(), "string");
            options.flatten.key_policy = parse_key_policy(it->get<std::string>());
        }

        it = table.find("indent");
        if (it != table.end()) {
            expect_type("indent", *it, it->is_number_integer(), "integer");
            const bool too_large = it->is_number_unsigned() &&
                it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max());
            const auto indent = too_large ? std::int64_t{0} : it->get<std::int64_t>();
            if (too_large || indent < -1 || indent > std::numeric_limits<int>::max()) {
                throw OptionsError("indent", "must be -1 or a non-negative integer");
            }
            options.indent = static_cast<int>(indent);
        }
    }
}

KeyPolicy parse_key_policy(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "reject") return KeyPolicy::Reject;
    if (lower == "escape") return KeyPolicy::Escape;
    if (lower == "verbatim") return KeyPolicy::Verbatim;
    throw OptionsError("key_policy",
                       "unknown policy '" + name + "' (expected reject, escape or verbatim)");
}

std::string key_policy_name(KeyPolicy policy) {
    switch (policy) {
        case KeyPolicy::Reject: return "reject";
        case KeyPolicy::Escape: return "escape";
        case KeyPolicy::Verbatim: return "verbatim";
    }
    return "reject";
}

void apply_options(ToolOptions& options, const Value& config) {
    if (!config.is_object()) {
        throw OptionsError("<root>", "expected object, got " + type_name(config));
    }

    apply_table(options, config);

    auto section = config.find("flatten");
    if (section != config.end()) {
        expect_type("flatten", *section, section->is_object(), "object");
        apply_table(options, *section);
    }
}

ToolOptions load_options_file(const std::string& path, const ToolOptions& base) {
    ToolOptions options = base;
    apply_options(options, load_document(path));
    return options;
}

} // namespace pathflat
