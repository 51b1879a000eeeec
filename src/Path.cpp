/**
 * @file Path.cpp
 * @brief Implementation of slash-path utilities
 */

#include "pathflat/Path.hpp"
#include <cstdint>

namespace pathflat {

std::string trim_root(const std::string& root) {
    auto end = root.find_last_not_of('/');
    if (end == std::string::npos) {
        return "";
    }
    return root.substr(0, end + 1);
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string escape_segment(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == '%') {
            out += "%25";
        } else if (c == '/') {
            out += "%2F";
        } else {
            out += c;
        }
    }
    return out;
}

std::string unescape_segment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size()) {
            const char hi = segment[i + 1];
            const char lo = segment[i + 2];
            if (hi == '2' && lo == '5') {
                out += '%';
                i += 2;
                continue;
            }
            if (hi == '2' && (lo == 'F' || lo == 'f')) {
                out += '/';
                i += 2;
                continue;
            }
        }
        out += segment[i];
    }
    return out;
}

std::string check_key(const std::string& parent, const std::string& key,
                      KeyPolicy policy) {
    if (policy == KeyPolicy::Verbatim) {
        return key;
    }

    if (key.empty()) {
        throw InvalidKeyError(parent, key, "empty keys cannot form a path segment");
    }

    if (policy == KeyPolicy::Escape) {
        return escape_segment(key);
    }

    if (key.find('/') != std::string::npos) {
        throw InvalidKeyError(parent, key, "key contains the path separator '/'");
    }
    return key;
}

namespace {
    /**
     * @brief Decode one UTF-8 code point starting at @p pos
     * @return false on malformed, truncated, overlong or surrogate input
     */
    bool next_code_point(const std::string& s, size_t& pos, std::uint32_t& cp) {
        const auto lead = static_cast<unsigned char>(s[pos]);
        size_t extra = 0;
        std::uint32_t min_cp = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
            min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
            min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
            min_cp = 0x10000;
        } else {
            return false;
        }

        if (pos + extra >= s.size()) {
            return false;
        }

        for (size_t i = 1; i <= extra; ++i) {
            const auto cont = static_cast<unsigned char>(s[pos + i]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }

        pos += extra + 1;
        return true;
    }

    bool is_white_space(std::uint32_t cp) {
        switch (cp) {
            case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
            case 0x20:
            case 0x85:
            case 0xA0:
            case 0x1680:
            case 0x2028: case 0x2029:
            case 0x202F:
            case 0x205F:
            case 0x3000:
                return true;
            default:
                return cp >= 0x2000 && cp <= 0x200A;
        }
    }
}

bool is_blank(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t cp = 0;
        if (!next_code_point(text, pos, cp) || !is_white_space(cp)) {
            return false;
        }
    }
    return true;
}

} // namespace pathflat
