/**
 * @file Errors.hpp
 * @brief Exception types for pathflat
 *
 * Error taxonomy:
 * - FlattenError: Base class
 * - SerializationFailure: Input value not convertible to the generic tree
 * - InvalidKeyError: Object key rejected by the key policy
 * - DocumentNotFoundError: Input/options file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: File extension is neither .json nor .toml
 * - OptionsError: Invalid value in an options tree
 */

#ifndef PATHFLAT_ERRORS_HPP
#define PATHFLAT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <sstream>
#include <utility>

namespace pathflat {

/**
 * @brief Base class for all pathflat exceptions
 */
class FlattenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The input value could not be converted to the generic tree
 *
 * Raised before traversal starts, so no partial result exists.
 */
class SerializationFailure : public FlattenError {
public:
    /**
     * @brief Construct with the native type and serializer message
     * @param type Name of the native type being converted
     * @param details Message reported by the serializer
     */
    SerializationFailure(std::string type, std::string details)
        : FlattenError("Cannot serialize value of type '" + type + "': " + details)
        , type_(std::move(type))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the name of the native type that failed to convert
     */
    const std::string& type() const noexcept {
        return type_;
    }

    /**
     * @brief Get the serializer's error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string type_;
    std::string details_;
};

/**
 * @brief Object key cannot be used as a path segment
 *
 * Raised for empty keys, and for keys containing '/' under
 * KeyPolicy::Reject.
 */
class InvalidKeyError : public FlattenError {
public:
    /**
     * @brief Construct with parent path, offending key, and reason
     * @param path Path of the object holding the key (e.g., "/users")
     * @param key The offending key (e.g., "a/b")
     * @param reason Why the key was rejected
     */
    InvalidKeyError(std::string path, std::string key, std::string reason)
        : FlattenError("Invalid key '" + key + "' under path '" + path + "': " + reason)
        , path_(std::move(path))
        , key_(std::move(key))
    {}

    /**
     * @brief Get the path of the object holding the key
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the offending key
     */
    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string path_;
    std::string key_;
};

/**
 * @brief Document file not found
 */
class DocumentNotFoundError : public FlattenError {
public:
    explicit DocumentNotFoundError(std::string path)
        : FlattenError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 *
 * Line and column are 1-based; 0 means the parser did not report a position.
 */
class DocumentParseError : public FlattenError {
public:
    /**
     * @brief Construct with file, position, and error details
     * @param file Path to the file (or "<stdin>") with the parse error
     * @param line Line of the error, 0 if unknown
     * @param column Column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : FlattenError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief File extension does not name a supported document format
 */
class UnsupportedFormatError : public FlattenError {
public:
    UnsupportedFormatError(std::string path, std::string extension)
        : FlattenError("Unsupported file type '" + extension + "' for '" + path +
                       "' (expected .json or .toml)")
        , path_(std::move(path))
        , extension_(std::move(extension))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string path_;
    std::string extension_;
};

/**
 * @brief Option present with an invalid type or value
 */
class OptionsError : public FlattenError {
public:
    /**
     * @brief Construct with option key and details
     * @param key Name of the offending option (e.g., "key_policy")
     * @param details What was wrong with it
     */
    OptionsError(std::string key, std::string details)
        : FlattenError("Invalid option '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

} // namespace pathflat

#endif // PATHFLAT_ERRORS_HPP
