/**
 * @file Errors.hpp
 * @brief Exception types raised around the merge engine
 *
 * Merging itself never fails. These errors come from the layer that turns
 * files and wire values into mergeable form:
 * - DeepMergeError: Base class
 * - FileNotFoundError: Document file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: Unknown document extension or unrepresentable value
 * - InvalidValueError: Scalar wire value could not be decoded
 */

#ifndef DEEPMERGE_ERRORS_HPP
#define DEEPMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace deepmerge {

/**
 * @brief Base class for all deepmerge exceptions
 */
class DeepMergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public DeepMergeError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : DeepMergeError("Document not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
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
class DocumentParseError : public DeepMergeError {
public:
    DocumentParseError(std::string file, int line, int column, std::string details)
        : DeepMergeError(format_message(file, line, column, details))
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

    /**
     * @brief Get detailed error message from the parser
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) +
                   ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Document format cannot be handled
 *
 * Raised for unknown file extensions and for values a format cannot
 * represent (e.g., a non-object root written as TOML).
 */
class UnsupportedFormatError : public DeepMergeError {
public:
    UnsupportedFormatError(std::string path, std::string reason)
        : DeepMergeError("Unsupported document format for '" + path + "': " + reason)
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string path_;
    std::string reason_;
};

/**
 * @brief Wire representation of a scalar could not be decoded
 */
class InvalidValueError : public DeepMergeError {
public:
    /**
     * @brief Construct with target type and error details
     * @param type Scalar type being decoded (e.g., "ByteString")
     * @param details What was wrong with the input
     */
    InvalidValueError(std::string type, std::string details)
        : DeepMergeError("Invalid " + type + " value: " + details)
        , type_(std::move(type))
        , details_(std::move(details))
    {}

    const std::string& type() const noexcept {
        return type_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string type_;
    std::string details_;
};

} // namespace deepmerge

#endif // DEEPMERGE_ERRORS_HPP
