/**
 * @file Errors.hpp
 * @brief Exception types for jptr
 *
 * Error taxonomy:
 * - PointerError: Base class
 * - TypeError: set()/remove() called on a root that is not a container
 * - IndexError: set() addresses an array with a non-index or out-of-reach segment
 * - FileNotFoundError: Document file not found
 * - DocumentParseError: JSON syntax errors
 *
 * Missing paths are never errors: get() returns nullptr and remove() is a
 * no-op.
 */

#ifndef JPTR_ERRORS_HPP
#define JPTR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace jptr {

/**
 * @brief Base class for all jptr exceptions
 */
class PointerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A mutation was asked to traverse a value that is not a container
 *
 * Raised by set() for a scalar root and by remove() for any non-container
 * root, when the pointer is not the root pointer.
 */
class TypeError : public PointerError {
public:
    /**
     * @brief Construct with pointer, expected type, and actual type
     * @param pointer Pointer being applied (e.g., "/a/b")
     * @param expected Expected type (e.g., "object or array")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string pointer, std::string expected, std::string actual)
        : PointerError("Cannot traverse into " + actual +
                       " (expected " + expected + ") at pointer '" + pointer + "'")
        , pointer_(std::move(pointer))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& pointer() const noexcept {
        return pointer_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string pointer_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Array addressed with a segment set() cannot write to
 *
 * Either the segment is neither an index nor "[]", or the index lies too far
 * past the end of the array.
 */
class IndexError : public PointerError {
public:
    /**
     * @param pointer Pointer being applied
     * @param segment The decoded segment that is not a writable array index
     * @param reason Short description of the problem
     */
    IndexError(std::string pointer, std::string segment,
               const std::string& reason = "not an array index")
        : PointerError("Invalid array index '" + segment + "' in pointer '" + pointer +
                       "': " + reason)
        , pointer_(std::move(pointer))
        , segment_(std::move(segment))
    {}

    const std::string& pointer() const noexcept {
        return pointer_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string pointer_;
    std::string segment_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public PointerError {
public:
    explicit FileNotFoundError(std::string path)
        : PointerError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON syntax)
 *
 * Line and column are 1-based; 0 means the parser did not report one.
 */
class DocumentParseError : public PointerError {
public:
    DocumentParseError(std::string file, int line, int column, std::string details)
        : PointerError(format_message(file, line, column, details))
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
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

} // namespace jptr

#endif // JPTR_ERRORS_HPP
