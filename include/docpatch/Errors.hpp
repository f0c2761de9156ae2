/**
 * @file Errors.hpp
 * @brief Exception types for docpatch
 *
 * Error taxonomy:
 * - Error: Base class
 * - PointerError: Malformed pointer or failed resolution
 * - PatchError: An operation of a patch failed (carries kind, index, path)
 * - PatchFormatError: A patch document does not decode into operations
 * - FileNotFoundError: Input document file not found
 * - DocumentParseError: JSON/TOML syntax errors in an input document
 * - UndoFailure: Rollback of an atomic patch failed (internal defect)
 */

#ifndef DOCPATCH_ERRORS_HPP
#define DOCPATCH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace docpatch {

/**
 * @brief Base class for all docpatch exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Pointer is malformed or does not resolve in a document
 *
 * Raised by pointer parsing and resolution. The patch engine converts it
 * into a PatchError carrying the index of the failing operation.
 */
class PointerError : public Error {
public:
    /**
     * @brief Construct with pointer, failing token and reason
     * @param pointer Wire form of the pointer (e.g., "/a/b")
     * @param token The token that failed (decoded); empty if not applicable
     * @param reason Short description (e.g., "key not found")
     */
    PointerError(std::string pointer, std::string token, std::string reason)
        : Error(format_message(pointer, token, reason))
        , pointer_(std::move(pointer))
        , token_(std::move(token))
        , reason_(std::move(reason))
    {}

    /**
     * @brief Get the pointer being parsed or resolved
     */
    const std::string& pointer() const noexcept {
        return pointer_;
    }

    /**
     * @brief Get the token that failed
     */
    const std::string& token() const noexcept {
        return token_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string pointer_;
    std::string token_;
    std::string reason_;

    static std::string format_message(const std::string& pointer,
                                      const std::string& token,
                                      const std::string& reason) {
        std::ostringstream oss;
        oss << "Invalid pointer '" << pointer << "': " << reason;
        if (!token.empty()) {
            oss << " ('" << token << "')";
        }
        return oss.str();
    }
};

/**
 * @brief Category of a patch application failure
 */
enum class PatchErrorKind {
    TestFailed,             ///< 'test' operation value mismatch
    InvalidPointer,         ///< Target path malformed, missing or inapplicable
    InvalidFromPointer,     ///< 'from' path of move/copy malformed or missing
    CannotMoveInsideItself  ///< Move target is a descendant of its source
};

/**
 * @brief Get human-readable name of a PatchErrorKind
 */
inline const char* to_string(PatchErrorKind kind) noexcept {
    switch (kind) {
        case PatchErrorKind::TestFailed:             return "test failed";
        case PatchErrorKind::InvalidPointer:         return "invalid pointer";
        case PatchErrorKind::InvalidFromPointer:     return "invalid from pointer";
        case PatchErrorKind::CannotMoveInsideItself: return "cannot move the value inside itself";
    }
    return "unknown";
}

/**
 * @brief A patch operation failed
 *
 * Carries the zero-based index of the failing operation and the path it
 * was operating on, so callers can pinpoint the failure without walking
 * the patch again.
 */
class PatchError : public Error {
public:
    /**
     * @brief Construct with kind, operation index and path
     * @param kind Failure category
     * @param index Zero-based index of the failing operation
     * @param path Wire form of the operation's target path
     * @param details Optional extra context appended to the message
     */
    PatchError(PatchErrorKind kind, std::size_t index, std::string path,
               const std::string& details = "")
        : Error(format_message(kind, index, path, details))
        , kind_(kind)
        , index_(index)
        , path_(std::move(path))
    {}

    PatchErrorKind kind() const noexcept {
        return kind_;
    }

    /**
     * @brief Get the zero-based index of the failing operation
     */
    std::size_t index() const noexcept {
        return index_;
    }

    /**
     * @brief Get the target path of the failing operation
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    PatchErrorKind kind_;
    std::size_t index_;
    std::string path_;

    static std::string format_message(PatchErrorKind kind, std::size_t index,
                                      const std::string& path,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << to_string(kind) << " at operation " << index
            << " (path '" << path << "')";
        if (!details.empty()) {
            oss << ": " << details;
        }
        return oss.str();
    }
};

/**
 * @brief A patch document could not be decoded into operations
 */
class PatchFormatError : public Error {
public:
    /**
     * @brief Construct with operation index and details
     * @param index Index of the offending entry in the patch array
     * @param details What is wrong with the entry
     */
    PatchFormatError(std::size_t index, std::string details)
        : Error("Invalid patch operation " + std::to_string(index) + ": " + details)
        , index_(index)
        , details_(std::move(details))
    {}

    /**
     * @brief Patch-level failure that is not tied to one entry
     */
    explicit PatchFormatError(std::string details)
        : Error("Invalid patch: " + details)
        , index_(npos)
        , details_(std::move(details))
    {}

    /// Returned by index() when the failure is not tied to one entry
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    std::size_t index() const noexcept {
        return index_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::size_t index_;
    std::string details_;
};

/**
 * @brief Input document file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("Document file not found: " + path)
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
 * @brief Input document parse error (JSON/TOML syntax)
 */
class DocumentParseError : public Error {
public:
    /**
     * @brief Construct with source, position and error details
     * @param source File path, or "<stdin>"
     * @param line 1-based line of the error, 0 if unknown
     * @param column 1-based column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string source, int line, int column, std::string details)
        : Error(format_message(source, line, column, details))
        , source_(std::move(source))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    /**
     * @brief Get the source with the parse error
     */
    const std::string& source() const noexcept {
        return source_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& source, int line,
                                      int column, const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << source << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Rollback of an atomic patch failed
 *
 * Undo entries are derived from operations that just succeeded, so
 * re-applying them must always succeed. This signals a defect in the
 * engine, not a problem with the caller's input, so it does not derive
 * from docpatch::Error.
 */
class UndoFailure : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace docpatch

#endif // DOCPATCH_ERRORS_HPP
