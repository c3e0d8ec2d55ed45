/**
 * @file Errors.hpp
 * @brief Error taxonomy for key-path patching
 *
 * Two layers:
 * - PatchError: error value returned (inside Result) by the parser, the
 *   reconciliation engine and the patch functions
 * - DocumentError: exception base for the file/CLI layer, plus PatchFailure
 *   which carries a PatchError when a caller asks a failed Result for its
 *   value
 */

#ifndef PATHPATCH_ERRORS_HPP
#define PATHPATCH_ERRORS_HPP

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace pathpatch {

/**
 * @brief Kinds of patch failure
 */
enum class ErrorKind {
    invalid_key_path,     ///< Bad path grammar, or path shape does not match the document
    index_out_of_bounds,  ///< Index more than one past the end of an array
    invalid_root_object,  ///< Top-level value is not an object
    encoding_failed,      ///< Record -> document encoder failed
    decoding_failed,      ///< Document -> record decoder failed
    serialization_failed  ///< Malformed JSON, unsupported value or text encoding failure
};

/**
 * @brief Get the identifier of an error kind (e.g. "invalid_key_path")
 */
const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Description of a failed patch operation
 *
 * Carries enough context to report the failure precisely: the offending
 * key path, the offending index, or the wrapped cause of a codec or
 * serialization failure.
 */
class PatchError {
public:
    /**
     * @brief The key path fails the grammar or does not fit the document
     * @param key_path Full path string as supplied by the caller
     */
    static PatchError invalid_key_path(std::string key_path);

    /**
     * @brief The index addresses more than one slot past the array end
     * @param key_path Full path string as supplied by the caller
     * @param index The offending index
     */
    static PatchError index_out_of_bounds(std::string key_path, std::size_t index);

    /// The top-level value is not an object.
    static PatchError invalid_root_object();

    /**
     * @brief Wrap a failure of the record encoder
     * @param cause Exception thrown by the encoder
     */
    static PatchError encoding_failed(std::exception_ptr cause);

    /// Encoder output that has no JSON text form.
    static PatchError encoding_failed(std::string cause);

    /**
     * @brief Wrap a failure of the record decoder
     * @param cause Exception thrown by the decoder
     */
    static PatchError decoding_failed(std::exception_ptr cause);

    /// Wrap a JSON parse/serialize failure raised as an exception.
    static PatchError serialization_failed(std::exception_ptr cause);

    /// Serialization failure detected without an exception.
    static PatchError serialization_failed(std::string cause);

    ErrorKind kind() const noexcept { return kind_; }

    /// Offending key path (empty unless the kind names a path).
    const std::string& key_path() const noexcept { return key_path_; }

    /// Offending index (only meaningful for index_out_of_bounds).
    std::size_t index() const noexcept { return index_; }

    /// Message of the underlying cause; "unknown exception" if the cause
    /// was not a std::exception, empty if there is none.
    const std::string& cause() const noexcept { return cause_; }

    /// Original exception, if the cause was thrown; may be null.
    std::exception_ptr cause_exception() const noexcept { return cause_exception_; }

    /**
     * @brief Render a human-readable description
     *
     * Examples:
     * - "The key path 'profile.age.years' is not valid."
     * - "Index 5 is out of bounds for key path 'tags[5]'."
     */
    std::string message() const;

private:
    explicit PatchError(ErrorKind kind) : kind_(kind) {}

    static std::string describe(const std::exception_ptr& cause);

    ErrorKind kind_;
    std::string key_path_;
    std::size_t index_ = 0;
    std::string cause_;
    std::exception_ptr cause_exception_;
};

// ============================================================================
// Exceptions (file and CLI layer)
// ============================================================================

/**
 * @brief Base class for all pathpatch exceptions
 */
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A failed Result was asked for its value
 */
class PatchFailure : public DocumentError {
public:
    explicit PatchFailure(PatchError error)
        : DocumentError(error.message())
        , error_(std::move(error))
    {}

    /**
     * @brief Get the error that caused the failure
     */
    const PatchError& error() const noexcept {
        return error_;
    }

private:
    PatchError error_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public DocumentError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : DocumentError("Document file not found: " + path)
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
 * @brief Document file parse error (JSON/TOML syntax)
 */
class DocumentParseError : public DocumentError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, std::string details)
        : DocumentError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief File extension is neither .json nor .toml
 */
class UnsupportedFormatError : public DocumentError {
public:
    explicit UnsupportedFormatError(std::string extension)
        : DocumentError("Unsupported document file type: '" + extension +
                        "' (expected .json or .toml)")
        , extension_(std::move(extension))
    {}

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string extension_;
};

} // namespace pathpatch

#endif // PATHPATCH_ERRORS_HPP
