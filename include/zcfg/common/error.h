// =============================================================================
// zone-config - Error Handling Framework
// =============================================================================
// Error handling for the zone-config library and the zcfg tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - ZCFGException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Parse error (malformed document, shape mismatch, bad constraint token)
// - 4: Misuse error (codec invoked on a value that has no document shape)
// - 5: Unsupported document format
// - 6: Invalid argument (e.g. marshaling a bare constraint group)
// - 7: Input file not found
// - 8: Output file exists and --force was not given
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef ZCFG_COMMON_ERROR_H
#define ZCFG_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace zcfg {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Invalid command-line arguments, missing required options, etc.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Document or constraint token could not be interpreted.
    kParseError = 3,

    /// @brief Programmer error: a codec was invoked on a value with no
    ///        document shape of its own.
    kMisuseError = 4,

    /// @brief Unsupported document format.
    kUnsupportedFormat = 5,

    /// @brief Invalid argument value.
    kInvalidArgument = 6,

    /// @brief File not found.
    kFileNotFound = 7,

    /// @brief File already exists.
    kFileExists = 8
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kParseError:
            return "parse error";
        case ErrorCode::kMisuseError:
            return "misuse error";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Provides detailed information about where and why an error occurred.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Document field being decoded (e.g. "constraints").
    std::string field;

    /// @brief Index of the offending element within a list (if applicable).
    std::optional<std::size_t> elementIndex;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the document field.
    /// @return Reference to this for method chaining.
    ErrorContext& withField(std::string name) {
        field = std::move(name);
        return *this;
    }

    /// @brief Set the element index.
    /// @return Reference to this for method chaining.
    ErrorContext& withElement(std::size_t index) {
        elementIndex = index;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all zone-config errors.
/// @note Provides error code, message, and optional context.
class ZCFGException : public std::exception {
public:
    /// @brief Construct with error code and message.
    ZCFGException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    ZCFGException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ZCFGException() override = default;

    ZCFGException(const ZCFGException&) = default;
    ZCFGException(ZCFGException&&) noexcept = default;
    ZCFGException& operator=(const ZCFGException&) = default;
    ZCFGException& operator=(ZCFGException&&) noexcept = default;

    /// @brief Get the error message including category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public ZCFGException {
public:
    explicit UsageError(std::string message)
        : ZCFGException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : ZCFGException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for parse errors (exit code 3).
/// @note Thrown for malformed documents, documents of the wrong shape, and
///       constraint tokens that are not in canonical form.
class ParseError : public ZCFGException {
public:
    /// @brief Construct with message.
    explicit ParseError(std::string message)
        : ZCFGException(ErrorCode::kParseError, std::move(message)) {}

    /// @brief Construct with message and context.
    ParseError(std::string message, ErrorContext context)
        : ZCFGException(ErrorCode::kParseError, std::move(message), std::move(context)) {}
};

/// @brief Exception for codec misuse (exit code 4).
/// @note A programmer-error guard, never a data-validation failure.
class MisuseError : public ZCFGException {
public:
    explicit MisuseError(std::string message)
        : ZCFGException(ErrorCode::kMisuseError, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
/// @note Lightweight error type for use with std::expected.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a ZCFGException.
    /// @note Context, when present, is folded into the message.
    explicit Error(const ZCFGException& ex);

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the exit code.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception class matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws ZCFGException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
/// @note Non-zcfg exceptions are reported as I/O errors.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<decltype(func())> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const ZCFGException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace zcfg

#endif  // ZCFG_COMMON_ERROR_H
