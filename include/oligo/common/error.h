// =============================================================================
// oligo-codec - Error Handling Framework
// =============================================================================
// Error handling shared by every codec module and the CLI.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - OligoException hierarchy for structured error handling at I/O boundaries
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, chunk, segment, line)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error
// - 3: Format error
// - 4: Checksum mismatch
// - 5-12: Codec-specific failures (see ErrorCode)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef OLIGO_COMMON_ERROR_H
#define OLIGO_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace oligo {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error (file not found, read/write failure).
    kIOError = 2,

    /// @brief Malformed input (bad stream length, bad manifest, bad symbols).
    kFormatError = 3,

    /// @brief Checksum mismatch (CRC-16 manifest, CRC-32 chunk, fingerprint).
    kChecksumError = 4,

    /// @brief Invalid codec configuration (FEC budget above 255, bad bounds).
    /// @note Always reported before any encoding work starts.
    kConfigurationInvalid = 5,

    /// @brief Input exceeds addressing capacity (chunks or segments per chunk).
    kCapacityExceeded = 6,

    /// @brief GC/run constraints not satisfied within the re-seed budget.
    kConstraintExhausted = 7,

    /// @brief Oligo header failed to parse (sync, type marker, CRC-8).
    /// @note Per-oligo and non-fatal: the oligo is dropped.
    kHeaderCorrupt = 8,

    /// @brief Not enough usable replicates to rebuild a segment.
    kInsufficientReplicates = 9,

    /// @brief Symbol errors exceed the Reed-Solomon correction bound.
    kUncorrectableErrorBurst = 10,

    /// @brief Decode finished with at least one unrecoverable chunk.
    kIncompleteDecode = 11,

    /// @brief Corrupted data that cannot be interpreted.
    kCorruptedData = 12
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum mismatch";
        case ErrorCode::kConfigurationInvalid:
            return "configuration invalid";
        case ErrorCode::kCapacityExceeded:
            return "capacity exceeded";
        case ErrorCode::kConstraintExhausted:
            return "constraint exhausted";
        case ErrorCode::kHeaderCorrupt:
            return "header corrupt";
        case ErrorCode::kInsufficientReplicates:
            return "insufficient replicates";
        case ErrorCode::kUncorrectableErrorBurst:
            return "uncorrectable error burst";
        case ErrorCode::kIncompleteDecode:
            return "incomplete decode";
        case ErrorCode::kCorruptedData:
            return "corrupted data";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Chunk index where the error occurred (if applicable).
    std::optional<std::uint32_t> chunkIdx;

    /// @brief Segment index within the chunk (if applicable).
    std::optional<std::uint32_t> seqIdx;

    /// @brief 1-based line number in a text input (if applicable).
    std::optional<std::uint64_t> line;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withChunk(std::uint32_t idx) {
        chunkIdx = idx;
        return *this;
    }

    ErrorContext& withSegment(std::uint32_t idx) {
        seqIdx = idx;
        return *this;
    }

    ErrorContext& withLine(std::uint64_t lineNumber) {
        line = lineNumber;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all oligo-codec errors.
class OligoException : public std::exception {
public:
    OligoException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    OligoException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~OligoException() override = default;

    OligoException(const OligoException&) = default;
    OligoException(OligoException&&) noexcept = default;
    OligoException& operator=(const OligoException&) = default;
    OligoException& operator=(OligoException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

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
class UsageError : public OligoException {
public:
    explicit UsageError(std::string message)
        : OligoException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : OligoException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public OligoException {
public:
    explicit IOError(std::string message)
        : OligoException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : OligoException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : OligoException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed input (exit code 3).
class FormatError : public OligoException {
public:
    explicit FormatError(std::string message)
        : OligoException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : OligoException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for checksum mismatches (exit code 4).
class ChecksumError : public OligoException {
public:
    explicit ChecksumError(std::string message)
        : OligoException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::string message, ErrorContext context)
        : OligoException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual checksum values.
    ChecksumError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : OligoException(ErrorCode::kChecksumError,
                         formatChecksumMismatch(expected, actual),
                         std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Exception for configuration and capacity errors (exit codes 5, 6).
class ConfigurationError : public OligoException {
public:
    explicit ConfigurationError(std::string message)
        : OligoException(ErrorCode::kConfigurationInvalid, std::move(message)) {}

    ConfigurationError(ErrorCode code, std::string message)
        : OligoException(code, std::move(message)) {}
};

/// @brief Exception for codec failures (constraint exhaustion, uncorrectable
///        chunks, incomplete decodes).
class CodecError : public OligoException {
public:
    CodecError(ErrorCode code, std::string message)
        : OligoException(code, std::move(message)) {}

    CodecError(ErrorCode code, std::string message, ErrorContext context)
        : OligoException(code, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an OligoException.
    explicit Error(const OligoException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws OligoException (or derived) if the result contains an error.
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

/// @brief Execute a function and convert thrown exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<decltype(func())> {
    try {
        return func();
    } catch (const OligoException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace oligo

#endif  // OLIGO_COMMON_ERROR_H
