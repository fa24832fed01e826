// =============================================================================
// oligo-codec - Error Handling Framework Implementation
// =============================================================================

#include "oligo/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace oligo {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (line.has_value()) {
        separate();
        oss << "line: " << *line;
    }

    if (chunkIdx.has_value()) {
        separate();
        oss << "chunk: " << *chunkIdx;
    }

    if (seqIdx.has_value()) {
        separate();
        oss << "segment: " << *seqIdx;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// OligoException Implementation
// =============================================================================

void OligoException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError / ChecksumError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return fmt::format("checksum mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kConfigurationInvalid:
        case ErrorCode::kCapacityExceeded:
            throw ConfigurationError(code_, message_);
        case ErrorCode::kConstraintExhausted:
        case ErrorCode::kHeaderCorrupt:
        case ErrorCode::kInsufficientReplicates:
        case ErrorCode::kUncorrectableErrorBurst:
        case ErrorCode::kIncompleteDecode:
        case ErrorCode::kCorruptedData:
            throw CodecError(code_, message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw OligoException(code_, message_);
}

}  // namespace oligo
