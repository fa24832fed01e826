// =============================================================================
// oligo-codec - Verify Command
// =============================================================================
// Command handler for checking that an oligo pool decodes, without writing
// output.
//
// This module provides:
// - VerifyCommand: Decode in memory and report per-chunk status
// - Optional byte-for-byte comparison against the original file
// =============================================================================

#ifndef OLIGO_COMMANDS_VERIFY_COMMAND_H
#define OLIGO_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/pipeline/codec_config.h"
#include "oligo/pipeline/oligo_decoder.h"

namespace oligo::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    std::string checkName;

    bool passed = false;

    /// @brief Error message (if failed).
    std::string errorMessage;

    /// @brief Error code reported when the check failed.
    ErrorCode code = ErrorCode::kSuccess;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }

    /// @brief Exit code of the first failed check (kSuccess if none).
    [[nodiscard]] ErrorCode firstFailure() const noexcept {
        for (const auto& result : results) {
            if (!result.passed) {
                return result.code;
            }
        }
        return ErrorCode::kSuccess;
    }
};

// =============================================================================
// Verify Options
// =============================================================================

struct VerifyOptions {
    /// @brief Input reads (FASTA or one sequence per line).
    std::filesystem::path inputPath;

    /// @brief Original file to compare the decoded bytes against.
    std::optional<std::filesystem::path> originalPath;

    pipeline::CodecConfig codec;

    /// @brief Print every check, not just failures.
    bool verbose = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = every check passed).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] VerificationResult verifyManifest(const pipeline::DecodeReport& report) const;

    [[nodiscard]] std::vector<VerificationResult> verifyChunks(
        const pipeline::DecodeReport& report) const;

    [[nodiscard]] VerificationResult verifyFingerprint(const pipeline::DecodeReport& report) const;

    [[nodiscard]] VerificationResult verifyAgainstOriginal(
        const pipeline::DecodeReport& report) const;

    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

}  // namespace oligo::commands

#endif  // OLIGO_COMMANDS_VERIFY_COMMAND_H
