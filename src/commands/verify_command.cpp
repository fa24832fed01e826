// =============================================================================
// oligo-codec - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <fmt/format.h>

#include "oligo/common/logger.h"
#include "oligo/io/oligo_file.h"

namespace oligo::commands {

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    try {
        if (options_.inputPath != "-" && !std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string());
        }

        const auto reads = io::readSequences(options_.inputPath);
        auto report = pipeline::OligoDecoder(options_.codec).decode(reads);
        if (!report) {
            OLIGO_LOG_ERROR("Verification failed: {}", report.error().message());
            return report.error().exitCode();
        }

        summary_.addResult(verifyManifest(*report));
        for (auto& result : verifyChunks(*report)) {
            summary_.addResult(std::move(result));
        }
        summary_.addResult(verifyFingerprint(*report));
        if (options_.originalPath) {
            summary_.addResult(verifyAgainstOriginal(*report));
        }

        printSummary();
        return toExitCode(summary_.firstFailure());

    } catch (const OligoException& e) {
        OLIGO_LOG_ERROR("Verification failed: {}", e.what());
        return toExitCode(e.code());
    } catch (const std::exception& e) {
        OLIGO_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

VerificationResult VerifyCommand::verifyManifest(const pipeline::DecodeReport& report) const {
    VerificationResult result;
    result.checkName = "Manifest";
    // A missing manifest is tolerated: decoding falls back to the configuration
    result.passed = true;
    if (!report.manifest) {
        result.errorMessage = "not recovered, configured geometry used";
    }
    return result;
}

std::vector<VerificationResult> VerifyCommand::verifyChunks(
    const pipeline::DecodeReport& report) const {
    std::vector<VerificationResult> results;
    results.reserve(report.totalChunks);

    auto failure = report.failures.begin();
    for (std::uint32_t chunk = 0; chunk < report.totalChunks; ++chunk) {
        VerificationResult result;
        result.checkName = fmt::format("Chunk {}", chunk);
        if (failure != report.failures.end() && failure->chunkIdx == chunk) {
            result.passed = false;
            result.code = ErrorCode::kIncompleteDecode;
            result.errorMessage = fmt::format("{}: {}", errorCodeToString(failure->code),
                                              failure->message);
            if (!failure->missingSegments.empty()) {
                result.errorMessage +=
                    fmt::format(" ({} segments missing)", failure->missingSegments.size());
            }
            ++failure;
        } else {
            result.passed = true;
        }
        results.push_back(std::move(result));
    }
    return results;
}

VerificationResult VerifyCommand::verifyFingerprint(const pipeline::DecodeReport& report) const {
    VerificationResult result;
    result.checkName = "Fingerprint";
    if (report.integrityError) {
        result.passed = false;
        result.code = ErrorCode::kChecksumError;
        result.errorMessage = "reassembled bytes disagree with the manifest";
    } else {
        result.passed = true;
        if (!report.fingerprintVerified) {
            result.errorMessage = "not checked";
        }
    }
    return result;
}

VerificationResult VerifyCommand::verifyAgainstOriginal(
    const pipeline::DecodeReport& report) const {
    VerificationResult result;
    result.checkName = "Original comparison";

    if (!report.isComplete()) {
        result.passed = false;
        result.code = ErrorCode::kIncompleteDecode;
        result.errorMessage = "decode incomplete";
        return result;
    }

    const auto original = io::readBinaryFile(*options_.originalPath);
    if (original.size() != report.data.size()) {
        result.passed = false;
        result.code = ErrorCode::kChecksumError;
        result.errorMessage =
            fmt::format("size differs: {} decoded, {} original", report.data.size(),
                        original.size());
        return result;
    }

    auto mismatch = std::mismatch(original.begin(), original.end(), report.data.begin());
    if (mismatch.first != original.end()) {
        result.passed = false;
        result.code = ErrorCode::kChecksumError;
        result.errorMessage = fmt::format("first difference at byte {}",
                                          std::distance(original.begin(), mismatch.first));
        return result;
    }

    result.passed = true;
    return result;
}

void VerifyCommand::printSummary() const {
    for (const auto& result : summary_.results) {
        if (!result.passed) {
            std::cout << "[FAIL] " << result.checkName << ": " << result.errorMessage << '\n';
        } else if (options_.verbose) {
            std::cout << "[PASS] " << result.checkName;
            if (!result.errorMessage.empty()) {
                std::cout << " (" << result.errorMessage << ")";
            }
            std::cout << '\n';
        }
    }
    std::cout << fmt::format("{} of {} checks passed\n", summary_.passedChecks,
                             summary_.totalChecks);
    std::cout.flush();
}

}  // namespace oligo::commands
