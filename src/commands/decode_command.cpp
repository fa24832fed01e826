// =============================================================================
// oligo-codec - Decode Command Implementation
// =============================================================================

#include "decode_command.h"

#include <chrono>
#include <filesystem>
#include <iostream>

#include <fmt/format.h>

#include "oligo/common/logger.h"
#include "oligo/io/oligo_file.h"

namespace oligo::commands {

DecodeCommand::DecodeCommand(DecodeOptions options) : options_(std::move(options)) {}

DecodeCommand::~DecodeCommand() = default;

DecodeCommand::DecodeCommand(DecodeCommand&&) noexcept = default;
DecodeCommand& DecodeCommand::operator=(DecodeCommand&&) noexcept = default;

int DecodeCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();

        const auto reads = io::readSequences(options_.inputPath);

        pipeline::OligoDecoder decoder(options_.codec);
        auto report = decoder.decode(reads);
        if (!report) {
            OLIGO_LOG_ERROR("Decoding failed: {}", report.error().message());
            return report.error().exitCode();
        }

        if (report->integrityError) {
            OLIGO_LOG_ERROR("Decoded data does not match the manifest fingerprint");
            return toExitCode(ErrorCode::kChecksumError);
        }
        if (!report->isComplete()) {
            for (const auto& failure : report->failures) {
                OLIGO_LOG_ERROR("  chunk {}: {} ({})", failure.chunkIdx,
                                errorCodeToString(failure.code), failure.message);
            }
            OLIGO_LOG_ERROR("Decode incomplete: {} of {} chunks unrecoverable, no output written",
                            report->failures.size(), report->totalChunks);
            return toExitCode(ErrorCode::kIncompleteDecode);
        }

        io::writeBinaryFile(options_.outputPath, report->data);

        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        OLIGO_LOG_INFO("Decoded {} bytes from {} reads in {:.2f}s", report->data.size(),
                       report->stats.readsTotal, elapsed);

        if (options_.showSummary && options_.outputPath != "-") {
            printSummary(*report);
        }
        return 0;

    } catch (const OligoException& e) {
        OLIGO_LOG_ERROR("Decoding failed: {}", e.what());
        return toExitCode(e.code());
    } catch (const std::exception& e) {
        OLIGO_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void DecodeCommand::validateOptions() const {
    if (options_.inputPath != "-" && !std::filesystem::exists(options_.inputPath)) {
        throw IOError("Input file not found: " + options_.inputPath.string());
    }
    if (options_.outputPath != "-" && !options_.forceOverwrite &&
        std::filesystem::exists(options_.outputPath)) {
        throw IOError("Output file already exists: " + options_.outputPath.string() +
                      " (use -f to overwrite)");
    }
    if (auto valid = options_.codec.validate(); !valid) {
        valid.error().throwException();
    }
    OLIGO_LOG_DEBUG("Decode options validated (min replicates {})", options_.codec.minReplicates);
}

void DecodeCommand::printSummary(const pipeline::DecodeReport& report) const {
    const auto& stats = report.stats;
    std::cout << fmt::format("Output:       {} ({} bytes)\n", options_.outputPath.string(),
                             report.data.size());
    std::cout << fmt::format("Reads:        {} ({} corrupt headers)\n", stats.readsTotal,
                             stats.corruptHeaders);
    std::cout << fmt::format("Chunks:       {}\n", report.totalChunks);
    std::cout << fmt::format("Corrected:    {} errors, {} erasures\n", stats.correctedErrors,
                             stats.filledErasures);
    std::cout << fmt::format("Manifest:     {}\n",
                             report.manifest ? (report.fingerprintVerified ? "verified" : "present")
                                             : "missing");
}

}  // namespace oligo::commands
