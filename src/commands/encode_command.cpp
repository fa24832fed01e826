// =============================================================================
// oligo-codec - Encode Command Implementation
// =============================================================================

#include "encode_command.h"

#include <chrono>
#include <filesystem>
#include <iostream>

#include <fmt/format.h>

#include "oligo/common/logger.h"
#include "oligo/io/oligo_file.h"

namespace oligo::commands {

EncodeCommand::EncodeCommand(EncodeOptions options) : options_(std::move(options)) {}

EncodeCommand::~EncodeCommand() = default;

EncodeCommand::EncodeCommand(EncodeCommand&&) noexcept = default;
EncodeCommand& EncodeCommand::operator=(EncodeCommand&&) noexcept = default;

int EncodeCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();

        const auto bytes = io::readBinaryFile(options_.inputPath);
        OLIGO_LOG_DEBUG("Read {} bytes from {}", bytes.size(), options_.inputPath.string());

        pipeline::OligoEncoder encoder(options_.codec);
        auto result = encoder.encode(pipeline::makeSourceBuffer(bytes));
        if (!result) {
            OLIGO_LOG_ERROR("Encoding failed: {}", result.error().message());
            return result.error().exitCode();
        }

        io::writeFasta(options_.outputPath, result->oligos);
        stats_ = result->stats;

        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        OLIGO_LOG_INFO("Encoded {} bytes into {} oligos in {:.2f}s", result->fileSize,
                       result->stats.totalOligos(), elapsed);

        if (options_.showSummary && options_.outputPath != "-") {
            printSummary(*result);
        }
        return 0;

    } catch (const OligoException& e) {
        OLIGO_LOG_ERROR("Encoding failed: {}", e.what());
        return toExitCode(e.code());
    } catch (const std::exception& e) {
        OLIGO_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void EncodeCommand::validateOptions() const {
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

    OLIGO_LOG_DEBUG("Encode options validated");
    OLIGO_LOG_DEBUG("  Chunk size: {} bytes, parity: {} symbols", options_.codec.chunkSize,
                    options_.codec.errorCorrectionSymbols);
    OLIGO_LOG_DEBUG("  Segment: {} nt, redundancy: {} (manifest {})", options_.codec.segmentNt,
                    options_.codec.redundancy, options_.codec.headerRedundancy);
    OLIGO_LOG_DEBUG("  GC: [{}, {}], max run: {}, attempts: {}", options_.codec.constraints.gcMin,
                    options_.codec.constraints.gcMax, options_.codec.constraints.maxRunLength,
                    options_.codec.constraints.reseedAttempts);
}

void EncodeCommand::printSummary(const pipeline::EncodeResult& result) const {
    const auto& stats = result.stats;
    std::cout << fmt::format("Input:        {} ({} bytes)\n", options_.inputPath.string(),
                             result.fileSize);
    std::cout << fmt::format("Output:       {}\n", options_.outputPath.string());
    std::cout << fmt::format("Chunks:       {}\n", result.totalChunks);
    std::cout << fmt::format("Oligos:       {} (manifest {}, data {}, parity {})\n",
                             stats.totalOligos(), stats.manifestOligos, stats.dataOligos,
                             stats.parityOligos);
    std::cout << fmt::format("Nucleotides:  {}\n", stats.totalNucleotides);
    std::cout << fmt::format("Re-seeded:    {} streams (highest attempt {})\n",
                             stats.reseededStreams, stats.maxAttempt);
    std::cout << fmt::format("Fingerprint:  0x{:016x}\n", result.fingerprint);
}

}  // namespace oligo::commands
