// =============================================================================
// oligo-codec - Codec Configuration Implementation
// =============================================================================

#include "oligo/pipeline/codec_config.h"

#include <algorithm>
#include <limits>
#include <thread>

#include <fmt/format.h>

#include "oligo/format/file_manifest.h"

namespace oligo::pipeline {

std::size_t recommendedThreadCount() noexcept {
    auto hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 4;
    }
    return std::min(hwThreads, 32u);
}

VoidResult CodecConfig::validate() const {
    if (chunkSize == 0 || chunkSize > std::numeric_limits<std::uint16_t>::max()) {
        return makeVoidError(ErrorCode::kConfigurationInvalid,
                             fmt::format("chunk size {} outside [1, {}]", chunkSize,
                                         std::numeric_limits<std::uint16_t>::max()));
    }
    if (chunkSize + kChunkCrcSize + errorCorrectionSymbols > kMaxCodewordLength) {
        return makeVoidError(
            ErrorCode::kConfigurationInvalid,
            fmt::format("chunk size {} + {} CRC bytes + {} parity symbols exceeds the {}-symbol "
                        "Reed-Solomon codeword",
                        chunkSize, kChunkCrcSize, errorCorrectionSymbols, kMaxCodewordLength));
    }
    if (redundancy == 0) {
        return makeVoidError(ErrorCode::kConfigurationInvalid, "redundancy must be at least 1");
    }
    if (headerRedundancy == 0) {
        return makeVoidError(ErrorCode::kConfigurationInvalid,
                             "header redundancy must be at least 1");
    }
    if (segmentNt == 0) {
        return makeVoidError(ErrorCode::kConfigurationInvalid,
                             "segment length must be at least 1 nucleotide");
    }
    if (auto result = constraints.validate(); !result) {
        return result;
    }

    const std::size_t chunkSeqs = dataSegmentsFor(chunkSize) + paritySegments();
    if (chunkSeqs > kMaxTotalSeqs) {
        return makeVoidError(
            ErrorCode::kCapacityExceeded,
            fmt::format("{} segments per chunk exceed the limit of {}; raise the segment length",
                        chunkSeqs, kMaxTotalSeqs));
    }
    const std::size_t manifestSeqs =
        algo::segmentCount(algo::mappedLength(format::kManifestSize), segmentNt);
    if (manifestSeqs > kMaxTotalSeqs) {
        return makeVoidError(ErrorCode::kCapacityExceeded,
                             fmt::format("{} manifest segments exceed the limit of {}",
                                         manifestSeqs, kMaxTotalSeqs));
    }
    return makeVoidSuccess();
}

VoidResult CodecConfig::validateCapacity(std::uint64_t inputSize) const {
    const std::uint64_t chunks = totalChunksFor(inputSize);
    if (chunks > kMaxTotalChunks) {
        return makeVoidError(
            ErrorCode::kCapacityExceeded,
            fmt::format("{} bytes need {} chunks of {} bytes, more than the {} addressable",
                        inputSize, chunks, chunkSize, kMaxTotalChunks));
    }
    return makeVoidSuccess();
}

std::uint64_t CodecConfig::totalChunksFor(std::uint64_t inputSize) const noexcept {
    if (inputSize == 0 || chunkSize == 0) {
        return 1;
    }
    return (inputSize + chunkSize - 1) / chunkSize;
}

}  // namespace oligo::pipeline
