// =============================================================================
// oligo-codec - Codec Configuration
// =============================================================================
// Tunable parameters shared by the encoder and decoder, and the stream
// geometry derived from them.
//
// Configuration is passed explicitly into every encode/decode call; there is
// no process-wide codec state.
// =============================================================================

#ifndef OLIGO_PIPELINE_CODEC_CONFIG_H
#define OLIGO_PIPELINE_CODEC_CONFIG_H

#include <cstddef>
#include <cstdint>

#include "oligo/algo/goldman_mapper.h"
#include "oligo/common/error.h"
#include "oligo/common/types.h"

namespace oligo::pipeline {

/// @brief Recommended worker count when threads == 0.
[[nodiscard]] std::size_t recommendedThreadCount() noexcept;

// =============================================================================
// CodecConfig
// =============================================================================

struct CodecConfig {
    /// @brief Payload bytes per chunk (the last chunk may be shorter).
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Physical copies of each data/parity oligo.
    std::size_t redundancy = kDefaultRedundancy;

    /// @brief Reed-Solomon parity symbols per chunk (nsym).
    std::size_t errorCorrectionSymbols = kDefaultErrorCorrectionSymbols;

    /// @brief Payload nucleotides per oligo after the 80-nt header.
    std::size_t segmentNt = kDefaultSegmentNt;

    /// @brief GC / run-length constraints for mapped streams.
    algo::ConstraintProfile constraints;

    /// @brief Physical copies of each manifest oligo.
    std::size_t headerRedundancy = kDefaultHeaderRedundancy;

    /// @brief Reads of the modal length needed to accept a segment.
    std::size_t minReplicates = kDefaultMinReplicates;

    /// @brief Worker threads (0 = TBB default concurrency).
    std::size_t threads = 0;

    /// @brief Check parameter bounds and the per-chunk FEC budget
    ///        (chunkSize + 4 + nsym <= 255).
    /// @return kConfigurationInvalid or kCapacityExceeded.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Check that @p inputSize bytes fit the header address space.
    /// @return kCapacityExceeded when totalChunks would exceed 2^24 - 1.
    [[nodiscard]] VoidResult validateCapacity(std::uint64_t inputSize) const;

    /// @brief Chunks needed for @p inputSize bytes (an empty input has one).
    [[nodiscard]] std::uint64_t totalChunksFor(std::uint64_t inputSize) const noexcept;

    /// @brief Data segments for a chunk whose payload is @p payloadSize bytes.
    [[nodiscard]] std::size_t dataSegmentsFor(std::size_t payloadSize) const noexcept {
        return algo::segmentCount(algo::mappedLength(payloadSize + kChunkCrcSize), segmentNt);
    }

    /// @brief Parity segments per chunk (0 when nsym == 0).
    [[nodiscard]] std::size_t paritySegments() const noexcept {
        return errorCorrectionSymbols == 0
                   ? 0
                   : algo::segmentCount(algo::mappedLength(errorCorrectionSymbols), segmentNt);
    }

    [[nodiscard]] std::size_t effectiveThreads() const noexcept {
        return threads > 0 ? threads : recommendedThreadCount();
    }
};

}  // namespace oligo::pipeline

#endif  // OLIGO_PIPELINE_CODEC_CONFIG_H
