// =============================================================================
// oligo-codec - Oligo Decoder
// =============================================================================
// Rebuilds the original bytes from an unordered pool of sequenced reads.
//
// Decode flow:
// 1. Parse every read's 80-nt header; corrupt headers are dropped and counted
// 2. Group reads by (type, chunkIdx, seqIdx); totalChunks and per-chunk
//    totalSeqs are decided by majority vote
// 3. Recover the file manifest if its oligos survived; its geometry takes
//    precedence over the supplied configuration
// 4. Per chunk, in parallel: consensus per segment, missing segments as
//    erasures where their position is known, unmap, Reed-Solomon decode,
//    CRC-32 verification
// 5. Reassemble in chunk order; with a manifest, check size and fingerprint
//
// The decoder never returns a buffer that omits or corrupts a chunk: any
// failure is reported per chunk and no data is returned.
// =============================================================================

#ifndef OLIGO_PIPELINE_OLIGO_DECODER_H
#define OLIGO_PIPELINE_OLIGO_DECODER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/common/types.h"
#include "oligo/format/file_manifest.h"
#include "oligo/pipeline/codec_config.h"

namespace oligo::pipeline {

class OligoDecoderImpl;

// =============================================================================
// Decode Report
// =============================================================================

/// @brief Why one chunk could not be recovered.
struct ChunkFailure {
    ChunkIndex chunkIdx = 0;
    ErrorCode code = ErrorCode::kCorruptedData;
    std::string message;

    /// @brief Segment indices with no usable consensus.
    std::vector<SeqIndex> missingSegments;
};

struct DecodeStats {
    std::size_t readsTotal = 0;
    std::size_t corruptHeaders = 0;
    std::size_t manifestReads = 0;
    std::size_t dataReads = 0;
    std::size_t parityReads = 0;

    /// @brief Reads outside the voted address space.
    std::size_t strayReads = 0;

    /// @brief Replicates rejected by consensus for a non-modal length.
    std::size_t discardedReplicates = 0;

    std::size_t disputedPositions = 0;
    std::size_t missingSegments = 0;
    std::size_t correctedErrors = 0;
    std::size_t filledErasures = 0;
    std::size_t recoveredChunks = 0;
    std::size_t threadsUsed = 0;
};

struct DecodeReport {
    /// @brief Reassembled bytes; empty unless complete.
    std::vector<std::uint8_t> data;

    bool complete = false;

    std::uint32_t totalChunks = 0;

    /// @brief Unrecoverable chunks, ascending by index.
    std::vector<ChunkFailure> failures;

    /// @brief Manifest recovered from Header oligos, if any.
    std::optional<format::FileManifest> manifest;

    /// @brief Size and fingerprint matched the manifest.
    bool fingerprintVerified = false;

    /// @brief All chunks decoded but size or fingerprint disagreed.
    bool integrityError = false;

    DecodeStats stats;

    [[nodiscard]] bool isComplete() const noexcept { return complete; }
};

// =============================================================================
// OligoDecoder
// =============================================================================

/// @brief Decoder bound to one configuration.
///
/// The configuration supplies geometry when no manifest survives, the
/// segment length, minReplicates and the thread count.
class OligoDecoder {
public:
    explicit OligoDecoder(CodecConfig config = {});

    ~OligoDecoder();

    // Non-copyable, movable
    OligoDecoder(const OligoDecoder&) = delete;
    OligoDecoder& operator=(const OligoDecoder&) = delete;
    OligoDecoder(OligoDecoder&&) noexcept;
    OligoDecoder& operator=(OligoDecoder&&) noexcept;

    /// @brief Decode an unordered read pool.
    /// @return kConfigurationInvalid for a bad configuration,
    ///         kInsufficientReplicates when no read carries a valid header,
    ///         kIncompleteDecode when fewer data/parity reads survive than
    ///         there are chunks. Chunk-level failures are reported inside the DecodeReport.
    [[nodiscard]] Result<DecodeReport> decode(std::span<const std::string> reads) const;

    /// @brief Decode and require every chunk.
    /// @return kIncompleteDecode naming the failed chunks, or kChecksumError
    ///         when the reassembled bytes disagree with the manifest.
    [[nodiscard]] Result<std::vector<std::uint8_t>> decodeOrFail(
        std::span<const std::string> reads) const;

    [[nodiscard]] const CodecConfig& config() const noexcept;

private:
    std::unique_ptr<OligoDecoderImpl> impl_;
};

/// @brief One-shot convenience wrapper around OligoDecoder::decode.
[[nodiscard]] Result<DecodeReport> decode(std::span<const std::string> reads,
                                          const CodecConfig& config);

/// @brief Summarize failures as "chunk 3 (uncorrectable error burst), ...".
[[nodiscard]] std::string describeFailures(const std::vector<ChunkFailure>& failures,
                                           std::size_t limit = 8);

}  // namespace oligo::pipeline

#endif  // OLIGO_PIPELINE_OLIGO_DECODER_H
