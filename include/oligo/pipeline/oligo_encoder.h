// =============================================================================
// oligo-codec - Oligo Encoder
// =============================================================================
// Turns a byte buffer into an ordered pool of addressed, constrained,
// replicated oligos.
//
// Encode flow:
// 1. Validate configuration and capacity (before any work)
// 2. Build the file manifest and emit it as Header oligos
// 3. Per chunk, in parallel: CRC-32 + Reed-Solomon, constrained mapping of
//    the data and parity streams, segmentation, addressing, replication
// 4. Concatenate in order: manifest, then chunks by index, segments by
//    seqIdx, replicates by replicateId
//
// Any chunk failure fails the whole encode; there is no partial output.
// The result is identical for every thread count.
// =============================================================================

#ifndef OLIGO_PIPELINE_OLIGO_ENCODER_H
#define OLIGO_PIPELINE_OLIGO_ENCODER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/common/types.h"
#include "oligo/format/oligo_header.h"
#include "oligo/pipeline/codec_config.h"

namespace oligo::pipeline {

class OligoEncoderImpl;

// =============================================================================
// Source Buffer
// =============================================================================

/// @brief Immutable input bytes plus their content fingerprint.
/// @note The referenced bytes must outlive every encode call using it.
struct SourceBuffer {
    std::span<const std::uint8_t> bytes;
    Fingerprint fingerprint = 0;
};

/// @brief Wrap @p bytes and compute the xxHash64 fingerprint.
[[nodiscard]] SourceBuffer makeSourceBuffer(std::span<const std::uint8_t> bytes);

// =============================================================================
// Encode Result
// =============================================================================

struct EncodeStats {
    std::size_t manifestOligos = 0;
    std::size_t dataOligos = 0;
    std::size_t parityOligos = 0;

    /// @brief Streams that needed more than the first mapping attempt.
    std::size_t reseededStreams = 0;

    /// @brief Highest attempt index used by any stream.
    std::uint32_t maxAttempt = 0;

    /// @brief Nucleotides across all oligos, headers included.
    std::uint64_t totalNucleotides = 0;

    std::size_t threadsUsed = 0;

    [[nodiscard]] std::size_t totalOligos() const noexcept {
        return manifestOligos + dataOligos + parityOligos;
    }
};

struct EncodeResult {
    std::vector<format::OligoRecord> oligos;
    std::uint32_t totalChunks = 0;
    std::uint64_t fileSize = 0;
    Fingerprint fingerprint = 0;
    EncodeStats stats;
};

// =============================================================================
// OligoEncoder
// =============================================================================

/// @brief Encoder bound to one configuration.
///
/// Usage:
/// @code
/// OligoEncoder encoder(config);
/// auto result = encoder.encode(makeSourceBuffer(bytes));
/// if (result) {
///     io::writeFasta(path, result->oligos);
/// }
/// @endcode
class OligoEncoder {
public:
    explicit OligoEncoder(CodecConfig config = {});

    ~OligoEncoder();

    // Non-copyable, movable
    OligoEncoder(const OligoEncoder&) = delete;
    OligoEncoder& operator=(const OligoEncoder&) = delete;
    OligoEncoder(OligoEncoder&&) noexcept;
    OligoEncoder& operator=(OligoEncoder&&) noexcept;

    /// @brief Encode @p source into oligos.
    [[nodiscard]] Result<EncodeResult> encode(const SourceBuffer& source) const;

    [[nodiscard]] const CodecConfig& config() const noexcept;

private:
    std::unique_ptr<OligoEncoderImpl> impl_;
};

/// @brief One-shot convenience wrapper around OligoEncoder.
[[nodiscard]] Result<EncodeResult> encode(std::span<const std::uint8_t> bytes,
                                          const CodecConfig& config);

}  // namespace oligo::pipeline

#endif  // OLIGO_PIPELINE_OLIGO_ENCODER_H
