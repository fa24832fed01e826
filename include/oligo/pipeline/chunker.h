// =============================================================================
// oligo-codec - Chunk Splitting and Protection
// =============================================================================
// Geometry helpers between the source buffer and mapped streams:
// - splitIntoChunks: fixed-size chunks, no padding, one empty chunk for an
//   empty input
// - protectChunk: message = payload || CRC-32 (LE), parity = RS(message)
// - recoverPayload: verify and strip the CRC-32 of a decoded message
// - segmentStream: cut a mapped stream into near-equal oligo payloads of
//   at most segmentNt nucleotides
// =============================================================================

#ifndef OLIGO_PIPELINE_CHUNKER_H
#define OLIGO_PIPELINE_CHUNKER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "oligo/algo/reed_solomon.h"
#include "oligo/common/error.h"
#include "oligo/common/types.h"

namespace oligo::pipeline {

/// @brief A view of one chunk of the source buffer.
struct Chunk {
    ChunkIndex chunkIdx = 0;
    ChunkIndex totalChunks = 1;
    std::span<const std::uint8_t> payload;
};

/// @brief A chunk with its integrity code and FEC parity.
struct ProtectedChunk {
    ChunkIndex chunkIdx = 0;

    /// @brief payload || CRC-32 (little-endian).
    std::vector<std::uint8_t> message;

    /// @brief Reed-Solomon parity over message.
    std::vector<std::uint8_t> parity;
};

/// @brief Split @p data into chunks of @p chunkSize bytes.
/// @pre chunkSize > 0 and the chunk count fits ChunkIndex.
[[nodiscard]] std::vector<Chunk> splitIntoChunks(std::span<const std::uint8_t> data,
                                                 std::size_t chunkSize);

/// @brief Append the CRC-32 and compute parity.
[[nodiscard]] Result<ProtectedChunk> protectChunk(const Chunk& chunk,
                                                  const algo::ReedSolomonCoder& coder);

/// @brief Verify the trailing CRC-32 of @p message and return the payload.
/// @return kFormatError if shorter than the CRC, kChecksumError on mismatch.
[[nodiscard]] Result<std::vector<std::uint8_t>> recoverPayload(
    std::span<const std::uint8_t> message);

/// @brief Consecutive slices of @p stream, at most @p segmentNt long and
///        differing in length by at most one (see algo::segmentLength).
[[nodiscard]] std::vector<std::string> segmentStream(std::string_view stream,
                                                     std::size_t segmentNt);

}  // namespace oligo::pipeline

#endif  // OLIGO_PIPELINE_CHUNKER_H
