// =============================================================================
// oligo-codec - Chunk Splitting and Protection Implementation
// =============================================================================

#include "oligo/pipeline/chunker.h"

#include <algorithm>

#include <fmt/format.h>

#include "oligo/algo/checksum.h"
#include "oligo/algo/goldman_mapper.h"

namespace oligo::pipeline {

std::vector<Chunk> splitIntoChunks(std::span<const std::uint8_t> data, std::size_t chunkSize) {
    std::vector<Chunk> chunks;
    if (data.empty()) {
        chunks.push_back(Chunk{0, 1, data});
        return chunks;
    }

    const std::size_t total = (data.size() + chunkSize - 1) / chunkSize;
    chunks.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        const std::size_t offset = i * chunkSize;
        const std::size_t length = std::min(chunkSize, data.size() - offset);
        chunks.push_back(Chunk{static_cast<ChunkIndex>(i), static_cast<ChunkIndex>(total),
                               data.subspan(offset, length)});
    }
    return chunks;
}

Result<ProtectedChunk> protectChunk(const Chunk& chunk, const algo::ReedSolomonCoder& coder) {
    ProtectedChunk result;
    result.chunkIdx = chunk.chunkIdx;
    result.message.reserve(chunk.payload.size() + kChunkCrcSize);
    result.message.assign(chunk.payload.begin(), chunk.payload.end());

    const std::uint32_t crc = algo::crc32(chunk.payload);
    for (std::size_t i = 0; i < kChunkCrcSize; ++i) {
        result.message.push_back(static_cast<std::uint8_t>(crc >> (8 * i)));
    }

    auto parity = coder.computeParity(result.message);
    if (!parity) {
        return makeError<ProtectedChunk>(parity.error());
    }
    result.parity = std::move(*parity);
    return result;
}

Result<std::vector<std::uint8_t>> recoverPayload(std::span<const std::uint8_t> message) {
    if (message.size() < kChunkCrcSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kFormatError,
            fmt::format("chunk message of {} bytes is shorter than its CRC", message.size()));
    }

    const auto payload = message.first(message.size() - kChunkCrcSize);
    std::uint32_t stored = 0;
    for (std::size_t i = 0; i < kChunkCrcSize; ++i) {
        stored |= static_cast<std::uint32_t>(message[payload.size() + i]) << (8 * i);
    }
    const std::uint32_t computed = algo::crc32(payload);
    if (stored != computed) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kChecksumError,
            fmt::format("chunk CRC-32 mismatch: stored 0x{:08x}, computed 0x{:08x}", stored,
                        computed));
    }
    return std::vector<std::uint8_t>(payload.begin(), payload.end());
}

std::vector<std::string> segmentStream(std::string_view stream, std::size_t segmentNt) {
    const std::size_t count = algo::segmentCount(stream.size(), segmentNt);
    std::vector<std::string> segments;
    segments.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        segments.emplace_back(stream.substr(algo::segmentOffset(stream.size(), segmentNt, i),
                                            algo::segmentLength(stream.size(), segmentNt, i)));
    }
    return segments;
}

}  // namespace oligo::pipeline
