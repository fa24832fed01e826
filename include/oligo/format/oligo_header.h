// =============================================================================
// oligo-codec - Oligo Header Protocol
// =============================================================================
// Fixed 80-nucleotide addressing prefix carried by every oligo.
//
// Wire Layout:
// +------+------+---------------------------------------------+---------+
// | Sync | Type |               Field bits (68)               | CRC-8   |
// | "AG" | 2 nt | chunkIdx 24 | totalChunks 24 | seq 10 | tot 10 | 8 bits |
// +------+------+---------------------------------------------+---------+
//
// - Type markers: Header "AA", Data "CC", Parity "GG"
// - Field bits are big-endian per field, one nucleotide per bit: 0 -> T, 1 -> C
// - CRC-8 (poly 0x07) covers the 68 field bits packed MSB-first into 9 bytes
//   with 4 trailing zero bits
//
// The prefix is a fixed mapping; payload constraints do not apply to it.
// =============================================================================

#ifndef OLIGO_FORMAT_OLIGO_HEADER_H
#define OLIGO_FORMAT_OLIGO_HEADER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "oligo/common/error.h"
#include "oligo/common/types.h"

namespace oligo::format {

// =============================================================================
// Wire Constants
// =============================================================================

inline constexpr std::string_view kSyncMarker = "AG";

inline constexpr std::size_t kTypeMarkerLength = 2;

/// @brief Bits in the field block (24 + 24 + 10 + 10).
inline constexpr std::size_t kHeaderFieldBits = 2 * kChunkFieldBits + 2 * kSeqFieldBits;

inline constexpr std::size_t kHeaderCrcBits = 8;

/// @brief Total header length in nucleotides.
inline constexpr std::size_t kHeaderLength =
    kSyncMarker.size() + kTypeMarkerLength + kHeaderFieldBits + kHeaderCrcBits;

static_assert(kHeaderLength == 80, "header layout must span 80 nucleotides");

inline constexpr char kBitZero = 'T';
inline constexpr char kBitOne = 'C';

/// @brief Two-symbol type marker for @p type.
[[nodiscard]] constexpr std::string_view typeMarker(OligoType type) noexcept {
    switch (type) {
        case OligoType::kHeader:
            return "AA";
        case OligoType::kData:
            return "CC";
        case OligoType::kParity:
            return "GG";
    }
    return "";
}

// =============================================================================
// OligoHeader
// =============================================================================

/// @brief Decoded addressing fields of one oligo.
struct OligoHeader {
    OligoType type = OligoType::kData;

    /// @brief Chunk this oligo belongs to (0 for manifest oligos).
    ChunkIndex chunkIdx = 0;

    /// @brief Chunks in the encoded file.
    ChunkIndex totalChunks = 1;

    /// @brief Segment position within the chunk (or manifest).
    SeqIndex seqIdx = 0;

    /// @brief Segments in the chunk (or manifest).
    SeqIndex totalSeqs = 1;

    bool operator==(const OligoHeader&) const = default;
};

/// @brief Build the 80-nt wire prefix.
/// @return kCapacityExceeded if a field does not fit its width, or an index
///         is not below its total.
[[nodiscard]] Result<std::string> buildHeader(const OligoHeader& header);

/// @brief Parse the first 80 nt of @p oligo.
/// @return kHeaderCorrupt on short input, bad sync or type marker, symbols
///         other than C/T in the bit fields, CRC mismatch, or an index not
///         below its total.
[[nodiscard]] Result<OligoHeader> parseHeader(std::string_view oligo);

// =============================================================================
// OligoRecord
// =============================================================================

/// @brief One synthesized oligo: addressing prefix plus payload segment.
struct OligoRecord {
    OligoHeader header;

    /// @brief 80-nt wire form of header.
    std::string prefix;

    /// @brief Payload segment (at most segmentNt nucleotides).
    std::string payload;

    /// @brief Copy number among identical replicates.
    std::uint32_t replicateId = 0;

    /// @brief Full oligo: prefix followed by payload.
    [[nodiscard]] std::string sequence() const { return prefix + payload; }
};

/// @brief Build a record (replicate 0) for @p payload addressed by @p header.
[[nodiscard]] Result<OligoRecord> makeRecord(const OligoHeader& header, std::string payload);

}  // namespace oligo::format

#endif  // OLIGO_FORMAT_OLIGO_HEADER_H
