// =============================================================================
// oligo-codec - Goldman Symbol Mapper
// =============================================================================
// Maps bytes to nucleotides without homopolymers:
// - Each byte becomes 6 base-3 digits (trits), least-significant first
// - Each trit selects one of the three nucleotides that differ from the
//   previous one (rotation table), so consecutive symbols never repeat
//
// Mapped stream layout (16 + 6n nucleotides for n bytes):
//   anchor (1 nt) | attempt index (5 trits) x 3 | payload (6 trits per byte)
//
// The anchor and the attempt index identify the mapping attempt; every
// payload trit depends on them, so the index is written three times and read
// back by a per-digit vote. A single substitution touches at most two
// adjacent trits, which always belong to different digits. The attempt keys a
// whitening keystream that is added to the payload trits modulo 3; attempts
// 0-3 use the identity. Encoding retries attempts until the GC and run-length
// constraints hold for the stream and for every oligo segment cut from it.
// Decoding reads the attempt back from the stream, so no side channel is
// needed.
// =============================================================================

#ifndef OLIGO_ALGO_GOLDMAN_MAPPER_H
#define OLIGO_ALGO_GOLDMAN_MAPPER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/common/types.h"

namespace oligo::algo {

// =============================================================================
// Constants
// =============================================================================

/// @brief Trits per byte (3^6 = 729 >= 256).
inline constexpr std::size_t kTritsPerByte = 6;

/// @brief Base-3 digits of the attempt index (3^5 = 243 attempts).
inline constexpr std::size_t kAttemptTrits = 5;

/// @brief Copies of the attempt index following the anchor.
inline constexpr std::size_t kAttemptCopies = 3;

/// @brief Anchor plus attempt prefix of every mapped stream.
inline constexpr std::size_t kStreamPrefixNt = 1 + kAttemptTrits * kAttemptCopies;

/// @brief Distinct attempts: 4 anchors x 27 keystreams.
inline constexpr std::uint32_t kMaxMappingAttempts = 4 * 27;

/// @brief Sentinel for an impossible (previous, current) transition.
inline constexpr std::uint8_t kInvalidTrit = 0xFF;

/// @brief Next nucleotide index for (previous nucleotide, trit).
/// A->{C,G,T}, C->{G,T,A}, G->{T,A,C}, T->{A,C,G}
inline constexpr std::array<std::array<std::uint8_t, 3>, 4> kRotationTable = {{
    {1, 2, 3},
    {2, 3, 0},
    {3, 0, 1},
    {0, 1, 2},
}};

/// @brief Trit for (previous nucleotide, current nucleotide).
inline constexpr std::array<std::array<std::uint8_t, 4>, 4> kInverseRotationTable = {{
    {kInvalidTrit, 0, 1, 2},
    {2, kInvalidTrit, 0, 1},
    {1, 2, kInvalidTrit, 0},
    {0, 1, 2, kInvalidTrit},
}};

// =============================================================================
// Constraint Profile
// =============================================================================

/// @brief Biochemical constraints a mapped stream must satisfy.
struct ConstraintProfile {
    /// @brief Minimum GC fraction (inclusive).
    double gcMin = kDefaultGcMin;

    /// @brief Maximum GC fraction (inclusive).
    double gcMax = kDefaultGcMax;

    /// @brief Longest allowed run of one nucleotide.
    std::size_t maxRunLength = kDefaultMaxRunLength;

    /// @brief Mapping attempts tried before giving up (1..108).
    std::uint32_t reseedAttempts = kDefaultReseedAttempts;

    /// @brief Check bounds.
    /// @return kConfigurationInvalid describing the first violated bound.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Mapping Results
// =============================================================================

/// @brief A constrained mapping of one byte stream.
struct MappedStream {
    std::string sequence;

    /// @brief Attempt index that satisfied the constraints.
    std::uint32_t attempt = 0;
};

/// @brief Bytes recovered from a mapped stream.
struct UnmappedStream {
    /// @brief Decoded bytes; erased positions hold 0.
    std::vector<std::uint8_t> bytes;

    /// @brief Byte indices that could not be decoded, ascending.
    std::vector<std::size_t> erasures;

    /// @brief Attempt index voted from the stream prefix.
    std::uint32_t attempt = 0;
};

// =============================================================================
// Stream Geometry
// =============================================================================

/// @brief Nucleotide length of the stream carrying @p byteCount bytes.
[[nodiscard]] constexpr std::size_t mappedLength(std::size_t byteCount) noexcept {
    return kStreamPrefixNt + kTritsPerByte * byteCount;
}

/// @brief Byte count carried by a stream of @p nucleotides, if well formed.
[[nodiscard]] constexpr std::optional<std::size_t> unmappedLength(std::size_t nucleotides) noexcept {
    if (nucleotides < kStreamPrefixNt || (nucleotides - kStreamPrefixNt) % kTritsPerByte != 0) {
        return std::nullopt;
    }
    return (nucleotides - kStreamPrefixNt) / kTritsPerByte;
}

/// @brief Oligo segments needed for a stream of @p streamNt nucleotides.
[[nodiscard]] constexpr std::size_t segmentCount(std::size_t streamNt,
                                                 std::size_t segmentNt) noexcept {
    return segmentNt == 0 ? 0 : (streamNt + segmentNt - 1) / segmentNt;
}

/// @brief Length of segment @p index of a stream cut into segmentCount()
///        slices whose lengths differ by at most one, longer slices first.
///
/// No slice is much shorter than half a segment (unless the whole stream is), so
/// every slice has room to meet the GC band.
[[nodiscard]] constexpr std::size_t segmentLength(std::size_t streamNt,
                                                  std::size_t segmentNt,
                                                  std::size_t index) noexcept {
    const std::size_t count = segmentCount(streamNt, segmentNt);
    if (index >= count) {
        return 0;
    }
    return streamNt / count + (index < streamNt % count ? 1 : 0);
}

/// @brief Start of segment @p index within the stream.
[[nodiscard]] constexpr std::size_t segmentOffset(std::size_t streamNt,
                                                  std::size_t segmentNt,
                                                  std::size_t index) noexcept {
    const std::size_t count = segmentCount(streamNt, segmentNt);
    if (count == 0) {
        return 0;
    }
    index = index < count ? index : count;
    const std::size_t extra = streamNt % count;
    return index * (streamNt / count) + (index < extra ? index : extra);
}

// =============================================================================
// Constraint Helpers
// =============================================================================

/// @brief Fraction of G/C symbols (0 for an empty sequence).
[[nodiscard]] double gcContent(std::string_view sequence) noexcept;

/// @brief Longest run of identical symbols.
[[nodiscard]] std::size_t maxRunLength(std::string_view sequence) noexcept;

[[nodiscard]] bool satisfiesConstraints(std::string_view sequence,
                                        const ConstraintProfile& profile) noexcept;

// =============================================================================
// Mapping Operations
// =============================================================================

/// @brief Map @p bytes with a given attempt, ignoring constraints.
/// @pre attempt < kMaxMappingAttempts
[[nodiscard]] std::string mapBytes(std::span<const std::uint8_t> bytes, std::uint32_t attempt);

/// @brief Map with one attempt; the sequence is returned only if it
///        satisfies @p profile.
/// @param segmentNt When non-zero, every segment the stream is cut into
///        (segmentLength()) must satisfy @p profile as well.
[[nodiscard]] std::optional<std::string> attemptMapping(std::span<const std::uint8_t> bytes,
                                                        std::uint32_t attempt,
                                                        const ConstraintProfile& profile,
                                                        std::size_t segmentNt = 0);

/// @brief Try attempts 0, 1, ... in order and return the first that satisfies
///        @p profile (per segment when @p segmentNt is non-zero).
/// @return kConstraintExhausted if no attempt within the budget succeeds.
[[nodiscard]] Result<MappedStream> encodeWithConstraints(std::span<const std::uint8_t> bytes,
                                                         const ConstraintProfile& profile,
                                                         std::size_t segmentNt = 0);

/// @brief Recover bytes from a mapped stream.
///
/// Bytes touched by non-ACGT symbols, impossible transitions or out-of-range
/// trit groups are reported as erasures.
/// @return kFormatError for a malformed length, kCorruptedData when the
///         attempt index cannot be voted from the prefix.
[[nodiscard]] Result<UnmappedStream> decodeStream(std::string_view stream);

}  // namespace oligo::algo

#endif  // OLIGO_ALGO_GOLDMAN_MAPPER_H
