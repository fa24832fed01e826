// =============================================================================
// oligo-codec - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codec modules.
//
// This module defines:
// - ChunkIndex, SeqIndex: addressing type aliases
// - Capacity limits of the oligo header fields
// - Nucleotide alphabet and symbol <-> index conversion
// - OligoType: Header / Data / Parity oligo classification
// - Codec defaults
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef OLIGO_COMMON_TYPES_H
#define OLIGO_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace oligo {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Chunk identifier (24 significant bits on the wire).
using ChunkIndex = std::uint32_t;

/// @brief Segment identifier within a chunk (10 significant bits on the wire).
using SeqIndex = std::uint16_t;

/// @brief Checksum / fingerprint value type (xxHash64).
using Fingerprint = std::uint64_t;

// =============================================================================
// Capacity Limits
// =============================================================================

/// @brief Width of the chunk index / total chunks header fields.
inline constexpr unsigned kChunkFieldBits = 24;

/// @brief Width of the segment index / total segments header fields.
inline constexpr unsigned kSeqFieldBits = 10;

/// @brief Largest encodable total chunk count.
inline constexpr std::uint32_t kMaxTotalChunks = (1U << kChunkFieldBits) - 1;

/// @brief Largest encodable total segment count per chunk.
inline constexpr std::uint32_t kMaxTotalSeqs = (1U << kSeqFieldBits) - 1;

/// @brief Reed-Solomon codeword length limit over GF(256).
inline constexpr std::size_t kMaxCodewordLength = 255;

/// @brief Size of the chunk-level integrity code (CRC-32) appended before FEC.
inline constexpr std::size_t kChunkCrcSize = 4;

// =============================================================================
// Codec Defaults
// =============================================================================

inline constexpr std::size_t kDefaultChunkSize = 100;
inline constexpr std::size_t kDefaultRedundancy = 3;
inline constexpr std::size_t kDefaultErrorCorrectionSymbols = 10;
inline constexpr std::size_t kDefaultSegmentNt = 120;
inline constexpr std::size_t kDefaultHeaderRedundancy = 2 * kDefaultRedundancy;
inline constexpr std::size_t kDefaultMinReplicates = 1;
inline constexpr double kDefaultGcMin = 0.40;
inline constexpr double kDefaultGcMax = 0.60;
inline constexpr std::size_t kDefaultMaxRunLength = 3;
inline constexpr std::uint32_t kDefaultReseedAttempts = 32;

// =============================================================================
// Nucleotide Alphabet
// =============================================================================

/// @brief Index to nucleotide symbol (A=0, C=1, G=2, T=3).
inline constexpr std::array<char, 4> kNucleotides = {'A', 'C', 'G', 'T'};

/// @brief Sentinel returned by nucleotideIndex() for non-ACGT symbols.
inline constexpr std::uint8_t kInvalidNucleotide = 0xFF;

/// @brief Symbol emitted where no nucleotide could be determined.
inline constexpr char kUnknownNucleotide = 'N';

/// @brief Convert a nucleotide symbol to its index (case-insensitive).
[[nodiscard]] constexpr std::uint8_t nucleotideIndex(char c) noexcept {
    switch (c) {
        case 'A':
        case 'a':
            return 0;
        case 'C':
        case 'c':
            return 1;
        case 'G':
        case 'g':
            return 2;
        case 'T':
        case 't':
            return 3;
        default:
            return kInvalidNucleotide;
    }
}

/// @brief True for G and C.
[[nodiscard]] constexpr bool isGcNucleotide(char c) noexcept {
    return c == 'G' || c == 'C' || c == 'g' || c == 'c';
}

// =============================================================================
// Oligo Type Enumeration
// =============================================================================

/// @brief Role of an oligo, carried in its 2-symbol type marker.
enum class OligoType : std::uint8_t {
    /// @brief File manifest oligo ("AA").
    kHeader = 0,

    /// @brief Systematic chunk data: payload plus CRC-32 ("CC").
    kData = 1,

    /// @brief Reed-Solomon parity symbols of a chunk ("GG").
    kParity = 2
};

[[nodiscard]] constexpr std::string_view oligoTypeToString(OligoType type) noexcept {
    switch (type) {
        case OligoType::kHeader:
            return "header";
        case OligoType::kData:
            return "data";
        case OligoType::kParity:
            return "parity";
    }
    return "unknown";
}

/// @brief Single-letter label used in FASTA record names (H, D, P).
[[nodiscard]] constexpr char oligoTypeLetter(OligoType type) noexcept {
    switch (type) {
        case OligoType::kHeader:
            return 'H';
        case OligoType::kData:
            return 'D';
        case OligoType::kParity:
            return 'P';
    }
    return '?';
}

}  // namespace oligo

#endif  // OLIGO_COMMON_TYPES_H
