// =============================================================================
// oligo-codec - Replication & Consensus
// =============================================================================
// Physical redundancy on the write side and majority voting on the read side.
//
// Consensus rules:
// - Only reads of the modal length vote (ties: the longer length wins)
// - Per position, plurality over A/C/G/T; ties go to the lowest rank
//   A < C < G < T
// - A position where no read carries a valid nucleotide yields 'N'
// =============================================================================

#ifndef OLIGO_ALGO_CONSENSUS_H
#define OLIGO_ALGO_CONSENSUS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/format/oligo_header.h"

namespace oligo::algo {

// =============================================================================
// Replication
// =============================================================================

/// @brief Copies of @p record with replicateId 0 .. redundancy - 1.
[[nodiscard]] std::vector<format::OligoRecord> replicate(const format::OligoRecord& record,
                                                         std::size_t redundancy);

// =============================================================================
// Consensus
// =============================================================================

/// @brief Per-position nucleotide tallies (index A=0, C=1, G=2, T=3).
using BaseCounts = std::array<std::uint32_t, 4>;

/// @brief Consensus of one replicate group.
struct ConsensusResult {
    /// @brief Majority sequence; 'N' where nothing could be voted.
    std::string sequence;

    /// @brief Reads of the modal length that voted.
    std::size_t usableReads = 0;

    /// @brief Reads rejected for a non-modal length.
    std::size_t discardedReads = 0;

    /// @brief Positions where voters disagreed.
    std::size_t disputedPositions = 0;

    /// @brief Positions decided by the rank tie-break.
    std::size_t tiedPositions = 0;
};

/// @brief Majority-vote @p reads into one sequence.
/// @return kInsufficientReplicates if fewer than max(1, minReplicates) reads
///         share the modal length.
[[nodiscard]] Result<ConsensusResult> buildConsensus(std::span<const std::string_view> reads,
                                                     std::size_t minReplicates);

}  // namespace oligo::algo

#endif  // OLIGO_ALGO_CONSENSUS_H
