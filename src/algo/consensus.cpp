// =============================================================================
// oligo-codec - Replication & Consensus Implementation
// =============================================================================

#include "oligo/algo/consensus.h"

#include <algorithm>
#include <map>

#include <fmt/format.h>

namespace oligo::algo {

std::vector<format::OligoRecord> replicate(const format::OligoRecord& record,
                                           std::size_t redundancy) {
    std::vector<format::OligoRecord> copies;
    copies.reserve(redundancy);
    for (std::size_t i = 0; i < redundancy; ++i) {
        format::OligoRecord copy = record;
        copy.replicateId = static_cast<std::uint32_t>(i);
        copies.push_back(std::move(copy));
    }
    return copies;
}

Result<ConsensusResult> buildConsensus(std::span<const std::string_view> reads,
                                       std::size_t minReplicates) {
    const std::size_t required = std::max<std::size_t>(1, minReplicates);

    // Modal length; std::map iterates ascending so >= prefers the longer length
    std::map<std::size_t, std::size_t> lengthHistogram;
    for (std::string_view read : reads) {
        ++lengthHistogram[read.size()];
    }
    std::size_t modalLength = 0;
    std::size_t modalCount = 0;
    for (const auto& [length, count] : lengthHistogram) {
        if (count >= modalCount) {
            modalLength = length;
            modalCount = count;
        }
    }

    if (modalCount < required) {
        return makeError<ConsensusResult>(
            ErrorCode::kInsufficientReplicates,
            fmt::format("{} usable reads of {} received, at least {} required", modalCount,
                        reads.size(), required));
    }

    std::vector<BaseCounts> counts(modalLength, BaseCounts{0, 0, 0, 0});
    for (std::string_view read : reads) {
        if (read.size() != modalLength) {
            continue;
        }
        for (std::size_t i = 0; i < modalLength; ++i) {
            const std::uint8_t idx = nucleotideIndex(read[i]);
            if (idx != kInvalidNucleotide) {
                ++counts[i][idx];
            }
        }
    }

    ConsensusResult result;
    result.usableReads = modalCount;
    result.discardedReads = reads.size() - modalCount;
    result.sequence.resize(modalLength);

    for (std::size_t i = 0; i < modalLength; ++i) {
        std::uint32_t maxCount = 0;
        std::uint8_t maxIdx = 0;
        std::size_t distinct = 0;
        std::size_t atMax = 0;

        for (std::uint8_t j = 0; j < 4; ++j) {
            const std::uint32_t count = counts[i][j];
            if (count == 0) {
                continue;
            }
            ++distinct;
            if (count > maxCount) {
                maxCount = count;
                maxIdx = j;
                atMax = 1;
            } else if (count == maxCount) {
                ++atMax;
            }
        }

        if (maxCount == 0) {
            result.sequence[i] = kUnknownNucleotide;
            continue;
        }
        result.sequence[i] = kNucleotides[maxIdx];
        if (distinct > 1) {
            ++result.disputedPositions;
        }
        if (atMax > 1) {
            ++result.tiedPositions;
        }
    }
    return result;
}

}  // namespace oligo::algo
