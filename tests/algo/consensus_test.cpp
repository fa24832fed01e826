// =============================================================================
// oligo-codec - Replication & Consensus Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "oligo/algo/consensus.h"
#include "oligo/common/error.h"

namespace oligo::algo::test {

namespace {

Result<ConsensusResult> vote(const std::vector<std::string>& reads,
                             std::size_t minReplicates = 1) {
    std::vector<std::string_view> views(reads.begin(), reads.end());
    return buildConsensus(views, minReplicates);
}

}  // namespace

// =============================================================================
// Replication
// =============================================================================

TEST(ConsensusTest, ReplicateNumbersCopies) {
    format::OligoRecord record;
    record.prefix = "AG";
    record.payload = "ACGT";

    const auto copies = replicate(record, 3);
    ASSERT_EQ(copies.size(), 3U);
    for (std::size_t i = 0; i < copies.size(); ++i) {
        EXPECT_EQ(copies[i].replicateId, i);
        EXPECT_EQ(copies[i].sequence(), "AGACGT");
    }
    EXPECT_TRUE(replicate(record, 0).empty());
}

// =============================================================================
// Consensus
// =============================================================================

TEST(ConsensusTest, MajorityOutvotesMinority) {
    auto result = vote({"ACGTAC", "ACGTAC", "ACTTAC"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sequence, "ACGTAC");
    EXPECT_EQ(result->usableReads, 3U);
    EXPECT_EQ(result->disputedPositions, 1U);
    EXPECT_EQ(result->tiedPositions, 0U);
}

TEST(ConsensusTest, RepairsTwoSubstitutionsInOneReplicate) {
    std::string truth;
    for (std::size_t i = 0; i < 120; ++i) {
        truth.push_back(kNucleotides[(i * 7 + i / 3) % 4]);
    }
    std::string damaged = truth;
    damaged[10] = damaged[10] == 'A' ? 'C' : 'A';
    damaged[97] = damaged[97] == 'G' ? 'T' : 'G';

    auto result = vote({truth, damaged, truth});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sequence, truth);
    EXPECT_EQ(result->disputedPositions, 2U);
}

TEST(ConsensusTest, TiesGoToLowestBase) {
    auto result = vote({"AT", "GC"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sequence, "AC");
    EXPECT_EQ(result->tiedPositions, 2U);
}

TEST(ConsensusTest, NonModalLengthsAreDiscarded) {
    auto result = vote({"ACGT", "ACGT", "ACG", "ACGTA"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sequence, "ACGT");
    EXPECT_EQ(result->usableReads, 2U);
    EXPECT_EQ(result->discardedReads, 2U);
}

TEST(ConsensusTest, ModalLengthTiePrefersLonger) {
    auto result = vote({"ACG", "ACGT"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sequence, "ACGT");
}

TEST(ConsensusTest, UnknownSymbolsDoNotVote) {
    auto result = vote({"ANGT", "ACNT", "NNNN"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sequence, "ACGT");

    auto unknown = vote({"AN", "AN"});
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(unknown->sequence, "AN");
}

TEST(ConsensusTest, TooFewReplicates) {
    auto none = vote({});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code(), ErrorCode::kInsufficientReplicates);

    auto tooFew = vote({"ACGT", "ACGT"}, 3);
    ASSERT_FALSE(tooFew.has_value());
    EXPECT_EQ(tooFew.error().code(), ErrorCode::kInsufficientReplicates);

    auto enough = vote({"ACGT", "ACGT", "ACGT"}, 3);
    EXPECT_TRUE(enough.has_value());
}

// =============================================================================
// Property Tests
// =============================================================================

/// @brief A strict majority of intact copies always wins.
RC_GTEST_PROP(ConsensusProperty, StrictMajorityRecoversSequence, ()) {
    const auto truth = *rc::gen::nonEmpty(
        rc::gen::container<std::string>(rc::gen::element('A', 'C', 'G', 'T')));
    const auto intact = *rc::gen::inRange<std::size_t>(2, 8);
    const auto corrupted = *rc::gen::inRange<std::size_t>(0, intact);

    std::vector<std::string> reads(intact, truth);
    for (std::size_t i = 0; i < corrupted; ++i) {
        auto noisy = *rc::gen::container<std::string>(truth.size(),
                                                      rc::gen::element('A', 'C', 'G', 'T'));
        reads.push_back(std::move(noisy));
    }

    auto result = vote(reads);
    RC_ASSERT(result.has_value());
    RC_ASSERT(result->sequence == truth);
    RC_ASSERT(result->usableReads == reads.size());
}

}  // namespace oligo::algo::test
