// =============================================================================
// oligo-codec - Codec Configuration & Chunking Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <string>
#include <vector>

#include "oligo/algo/checksum.h"
#include "oligo/algo/reed_solomon.h"
#include "oligo/common/error.h"
#include "oligo/pipeline/chunker.h"
#include "oligo/pipeline/codec_config.h"

namespace oligo::pipeline::test {

// =============================================================================
// CodecConfig
// =============================================================================

TEST(CodecConfigTest, DefaultsAreValid) {
    const CodecConfig config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_GE(config.effectiveThreads(), 1U);
}

TEST(CodecConfigTest, RejectsFecBudgetAboveCodeword) {
    CodecConfig config;
    config.chunkSize = 250;
    config.errorCorrectionSymbols = 10;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kConfigurationInvalid);

    config.errorCorrectionSymbols = 1;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(CodecConfigTest, RejectsZeroParameters) {
    CodecConfig config;
    config.chunkSize = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = CodecConfig{};
    config.redundancy = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = CodecConfig{};
    config.headerRedundancy = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = CodecConfig{};
    config.segmentNt = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = CodecConfig{};
    config.constraints.gcMin = 0.9;
    config.constraints.gcMax = 0.1;
    EXPECT_FALSE(config.validate().has_value());
}

TEST(CodecConfigTest, RejectsTooManySegmentsPerChunk) {
    CodecConfig config;
    config.chunkSize = 200;
    // 204 message bytes map to 1240 nt, one segment per nucleotide
    config.segmentNt = 1;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCapacityExceeded);
}

TEST(CodecConfigTest, CapacityLimit) {
    CodecConfig config;
    config.chunkSize = 1;
    EXPECT_TRUE(config.validateCapacity(kMaxTotalChunks).has_value());

    auto result = config.validateCapacity(std::uint64_t{kMaxTotalChunks} + 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCapacityExceeded);
}

TEST(CodecConfigTest, DerivedGeometry) {
    CodecConfig config;
    EXPECT_EQ(config.totalChunksFor(0), 1U);
    EXPECT_EQ(config.totalChunksFor(100), 1U);
    EXPECT_EQ(config.totalChunksFor(101), 2U);

    // 104 bytes -> 640 nt -> 6 segments of 106 or 107 nt
    EXPECT_EQ(config.dataSegmentsFor(100), 6U);
    // 10 parity bytes -> 76 nt -> 1 segment
    EXPECT_EQ(config.paritySegments(), 1U);

    config.errorCorrectionSymbols = 0;
    EXPECT_EQ(config.paritySegments(), 0U);

    EXPECT_EQ(algo::segmentCount(0, 120), 0U);
    EXPECT_EQ(algo::segmentCount(120, 120), 1U);
    EXPECT_EQ(algo::segmentCount(121, 120), 2U);
}

// =============================================================================
// Chunking
// =============================================================================

TEST(ChunkerTest, SplitsWithoutPadding) {
    std::vector<std::uint8_t> data(250);
    std::iota(data.begin(), data.end(), std::uint8_t{0});

    const auto chunks = splitIntoChunks(data, 100);
    ASSERT_EQ(chunks.size(), 3U);
    EXPECT_EQ(chunks[0].payload.size(), 100U);
    EXPECT_EQ(chunks[2].payload.size(), 50U);
    EXPECT_EQ(chunks[2].chunkIdx, 2U);
    EXPECT_EQ(chunks[2].totalChunks, 3U);
    EXPECT_EQ(chunks[1].payload.front(), 100);
}

TEST(ChunkerTest, EmptyInputIsOneEmptyChunk) {
    const auto chunks = splitIntoChunks({}, 100);
    ASSERT_EQ(chunks.size(), 1U);
    EXPECT_TRUE(chunks[0].payload.empty());
    EXPECT_EQ(chunks[0].totalChunks, 1U);
}

TEST(ChunkerTest, ProtectAppendsCrcAndParity) {
    const std::vector<std::uint8_t> payload = {'a', 'b', 'c'};
    const Chunk chunk{0, 1, payload};
    const algo::ReedSolomonCoder coder(6);

    auto protectedChunk = protectChunk(chunk, coder);
    ASSERT_TRUE(protectedChunk.has_value());
    ASSERT_EQ(protectedChunk->message.size(), payload.size() + kChunkCrcSize);
    EXPECT_EQ(protectedChunk->parity.size(), 6U);

    const std::uint32_t crc = algo::crc32(payload);
    EXPECT_EQ(protectedChunk->message[3], static_cast<std::uint8_t>(crc));
    EXPECT_EQ(protectedChunk->message[6], static_cast<std::uint8_t>(crc >> 24));

    auto recovered = recoverPayload(protectedChunk->message);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, payload);
}

TEST(ChunkerTest, RecoverDetectsCorruption) {
    const std::vector<std::uint8_t> payload = {1, 2, 3, 4};
    const algo::ReedSolomonCoder coder(0);
    auto protectedChunk = protectChunk(Chunk{0, 1, payload}, coder);
    ASSERT_TRUE(protectedChunk.has_value());

    auto message = protectedChunk->message;
    message[1] ^= 0xFF;
    auto recovered = recoverPayload(message);
    ASSERT_FALSE(recovered.has_value());
    EXPECT_EQ(recovered.error().code(), ErrorCode::kChecksumError);

    const std::vector<std::uint8_t> tooShort = {1, 2};
    auto truncated = recoverPayload(tooShort);
    ASSERT_FALSE(truncated.has_value());
    EXPECT_EQ(truncated.error().code(), ErrorCode::kFormatError);
}

TEST(ChunkerTest, SegmentStream) {
    const auto segments = segmentStream("ACGTACGTAC", 4);
    ASSERT_EQ(segments.size(), 3U);
    // 10 nt over three slices: 4 + 3 + 3, never a short tail
    EXPECT_EQ(segments[0], "ACGT");
    EXPECT_EQ(segments[1], "ACG");
    EXPECT_EQ(segments[2], "TAC");
    EXPECT_TRUE(segmentStream("", 4).empty());
}

}  // namespace oligo::pipeline::test
