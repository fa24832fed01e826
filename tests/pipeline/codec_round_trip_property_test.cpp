// =============================================================================
// oligo-codec - Encode/Decode Round-Trip Property Tests
// =============================================================================
// End-to-end tests over the encoder and decoder.
//
// *For any* input and valid configuration, decoding the shuffled oligo pool
// returns the original bytes, including after replicate noise, lost manifest
// oligos, lost segments and byte errors within the Reed-Solomon bound. Every
// emitted payload meets the constraint profile on its own.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "oligo/algo/goldman_mapper.h"
#include "oligo/common/error.h"
#include "oligo/format/oligo_header.h"
#include "oligo/pipeline/oligo_decoder.h"
#include "oligo/pipeline/oligo_encoder.h"

namespace oligo::pipeline::test {

namespace {

std::vector<std::string> sequencesOf(const std::vector<format::OligoRecord>& oligos) {
    std::vector<std::string> reads;
    reads.reserve(oligos.size());
    for (const auto& oligo : oligos) {
        reads.push_back(oligo.sequence());
    }
    return reads;
}

std::vector<std::uint8_t> patternBytes(std::size_t size, std::uint32_t seed = 7) {
    std::vector<std::uint8_t> bytes(size);
    std::mt19937 rng(seed);
    for (auto& b : bytes) {
        b = static_cast<std::uint8_t>(rng());
    }
    return bytes;
}

/// @brief A different nucleotide than @p c.
char substitute(char c, unsigned shift = 1) {
    const std::uint8_t idx = nucleotideIndex(c);
    return kNucleotides[(idx + 1 + shift % 3) % 4];
}

/// @brief A nucleotide differing from @p c and from both neighbours.
char substituteBetween(char prev, char c, char next) {
    for (char base : kNucleotides) {
        if (base != prev && base != c && base != next) {
            return base;
        }
    }
    return substitute(c);
}

/// @brief Change data-stream byte @p byteIdx of @p chunk in every replicate.
///
/// Nucleotide 16 + 6j + 2 carries the third trit of byte j; rewriting it
/// disturbs only that trit and the one after it, both inside byte j.
/// @p messageBytes is the chunk payload plus its CRC.
void corruptDataByte(std::vector<format::OligoRecord>& oligos,
                     ChunkIndex chunk,
                     std::size_t byteIdx,
                     std::size_t messageBytes,
                     std::size_t segmentNt) {
    const std::size_t streamNt = algo::mappedLength(messageBytes);
    const std::size_t q = algo::kStreamPrefixNt + 6 * byteIdx + 2;
    SeqIndex seq = 0;
    while (algo::segmentOffset(streamNt, segmentNt, seq + 1) <= q) {
        ++seq;
    }
    const std::size_t offset = q - algo::segmentOffset(streamNt, segmentNt, seq);
    for (auto& oligo : oligos) {
        if (oligo.header.type == OligoType::kData && oligo.header.chunkIdx == chunk &&
            oligo.header.seqIdx == seq) {
            oligo.payload[offset] = substitute(oligo.payload[offset]);
        }
    }
}

template <typename Pred>
void dropOligos(std::vector<format::OligoRecord>& oligos, Pred pred) {
    oligos.erase(std::remove_if(oligos.begin(), oligos.end(), pred), oligos.end());
}

}  // namespace

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<std::vector<std::uint8_t>> fileBytes(std::size_t maxSize = 600) {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, maxSize + 1), [](std::size_t size) {
        return rc::gen::container<std::vector<std::uint8_t>>(size,
                                                             rc::gen::arbitrary<std::uint8_t>());
    });
}

/// @brief A valid configuration with small chunks so inputs span several.
[[nodiscard]] rc::Gen<CodecConfig> codecConfig() {
    return rc::gen::apply(
        [](std::size_t chunkSize, std::size_t nsym, std::size_t segmentNt, std::size_t redundancy) {
            CodecConfig config;
            config.chunkSize = chunkSize;
            config.errorCorrectionSymbols = nsym;
            config.segmentNt = segmentNt;
            config.redundancy = redundancy;
            config.threads = 2;
            return config;
        },
        rc::gen::inRange<std::size_t>(1, 121),
        rc::gen::inRange<std::size_t>(2, 33),
        rc::gen::inRange<std::size_t>(60, 201),
        rc::gen::inRange<std::size_t>(1, 4));
}

}  // namespace gen

// =============================================================================
// Scenarios
// =============================================================================

TEST(CodecRoundTripTest, ThreeByteBuffer) {
    const std::vector<std::uint8_t> bytes = {0x01, 0x02, 0x03};
    CodecConfig config;
    config.chunkSize = 3;
    config.redundancy = 3;
    config.errorCorrectionSymbols = 4;
    config.segmentNt = 120;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->totalChunks, 1U);
    EXPECT_EQ(encoded->stats.dataOligos, 3U);
    EXPECT_EQ(encoded->stats.parityOligos, 3U);
    EXPECT_GT(encoded->stats.manifestOligos, 0U);

    for (const auto& oligo : encoded->oligos) {
        if (oligo.header.type == OligoType::kData) {
            EXPECT_EQ(oligo.header.seqIdx, 0U);
            EXPECT_EQ(oligo.header.totalSeqs, 2U);
        }
    }

    const auto reads = sequencesOf(encoded->oligos);
    auto decoded = OligoDecoder(config).decodeOrFail(reads);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
    EXPECT_EQ(*decoded, bytes);
}

TEST(CodecRoundTripTest, EmptyInput) {
    const std::vector<std::uint8_t> bytes;
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->totalChunks, 1U);

    auto report = decode(sequencesOf(encoded->oligos), config);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->isComplete());
    EXPECT_TRUE(report->fingerprintVerified);
    EXPECT_TRUE(report->data.empty());
}

TEST(CodecRoundTripTest, ManifestLossFallsBackToConfiguration) {
    const auto bytes = patternBytes(730);
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    dropOligos(encoded->oligos, [](const format::OligoRecord& oligo) {
        return oligo.header.type == OligoType::kHeader;
    });

    auto report = decode(sequencesOf(encoded->oligos), config);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->manifest.has_value());
    EXPECT_FALSE(report->fingerprintVerified);
    ASSERT_TRUE(report->isComplete()) << describeFailures(report->failures);
    EXPECT_EQ(report->data, bytes);
}

TEST(CodecRoundTripTest, ManifestOverridesConfiguredGeometry) {
    const auto bytes = patternBytes(300);
    CodecConfig encodeConfig;
    encodeConfig.chunkSize = 64;
    encodeConfig.errorCorrectionSymbols = 16;

    auto encoded = encode(bytes, encodeConfig);
    ASSERT_TRUE(encoded.has_value());

    // Same segment length, different chunk geometry
    const CodecConfig decodeConfig;
    auto report = decode(sequencesOf(encoded->oligos), decodeConfig);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->manifest.has_value());
    EXPECT_EQ(report->manifest->chunkSize, 64U);
    EXPECT_TRUE(report->fingerprintVerified);
    EXPECT_EQ(report->data, bytes);
}

TEST(CodecRoundTripTest, MinorityReplicateCorruption) {
    const auto bytes = patternBytes(450, 11);
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());

    std::mt19937 rng(3);
    for (auto& oligo : encoded->oligos) {
        if (oligo.replicateId != 0 || oligo.payload.empty()) {
            continue;
        }
        for (int i = 0; i < 5; ++i) {
            const std::size_t pos = rng() % oligo.payload.size();
            oligo.payload[pos] = substitute(oligo.payload[pos], static_cast<unsigned>(rng()));
        }
    }

    auto report = decode(sequencesOf(encoded->oligos), config);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->isComplete()) << describeFailures(report->failures);
    EXPECT_EQ(report->data, bytes);
    EXPECT_GT(report->stats.disputedPositions, 0U);
    EXPECT_EQ(report->stats.correctedErrors, 0U);
}

TEST(CodecRoundTripTest, CorruptHeadersAreDropped) {
    const auto bytes = patternBytes(200);
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());

    auto reads = sequencesOf(encoded->oligos);
    std::size_t mangled = 0;
    for (std::size_t i = 0; i < reads.size(); i += 3) {
        reads[i][0] = 'T';
        ++mangled;
    }

    auto report = decode(reads, config);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->stats.corruptHeaders, mangled);
    ASSERT_TRUE(report->isComplete()) << describeFailures(report->failures);
    EXPECT_EQ(report->data, bytes);
}

TEST(CodecRoundTripTest, LostParityIsTolerated) {
    const auto bytes = patternBytes(250);
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    dropOligos(encoded->oligos, [](const format::OligoRecord& oligo) {
        return oligo.header.type == OligoType::kParity;
    });

    auto report = decode(sequencesOf(encoded->oligos), config);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->isComplete()) << describeFailures(report->failures);
    EXPECT_EQ(report->data, bytes);
    EXPECT_EQ(report->stats.filledErasures, 3 * config.errorCorrectionSymbols);
}

TEST(CodecRoundTripTest, MissingMiddleSegmentBecomesErasures) {
    const auto bytes = patternBytes(100);
    CodecConfig config;
    config.chunkSize = 50;
    config.errorCorrectionSymbols = 20;
    // 54 message bytes -> 340 nt -> 6 segments of 56 or 57 nt
    config.segmentNt = 60;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    dropOligos(encoded->oligos, [](const format::OligoRecord& oligo) {
        return oligo.header.type == OligoType::kData && oligo.header.chunkIdx == 0 &&
               oligo.header.seqIdx == 2;
    });

    auto report = decode(sequencesOf(encoded->oligos), config);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->isComplete()) << describeFailures(report->failures);
    EXPECT_EQ(report->data, bytes);
    EXPECT_EQ(report->stats.missingSegments, 1U);
    EXPECT_GT(report->stats.filledErasures, 0U);
}

TEST(CodecRoundTripTest, CorrectsByteErrorsUpToHalfParity) {
    const auto bytes = patternBytes(180, 5);
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());

    // Chunk 1 holds 80 bytes plus the CRC
    const std::size_t k = config.errorCorrectionSymbols / 2;
    for (std::size_t j = 0; j < k; ++j) {
        corruptDataByte(encoded->oligos, 1, j * 9, 80 + kChunkCrcSize, config.segmentNt);
    }

    auto report = decode(sequencesOf(encoded->oligos), config);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->isComplete()) << describeFailures(report->failures);
    EXPECT_EQ(report->data, bytes);
    EXPECT_GT(report->stats.correctedErrors + report->stats.filledErasures, 0U);
}

TEST(CodecRoundTripTest, IncompleteDecodeListsChunks) {
    const auto bytes = patternBytes(300);
    const CodecConfig config;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    ASSERT_EQ(encoded->totalChunks, 3U);
    dropOligos(encoded->oligos, [](const format::OligoRecord& oligo) {
        return oligo.header.type != OligoType::kHeader && oligo.header.chunkIdx == 1;
    });
    const auto reads = sequencesOf(encoded->oligos);

    const OligoDecoder decoder(config);
    auto report = decoder.decode(reads);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->isComplete());
    EXPECT_TRUE(report->data.empty());
    ASSERT_EQ(report->failures.size(), 1U);
    EXPECT_EQ(report->failures[0].chunkIdx, 1U);
    EXPECT_EQ(report->failures[0].code, ErrorCode::kInsufficientReplicates);
    EXPECT_EQ(report->stats.recoveredChunks, 2U);

    auto strict = decoder.decodeOrFail(reads);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code(), ErrorCode::kIncompleteDecode);
    EXPECT_NE(strict.error().message().find("chunk 1"), std::string::npos);
}

TEST(CodecRoundTripTest, EmittedOligosMeetConstraints) {
    const auto bytes = patternBytes(1000, 23);
    CodecConfig config;
    config.segmentNt = 64;

    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    for (const auto& oligo : encoded->oligos) {
        EXPECT_LE(oligo.payload.size(), config.segmentNt);
        EXPECT_TRUE(algo::satisfiesConstraints(oligo.payload, config.constraints))
            << "chunk " << oligo.header.chunkIdx << " seq " << oligo.header.seqIdx << ": "
            << oligo.payload;
    }
}

TEST(CodecRoundTripTest, StreamPrefixSubstitutionInEveryReplicate) {
    const auto bytes = patternBytes(150, 29);
    const CodecConfig config;

    // Anchor, first attempt copy, second attempt copy
    for (std::size_t pos : {std::size_t{0}, std::size_t{2}, std::size_t{10}}) {
        auto encoded = encode(bytes, config);
        ASSERT_TRUE(encoded.has_value());
        for (auto& oligo : encoded->oligos) {
            if (oligo.header.type != OligoType::kData || oligo.header.chunkIdx != 0 ||
                oligo.header.seqIdx != 0) {
                continue;
            }
            const char prev = pos == 0 ? 'N' : oligo.payload[pos - 1];
            oligo.payload[pos] =
                substituteBetween(prev, oligo.payload[pos], oligo.payload[pos + 1]);
        }

        auto report = decode(sequencesOf(encoded->oligos), config);
        ASSERT_TRUE(report.has_value());
        ASSERT_TRUE(report->isComplete()) << "position " << pos << ": "
                                          << describeFailures(report->failures);
        EXPECT_EQ(report->data, bytes);
    }
}

TEST(CodecRoundTripTest, StrayChunkCountIsBounded) {
    format::OligoHeader header;
    header.type = OligoType::kData;
    header.totalChunks = kMaxTotalChunks;
    auto stray = format::makeRecord(header, "ACGTACGTACGTACGTACGTAC");
    ASSERT_TRUE(stray.has_value());

    const std::vector<std::string> lone = {stray->sequence()};
    auto report = decode(lone, CodecConfig{});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kIncompleteDecode);

    // Outvoted by a real pool
    const auto bytes = patternBytes(120);
    const CodecConfig config;
    auto encoded = encode(bytes, config);
    ASSERT_TRUE(encoded.has_value());
    auto reads = sequencesOf(encoded->oligos);
    reads.push_back(stray->sequence());

    auto recovered = decode(reads, config);
    ASSERT_TRUE(recovered.has_value());
    ASSERT_TRUE(recovered->isComplete()) << describeFailures(recovered->failures);
    EXPECT_EQ(recovered->data, bytes);
}

TEST(CodecRoundTripTest, NoValidReads) {
    const std::vector<std::string> reads = {"ACGTACGT", std::string(100, 'A')};
    auto report = decode(reads, CodecConfig{});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kInsufficientReplicates);
}

TEST(CodecRoundTripTest, ThreadCountDoesNotChangeOutput) {
    const auto bytes = patternBytes(2000, 19);
    CodecConfig single;
    single.threads = 1;
    CodecConfig parallel;
    parallel.threads = 4;

    auto first = encode(bytes, single);
    auto second = encode(bytes, parallel);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(sequencesOf(first->oligos), sequencesOf(second->oligos));

    const auto reads = sequencesOf(first->oligos);
    auto decodedSingle = OligoDecoder(single).decodeOrFail(reads);
    auto decodedParallel = OligoDecoder(parallel).decodeOrFail(reads);
    ASSERT_TRUE(decodedSingle.has_value());
    ASSERT_TRUE(decodedParallel.has_value());
    EXPECT_EQ(*decodedSingle, *decodedParallel);
    EXPECT_EQ(*decodedSingle, bytes);
}

TEST(CodecRoundTripTest, EncodeRejectsInvalidConfiguration) {
    const auto bytes = patternBytes(10);
    CodecConfig config;
    config.chunkSize = 245;
    config.errorCorrectionSymbols = 10;

    auto encoded = encode(bytes, config);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code(), ErrorCode::kConfigurationInvalid);
}

TEST(CodecRoundTripTest, EncodeReportsConstraintExhaustion) {
    const auto bytes = patternBytes(40);
    CodecConfig config;
    config.constraints.gcMin = 0.95;
    config.constraints.gcMax = 1.0;

    auto encoded = encode(bytes, config);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code(), ErrorCode::kConstraintExhausted);
}

// =============================================================================
// Property Tests
// =============================================================================

/// @brief Any input survives encode, shuffle and decode.
RC_GTEST_PROP(CodecRoundTripProperty, ShuffledPoolDecodes, ()) {
    const auto bytes = *gen::fileBytes();
    const auto config = *gen::codecConfig();
    RC_PRE(config.validate().has_value());

    auto encoded = encode(bytes, config);
    RC_ASSERT(encoded.has_value());
    for (const auto& oligo : encoded->oligos) {
        RC_ASSERT(oligo.payload.size() <= config.segmentNt);
        RC_ASSERT(algo::satisfiesConstraints(oligo.payload, config.constraints));
    }

    auto reads = sequencesOf(encoded->oligos);
    std::mt19937 rng(*rc::gen::arbitrary<std::uint32_t>());
    std::shuffle(reads.begin(), reads.end(), rng);

    auto report = decode(reads, config);
    RC_ASSERT(report.has_value());
    RC_ASSERT(report->isComplete());
    RC_ASSERT(report->fingerprintVerified);
    RC_ASSERT(report->data == bytes);
}

/// @brief Up to floor(nsym / 2) corrupted bytes per chunk are corrected.
RC_GTEST_PROP(CodecRoundTripProperty, CorrectsErrorsWithinBound, ()) {
    const auto bytes = *gen::fileBytes(300);
    RC_PRE(!bytes.empty());
    const auto config = *gen::codecConfig();
    RC_PRE(config.validate().has_value());

    auto encoded = encode(bytes, config);
    RC_ASSERT(encoded.has_value());

    const auto chunk = *rc::gen::inRange<ChunkIndex>(0, encoded->totalChunks);
    const std::size_t payload =
        std::min(config.chunkSize, bytes.size() - static_cast<std::size_t>(chunk) * config.chunkSize);
    const std::size_t messageBytes = payload + kChunkCrcSize;
    const auto k = *rc::gen::inRange<std::size_t>(0, config.errorCorrectionSymbols / 2 + 1);
    const auto positions = *rc::gen::uniqueCount<std::vector<std::size_t>>(
        std::min(k, messageBytes), rc::gen::inRange<std::size_t>(0, messageBytes));
    for (std::size_t byteIdx : positions) {
        corruptDataByte(encoded->oligos, chunk, byteIdx, messageBytes, config.segmentNt);
    }

    auto report = decode(sequencesOf(encoded->oligos), config);
    RC_ASSERT(report.has_value());
    RC_ASSERT(report->isComplete());
    RC_ASSERT(report->data == bytes);
}

}  // namespace oligo::pipeline::test
