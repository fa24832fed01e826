// =============================================================================
// oligo-codec - File Manifest Tests
// =============================================================================

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/format/file_manifest.h"

namespace oligo::format::test {

namespace {

FileManifest sampleManifest() {
    FileManifest manifest;
    manifest.fileSize = 1234;
    manifest.chunkSize = 100;
    manifest.nsym = 10;
    manifest.fingerprint = 0x0123456789ABCDEFULL;
    return manifest;
}

}  // namespace

TEST(FileManifestTest, SerializedLayoutIsLittleEndian) {
    const auto bytes = sampleManifest().serialize();
    ASSERT_EQ(bytes.size(), kManifestSize);

    EXPECT_EQ(bytes[0], 0xD2);  // 1234 = 0x04D2
    EXPECT_EQ(bytes[1], 0x04);
    EXPECT_EQ(bytes[8], 100);
    EXPECT_EQ(bytes[9], 0);
    EXPECT_EQ(bytes[10], 10);
    EXPECT_EQ(bytes[11], kManifestVersion);
    EXPECT_EQ(bytes[12], 0xEF);
    EXPECT_EQ(bytes[19], 0x01);
}

TEST(FileManifestTest, RoundTrip) {
    const auto manifest = sampleManifest();
    const auto bytes = manifest.serialize();

    auto parsed = parseFileManifest(bytes);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, manifest);
}

TEST(FileManifestTest, DetectsCorruption) {
    auto bytes = sampleManifest().serialize();
    bytes[3] ^= 0x40;

    auto parsed = parseFileManifest(bytes);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::kChecksumError);
}

TEST(FileManifestTest, RejectsWrongLength) {
    const auto bytes = sampleManifest().serialize();
    auto parsed = parseFileManifest(std::span<const std::uint8_t>(bytes.data(), bytes.size() - 1));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::kFormatError);
}

TEST(FileManifestTest, RejectsUnsupportedVersion) {
    auto manifest = sampleManifest();
    manifest.version = 2;

    auto parsed = parseFileManifest(manifest.serialize());
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::kFormatError);
}

TEST(FileManifestTest, RejectsImpossibleGeometry) {
    auto manifest = sampleManifest();
    manifest.chunkSize = 250;
    manifest.nsym = 10;
    auto oversized = parseFileManifest(manifest.serialize());
    ASSERT_FALSE(oversized.has_value());
    EXPECT_EQ(oversized.error().code(), ErrorCode::kFormatError);

    manifest.chunkSize = 0;
    EXPECT_FALSE(parseFileManifest(manifest.serialize()).has_value());
}

TEST(FileManifestTest, ChunkGeometry) {
    auto manifest = sampleManifest();
    EXPECT_EQ(manifest.expectedChunks(), 13U);
    EXPECT_EQ(manifest.chunkPayloadSize(0), 100U);
    EXPECT_EQ(manifest.chunkPayloadSize(12), 34U);
    EXPECT_EQ(manifest.chunkPayloadSize(13), 0U);

    manifest.fileSize = 0;
    EXPECT_EQ(manifest.expectedChunks(), 1U);
    EXPECT_EQ(manifest.chunkPayloadSize(0), 0U);

    manifest.fileSize = 200;
    EXPECT_EQ(manifest.expectedChunks(), 2U);
    EXPECT_EQ(manifest.chunkPayloadSize(1), 100U);
}

}  // namespace oligo::format::test
