// =============================================================================
// oligo-codec - Oligo File I/O Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "oligo/common/error.h"
#include "oligo/io/oligo_file.h"

namespace oligo::io::test {

namespace {

format::OligoRecord sampleRecord(OligoType type, std::uint32_t replicate) {
    format::OligoHeader header;
    header.type = type;
    header.chunkIdx = 3;
    header.totalChunks = 12;
    header.seqIdx = 0;
    header.totalSeqs = 4;
    auto record = format::makeRecord(header, "ACGTAC");
    EXPECT_TRUE(record.has_value());
    record->replicateId = replicate;
    return *record;
}

class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("oligo_file_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

// =============================================================================
// FASTA Writing
// =============================================================================

TEST(OligoFileTest, FastaNameEncodesAddress) {
    EXPECT_EQ(fastaName(sampleRecord(OligoType::kData, 1)), "D:3/12:0/4:r1");
    EXPECT_EQ(fastaName(sampleRecord(OligoType::kParity, 0)), "P:3/12:0/4:r0");
    EXPECT_EQ(fastaName(sampleRecord(OligoType::kHeader, 2)), "H:3/12:0/4:r2");
}

TEST(OligoFileTest, WriteThenReadStream) {
    const std::vector<format::OligoRecord> records = {sampleRecord(OligoType::kData, 0),
                                                      sampleRecord(OligoType::kData, 1)};
    std::stringstream buffer;
    writeFasta(buffer, records);

    const std::string text = buffer.str();
    EXPECT_EQ(text.front(), '>');
    EXPECT_NE(text.find(">D:3/12:0/4:r1\n"), std::string::npos);

    const auto sequences = readSequences(buffer);
    ASSERT_EQ(sequences.size(), 2U);
    EXPECT_EQ(sequences[0], records[0].sequence());
    EXPECT_EQ(sequences[1], records[1].sequence());
}

// =============================================================================
// Sequence Reading
// =============================================================================

TEST(OligoFileTest, ReadsPlainLines) {
    std::istringstream in("ACGT\n\n  acgn \r\nTTTT\n");
    const auto sequences = readSequences(in);
    EXPECT_EQ(sequences, (std::vector<std::string>{"ACGT", "ACGN", "TTTT"}));
}

TEST(OligoFileTest, JoinsMultiLineFasta) {
    std::istringstream in(">first\nACGT\nACGT\n>empty\n>second\nGG\n");
    const auto sequences = readSequences(in);
    EXPECT_EQ(sequences, (std::vector<std::string>{"ACGTACGT", "GG"}));
}

TEST(OligoFileTest, RejectsInvalidSymbolsWithLine) {
    std::istringstream in("ACGT\nACXT\n");
    try {
        (void)readSequences(in, "pool.txt");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFormatError);
        const std::string message = e.what();
        EXPECT_NE(message.find("pool.txt"), std::string::npos);
        EXPECT_NE(message.find("line: 2"), std::string::npos);
    }
}

TEST(OligoFileTest, MissingFileThrowsIOError) {
    EXPECT_THROW((void)readSequences(std::filesystem::path("/nonexistent/reads.fasta")), IOError);
    EXPECT_THROW((void)readBinaryFile("/nonexistent/input.bin"), IOError);
}

// =============================================================================
// Files on Disk
// =============================================================================

TEST(OligoFileTest, FastaFileRoundTrip) {
    TempDir dir;
    const auto path = dir.path() / "pool.fasta";
    const std::vector<format::OligoRecord> records = {sampleRecord(OligoType::kParity, 0)};

    writeFasta(path, records);
    const auto sequences = readSequences(path);
    ASSERT_EQ(sequences.size(), 1U);
    EXPECT_EQ(sequences[0], records[0].sequence());
}

TEST(OligoFileTest, BinaryFileRoundTrip) {
    TempDir dir;
    const auto path = dir.path() / "data.bin";
    const std::vector<std::uint8_t> bytes = {0x00, 0xFF, 0x0A, 0x0D, 0x1A, 0x7F};

    writeBinaryFile(path, bytes);
    EXPECT_EQ(readBinaryFile(path), bytes);

    writeBinaryFile(path, {});
    EXPECT_TRUE(readBinaryFile(path).empty());
}

}  // namespace oligo::io::test
