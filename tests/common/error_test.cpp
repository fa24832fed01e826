// =============================================================================
// oligo-codec - Error Handling Tests
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "oligo/common/error.h"

namespace oligo::test {

TEST(ErrorTest, ExitCodesMatchEnumValues) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kConfigurationInvalid), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kIncompleteDecode), 11);
    EXPECT_EQ(toExitCode(ErrorCode::kCorruptedData), 12);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kHeaderCorrupt), "header corrupt");
    EXPECT_EQ(errorCodeToString(ErrorCode::kUncorrectableErrorBurst), "uncorrectable error burst");
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_FALSE(isSuccess(ErrorCode::kIOError));
}

TEST(ErrorTest, ExceptionMessageCarriesContext) {
    const FormatError error("bad symbol", ErrorContext("reads.fasta").withLine(12));
    const std::string what = error.what();
    EXPECT_NE(what.find("[format error] bad symbol"), std::string::npos);
    EXPECT_NE(what.find("file: reads.fasta"), std::string::npos);
    EXPECT_NE(what.find("line: 12"), std::string::npos);
    EXPECT_EQ(error.message(), "bad symbol");
    EXPECT_EQ(error.exitCode(), 3);
}

TEST(ErrorTest, ThrowExceptionPicksMatchingType) {
    EXPECT_THROW(Error(ErrorCode::kIOError, "io").throwException(), IOError);
    EXPECT_THROW(Error(ErrorCode::kChecksumError, "crc").throwException(), ChecksumError);
    EXPECT_THROW(Error(ErrorCode::kCapacityExceeded, "full").throwException(),
                 ConfigurationError);
    EXPECT_THROW(Error(ErrorCode::kConstraintExhausted, "gc").throwException(), CodecError);

    try {
        Error(ErrorCode::kInsufficientReplicates, "none").throwException();
        FAIL() << "throwException returned";
    } catch (const OligoException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInsufficientReplicates);
    }
}

TEST(ErrorTest, ResultHelpers) {
    Result<int> failed = makeError<int>(ErrorCode::kFormatError, "nope");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kFormatError);
    EXPECT_THROW((void)unwrapOrThrow(std::move(failed)), FormatError);

    Result<int> ok = 42;
    EXPECT_EQ(unwrapOrThrow(std::move(ok)), 42);

    EXPECT_TRUE(makeVoidSuccess().has_value());
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kCorruptedData, "x")), CodecError);
}

TEST(ErrorTest, TryExecuteConvertsExceptions) {
    auto fromOligo = tryExecute([]() -> int { throw ChecksumError("mismatch"); });
    ASSERT_FALSE(fromOligo.has_value());
    EXPECT_EQ(fromOligo.error().code(), ErrorCode::kChecksumError);

    auto fromStd = tryExecute([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_FALSE(fromStd.has_value());
    EXPECT_EQ(fromStd.error().code(), ErrorCode::kIOError);
    EXPECT_EQ(fromStd.error().message(), "boom");

    auto value = tryExecute([] { return 7; });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);
}

}  // namespace oligo::test
