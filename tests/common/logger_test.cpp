// =============================================================================
// oligo-codec - Logger Tests
// =============================================================================

#include <gtest/gtest.h>

#include "oligo/common/logger.h"

namespace oligo::log::test {

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (Level level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                        Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(LoggerTest, LevelParsingIsLenient) {
    EXPECT_EQ(levelFromString("WARN"), Level::kWarning);
    EXPECT_EQ(levelFromString("Fatal"), Level::kCritical);
    EXPECT_EQ(levelFromString("verbose"), Level::kInfo);
}

TEST(LoggerTest, VerbosityFlags) {
    EXPECT_EQ(levelForVerbosity(0, false), Level::kInfo);
    EXPECT_EQ(levelForVerbosity(1, false), Level::kDebug);
    EXPECT_EQ(levelForVerbosity(3, false), Level::kTrace);
    EXPECT_EQ(levelForVerbosity(2, true), Level::kError);
}

TEST(LoggerTest, QuillLevelMapping) {
    EXPECT_EQ(toQuillLevel(Level::kDebug), quill::LogLevel::Debug);
    EXPECT_EQ(toQuillLevel(Level::kError), quill::LogLevel::Error);
}

TEST(LoggerTest, LogsAfterLazyInitialization) {
    ASSERT_NE(logger(), nullptr);
    EXPECT_TRUE(isInitialized());

    setLevel(Level::kDebug);
    OLIGO_LOG_DEBUG("logger test message {}", 1);
    OLIGO_LOG_INFO("logger test message {}", 2);
    flush();
}

}  // namespace oligo::log::test
