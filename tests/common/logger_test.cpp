// =============================================================================
// genoqc - Logger Tests
// =============================================================================

#include <gtest/gtest.h>

#include "gqc/common/logger.h"

namespace gqc::test {

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (auto level : {log::Level::kTrace, log::Level::kDebug, log::Level::kInfo,
                       log::Level::kWarning, log::Level::kError, log::Level::kCritical}) {
        EXPECT_EQ(log::levelFromString(log::levelToString(level)), level);
    }
    EXPECT_EQ(log::levelFromString(" WARN "), log::Level::kWarning);
    EXPECT_FALSE(log::levelFromString("loud").has_value());
    EXPECT_FALSE(log::levelFromString("").has_value());
}

TEST(LoggerTest, LoggingWorksWithoutInit) {
    ASSERT_NE(log::logger(), nullptr);
    EXPECT_EQ(log::logger(), log::logger());
    GQC_LOG_DEBUG("logger test message {}", 1);
    log::flush();
    EXPECT_FALSE(log::isConfigured());
}

}  // namespace gqc::test
