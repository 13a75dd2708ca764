#include <gtest/gtest.h>

#include "logger.hpp"

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("verbose"), LogLevel::Debug);
}

TEST(LoggerTest, PhaseIsRecordedWithItsFile) {
    LOG_PHASE("Ledger load", false);

    auto phase = lastPhase();
    EXPECT_EQ(phase.phaseName, "Ledger load");
    EXPECT_EQ(phase.fileName, "test_logger.cpp");
    EXPECT_FALSE(phase.success);

    LOG_PHASE("Ledger load", true);
    EXPECT_TRUE(lastPhase().success);
}

TEST(LoggerTest, GroupedPhasesStillUpdateLastPhase) {
    beginPhaseGroup();
    LOG_PHASE("Intents load", true);
    endPhaseGroup();
    EXPECT_EQ(lastPhase().phaseName, "Intents load");
}
