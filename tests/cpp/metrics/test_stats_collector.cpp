/**
 * @file test_stats_collector.cpp
 * @brief Tests for run counters, match accuracy and the stats file
 */

#include "metrics/stats_collector.h"
#include "support/temp_dir.h"

#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace subdub;
using namespace subdub::metrics;

TEST(MatchAccuracy, ExactMatchIsOne) {
    EXPECT_DOUBLE_EQ(matchAccuracy(120.0, 120.0), 1.0);
}

TEST(MatchAccuracy, SymmetricRelativeError) {
    EXPECT_NEAR(matchAccuracy(99.0, 100.0), 0.99, 1e-12);
    EXPECT_NEAR(matchAccuracy(101.0, 100.0), 0.99, 1e-12);
}

TEST(MatchAccuracy, ZeroTarget) {
    EXPECT_DOUBLE_EQ(matchAccuracy(0.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(matchAccuracy(1.0, 0.0), 0.0);
}

TEST(StatsCollector, SnapshotReflectsRecordedEvents) {
    StatsCollector stats;
    stats.setTotal(5);
    stats.recordGenerated();
    stats.recordCached();
    stats.recordCached();
    stats.recordEmpty();
    stats.recordFailed();
    stats.recordSynthesisAttempt();

    fitting::SlotResult slot;
    slot.overlapDetected = true;
    slot.lateStart = true;
    stats.recordSlot(slot);
    stats.setDurations(10.0, 9.5);

    RunStats s = stats.snapshot();
    EXPECT_EQ(s.total, 5u);
    EXPECT_EQ(s.generated, 1u);
    EXPECT_EQ(s.cached, 2u);
    EXPECT_EQ(s.empty, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.processed(), 4u);
    EXPECT_EQ(s.overlaps, 1u);
    EXPECT_EQ(s.lateStarts, 1u);
    EXPECT_EQ(s.stretchFailures, 0u);
    EXPECT_NEAR(s.matchAccuracy, 0.95, 1e-12);
}

TEST(StatsCollector, ConcurrentRecordingIsCounted) {
    StatsCollector stats;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&stats] {
            for (int i = 0; i < 1000; ++i) {
                stats.recordGenerated();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(stats.snapshot().generated, 4000u);
}

TEST(StatsCollector, ResetClearsEverything) {
    StatsCollector stats;
    stats.recordGenerated();
    stats.setDurations(1.0, 1.0);
    stats.reset();
    RunStats s = stats.snapshot();
    EXPECT_EQ(s.generated, 0u);
    EXPECT_DOUBLE_EQ(s.targetSeconds, 0.0);
}

TEST(StatsCollector, JsonUsesSnakeCaseKeys) {
    StatsCollector stats;
    stats.recordResumed();
    stats.recordLateStart();
    stats.setDurations(2.0, 2.0);

    nlohmann::json j = stats.toJson();
    EXPECT_EQ(j["resumed"], 1);
    EXPECT_EQ(j["late_starts"], 1);
    EXPECT_EQ(j["stretch_failures"], 0);
    ASSERT_TRUE(j.contains("duration"));
    EXPECT_DOUBLE_EQ(j["duration"]["match_accuracy"].get<double>(), 1.0);
}

TEST(StatsFile, WritesJsonAtomically) {
    testing_support::ScopedTempDir temp;
    const std::string path = (temp.path() / "stats.json").string();

    RunStats s;
    s.total = 3;
    s.generated = 2;
    s.empty = 1;
    ASSERT_TRUE(writeStatsFile(path, s));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    std::ifstream ifs(path);
    nlohmann::json j = nlohmann::json::parse(ifs);
    EXPECT_EQ(j["total"], 3);
    EXPECT_EQ(j["generated"], 2);
}

TEST(StatsFile, FailsForEmptyPathOrMissingDirectory) {
    RunStats s;
    EXPECT_FALSE(writeStatsFile("", s));
    EXPECT_FALSE(writeStatsFile("/nonexistent_subdub_dir/stats.json", s));
}
