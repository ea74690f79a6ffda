#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include <filesystem>
#include "arbitrage/spread_history.hpp"
#include "utils/time_utils.hpp"

using namespace spreadarb;

class SpreadHistoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        wall0_ = time_utils::from_iso8601("2025-03-10T10:00:00");
    }

    void TearDown() override {
        if (!path_.empty()) {
            std::filesystem::remove(path_);
        }
    }

    static SpreadSnapshot spreads(double entry_12, double entry_21, double exit_12, double exit_21) {
        SpreadSnapshot s;
        s.v1_to_v2.direction = Direction::V1_TO_V2;
        s.v1_to_v2.entry_spread = entry_12;
        s.v1_to_v2.exit_spread = exit_12;
        s.v2_to_v1.direction = Direction::V2_TO_V1;
        s.v2_to_v1.entry_spread = entry_21;
        s.v2_to_v1.exit_spread = exit_21;
        return s;
    }

    WallClock at(int seconds) const { return wall0_ + std::chrono::seconds(seconds); }

    WallClock wall0_;
    std::string path_;
};

TEST_F(SpreadHistoryTest, EmptyHistoryHasZeroStats) {
    SpreadHistory history;

    auto stats = history.statistics();
    EXPECT_EQ(stats.count, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_entry, 0.0);
    EXPECT_DOUBLE_EQ(stats.max_exit, 0.0);
    EXPECT_FALSE(stats.best_entry_spread.has_value());
    EXPECT_TRUE(stats.recent_entries.empty());
    EXPECT_TRUE(history.chart_data().at.empty());
}

TEST_F(SpreadHistoryTest, PointTakesBestOfBothDirections) {
    SpreadHistory history;
    history.add(spreads(0.003, -0.004, -0.001, -0.002), true, false, at(0));

    auto chart = history.chart_data();
    ASSERT_EQ(chart.at.size(), 1u);
    EXPECT_DOUBLE_EQ(chart.best_entry[0], 0.003);
    EXPECT_DOUBLE_EQ(chart.best_exit[0], -0.001);
    EXPECT_DOUBLE_EQ(chart.entry_v2_to_v1[0], -0.004);
    EXPECT_TRUE(chart.v1_healthy[0]);
    EXPECT_FALSE(chart.v2_healthy[0]);
}

TEST_F(SpreadHistoryTest, StatisticsOverStoredPoints) {
    SpreadHistory history;
    history.add(spreads(0.002, -0.003, -0.002, -0.004), true, true, at(0));
    history.add(spreads(-0.001, -0.002, 0.0005, -0.003), true, true, at(1));
    history.add(spreads(-0.004, 0.005, -0.003, -0.001), true, true, at(2));

    auto stats = history.statistics();
    EXPECT_EQ(stats.count, 3u);
    // Best entries 0.002, -0.001, 0.005
    EXPECT_NEAR(stats.avg_entry, 0.002, 1e-12);
    EXPECT_NEAR(stats.max_entry, 0.005, 1e-12);
    EXPECT_EQ(stats.positive_entries, 2u);
    EXPECT_NEAR(stats.entry_volatility, std::sqrt((0.0 + 0.000009 + 0.000009) / 3.0), 1e-12);
    // Best exits -0.002, 0.0005, -0.001
    EXPECT_NEAR(stats.avg_exit, -0.0025 / 3.0, 1e-12);
    EXPECT_NEAR(stats.max_exit, 0.0005, 1e-12);
    EXPECT_EQ(stats.converged_exits, 1u);

    ASSERT_TRUE(stats.best_entry_spread.has_value());
    EXPECT_NEAR(*stats.best_entry_spread, 0.005, 1e-12);
    ASSERT_TRUE(stats.best_entry_direction.has_value());
    EXPECT_EQ(*stats.best_entry_direction, Direction::V2_TO_V1);
    EXPECT_TRUE(stats.best_entry_at == at(2));
    EXPECT_NEAR(*stats.best_exit_v1_to_v2, 0.0005, 1e-12);
    EXPECT_NEAR(*stats.best_exit_v2_to_v1, -0.001, 1e-12);

    ASSERT_EQ(stats.recent_entries.size(), 3u);
    EXPECT_NEAR(stats.recent_entries.back(), 0.005, 1e-12);
}

TEST_F(SpreadHistoryTest, OldestPointsDroppedPastCapacity) {
    SpreadHistory history(3);
    for (int i = 0; i < 5; ++i) {
        history.add(spreads(0.001 * i, -0.01, -0.01, -0.01), true, true, at(i));
    }

    EXPECT_EQ(history.size(), 3u);
    auto chart = history.chart_data();
    ASSERT_EQ(chart.at.size(), 3u);
    EXPECT_EQ(chart.at.front(), at(2));
    EXPECT_NEAR(chart.best_entry.front(), 0.002, 1e-12);

    // Session best survives trimming
    history.add(spreads(-0.01, -0.01, -0.01, -0.01), true, true, at(5));
    history.add(spreads(-0.01, -0.01, -0.01, -0.01), true, true, at(6));
    history.add(spreads(-0.01, -0.01, -0.01, -0.01), true, true, at(7));
    auto stats = history.statistics();
    EXPECT_NEAR(stats.max_entry, -0.01, 1e-12);
    EXPECT_NEAR(*stats.best_entry_spread, 0.004, 1e-12);
}

TEST_F(SpreadHistoryTest, ChartLimitReturnsNewestPoints) {
    SpreadHistory history;
    for (int i = 0; i < 30; ++i) {
        history.add(spreads(0.0001 * i, -0.01, -0.01, -0.01), i % 2 == 0, true, at(i));
    }

    auto chart = history.chart_data(10);
    ASSERT_EQ(chart.at.size(), 10u);
    EXPECT_EQ(chart.at.front(), at(20));
    EXPECT_EQ(chart.at.back(), at(29));
    EXPECT_TRUE(chart.v1_healthy.front());
    EXPECT_FALSE(chart.v1_healthy.back());

    EXPECT_EQ(history.statistics().recent_entries.size(), SpreadHistory::RECENT_POINTS);
}

TEST_F(SpreadHistoryTest, SavedFileRestoresPoints) {
    path_ = (std::filesystem::temp_directory_path() / "spreadarb_spreads_roundtrip.json").string();
    std::filesystem::remove(path_);

    {
        SpreadHistory history(100, path_, std::chrono::hours(1));
        history.add(spreads(0.003, -0.004, -0.001, -0.002), true, false, at(0));
        history.add(spreads(0.001, -0.002, 0.0002, -0.003), false, true, at(1));
        history.save();
    }

    SpreadHistory restored(100, path_);
    ASSERT_TRUE(restored.load());
    auto chart = restored.chart_data();
    ASSERT_EQ(chart.at.size(), 2u);
    EXPECT_EQ(chart.at[0], at(0));
    EXPECT_NEAR(chart.best_exit[1], 0.0002, 1e-12);
    EXPECT_FALSE(chart.v1_healthy[1]);
}

TEST_F(SpreadHistoryTest, FirstAddSavesThenWaitsForInterval) {
    path_ = (std::filesystem::temp_directory_path() / "spreadarb_spreads_periodic.json").string();
    std::filesystem::remove(path_);

    SpreadHistory history(100, path_, std::chrono::seconds(60));
    history.add(spreads(0.001, -0.01, -0.01, -0.01), true, true, at(0));
    ASSERT_TRUE(std::filesystem::exists(path_));

    // Within the interval the file keeps one point
    history.add(spreads(0.002, -0.01, -0.01, -0.01), true, true, at(30));
    SpreadHistory early(100, path_);
    ASSERT_TRUE(early.load());
    EXPECT_EQ(early.size(), 1u);

    history.add(spreads(0.003, -0.01, -0.01, -0.01), true, true, at(61));
    SpreadHistory later(100, path_);
    ASSERT_TRUE(later.load());
    EXPECT_EQ(later.size(), 3u);
}

TEST_F(SpreadHistoryTest, LoadKeepsOnlyNewestPoints) {
    path_ = (std::filesystem::temp_directory_path() / "spreadarb_spreads_trim.json").string();
    {
        SpreadHistory big(10, path_);
        for (int i = 0; i < 10; ++i) {
            big.add(spreads(0.001 * i, -0.01, -0.01, -0.01), true, true, at(i));
        }
        big.save();
    }

    SpreadHistory small(4, path_);
    ASSERT_TRUE(small.load());
    EXPECT_EQ(small.size(), 4u);
    EXPECT_EQ(small.chart_data().at.front(), at(6));
}

TEST_F(SpreadHistoryTest, MissingOrCorruptFileLeavesHistoryEmpty) {
    path_ = (std::filesystem::temp_directory_path() / "spreadarb_spreads_corrupt.json").string();
    std::filesystem::remove(path_);

    SpreadHistory missing(100, path_);
    EXPECT_FALSE(missing.load());

    {
        std::ofstream out(path_);
        out << R"({"data": [{"timestamp_ms": "noon"}]})";
    }
    SpreadHistory corrupt(100, path_);
    EXPECT_FALSE(corrupt.load());
    EXPECT_EQ(corrupt.size(), 0u);
}

TEST_F(SpreadHistoryTest, ClearDropsPointsAndRecords) {
    SpreadHistory history;
    history.add(spreads(0.003, -0.004, -0.001, -0.002), true, true, at(0));

    history.clear();

    EXPECT_EQ(history.size(), 0u);
    EXPECT_FALSE(history.statistics().best_entry_spread.has_value());
}
