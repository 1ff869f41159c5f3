#include <gtest/gtest.h>

#include "framestream/stats_tracker.hpp"

namespace framestream {
namespace {

TEST(StatsTrackerTest, ReportsAndResetsAfterInterval) {
    StatsTracker stats(5.0, 100.0);
    for (int i = 0; i < 10; ++i) {
        stats.on_received();
        stats.on_delay(100.0, 100.5);
    }
    stats.on_dropped();
    stats.on_dropped();

    StatsReport report;
    EXPECT_FALSE(stats.poll(104.9, report));
    ASSERT_TRUE(stats.poll(105.0, report));

    EXPECT_EQ(report.received, 10u);
    EXPECT_EQ(report.dropped, 2u);
    EXPECT_DOUBLE_EQ(report.elapsed, 5.0);
    EXPECT_DOUBLE_EQ(report.in_fps, 8.0 / 5.0);
    EXPECT_DOUBLE_EQ(report.average_delay, 0.5);

    EXPECT_EQ(stats.received(), 0u);
    EXPECT_EQ(stats.dropped(), 0u);
    EXPECT_FALSE(stats.poll(109.0, report));
    ASSERT_TRUE(stats.poll(110.0, report));
    EXPECT_EQ(report.received, 0u);
    EXPECT_DOUBLE_EQ(report.average_delay, 0.0);
    EXPECT_DOUBLE_EQ(report.in_fps, 0.0);
}

TEST(StatsTrackerTest, ZeroIntervalDisablesReporting) {
    StatsTracker stats(0.0, 0.0);
    stats.on_received();
    StatsReport report;
    EXPECT_FALSE(stats.poll(1e9, report));
    EXPECT_EQ(stats.received(), 1u);
}

TEST(StatsTrackerTest, FormatsOneLine) {
    StatsReport report;
    report.received = 30;
    report.dropped = 1;
    report.elapsed = 5.0;
    report.in_fps = 5.8;
    report.average_delay = 0.0125;

    const std::string line = format_report(report);
    EXPECT_NE(line.find("received=30"), std::string::npos);
    EXPECT_NE(line.find("dropped=1"), std::string::npos);
    EXPECT_NE(line.find("in_fps=5.800"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

} // namespace
} // namespace framestream
