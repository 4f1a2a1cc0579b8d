#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "offload/utils/format.hpp"

using namespace offload::utils;

TEST(HumanSizeTest, BytesStayInBytes) {
    EXPECT_EQ(humanSize(0), "0.0 B");
    EXPECT_EQ(humanSize(512), "512.0 B");
    EXPECT_EQ(humanSize(1023), "1023.0 B");
}

TEST(HumanSizeTest, BinarySteps) {
    EXPECT_EQ(humanSize(1024), "1.0 KB");
    EXPECT_EQ(humanSize(1536), "1.5 KB");
    EXPECT_EQ(humanSize(1024.0 * 1024), "1.0 MB");
    EXPECT_EQ(humanSize(1.5 * 1024 * 1024 * 1024), "1.5 GB");
    EXPECT_EQ(humanSize(2.0 * 1024 * 1024 * 1024 * 1024), "2.0 TB");
}

TEST(HumanSizeTest, LargestUnitIsPetabytes) {
    const double pb = 1024.0 * 1024 * 1024 * 1024 * 1024;
    EXPECT_EQ(humanSize(pb), "1.0 PB");
    EXPECT_EQ(humanSize(2048 * pb), "2048.0 PB");
}

TEST(HumanSpeedTest, AppendsPerSecond) {
    EXPECT_EQ(humanSpeed(10.0 * 1024 * 1024), "10.0 MB/s");
    EXPECT_EQ(humanSpeed(0), "0.0 B/s");
}

TEST(FormatDurationTest, Seconds) {
    EXPECT_EQ(formatDuration(0), "0s");
    EXPECT_EQ(formatDuration(42.9), "42s");
    EXPECT_EQ(formatDuration(-5), "0s");
}

TEST(FormatDurationTest, MinutesAndSeconds) {
    EXPECT_EQ(formatDuration(60), "1m 0s");
    EXPECT_EQ(formatDuration(187), "3m 7s");
}

TEST(FormatDurationTest, HoursAndMinutes) {
    EXPECT_EQ(formatDuration(3600), "1h 0m");
    EXPECT_EQ(formatDuration(2 * 3600 + 15 * 60 + 59), "2h 15m");
}

TEST(FormatEtaTest, Remaining) {
    EXPECT_EQ(formatEta(90.0), "1m 30s remaining");
    EXPECT_EQ(formatEta(0.0), "almost done");
    EXPECT_EQ(formatEta(-1.0), "almost done");
}

TEST(FormatEtaTest, UnknownIsEmpty) {
    EXPECT_EQ(formatEta(std::optional<double>{}), "");
    EXPECT_EQ(formatEta(std::optional<double>{5.0}), "5s remaining");
}
