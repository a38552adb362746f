#include <gtest/gtest.h>
#include <core/format_units.hpp>
#include <limits>

TEST(FormatUnits, Speed) {
    EXPECT_EQ(format_speed(0), "0.00 B/s");
    EXPECT_EQ(format_speed(512), "512.00 B/s");
    EXPECT_EQ(format_speed(1536), "1.50 KB/s");
    EXPECT_EQ(format_speed(12.25 * 1024 * 1024), "12.25 MB/s");
    EXPECT_EQ(format_speed(2.0 * 1024 * 1024 * 1024), "2.00 GB/s");
}

TEST(FormatUnits, Size) {
    EXPECT_EQ(format_size(0), "0.00 B");
    EXPECT_EQ(format_size(1023), "1023.00 B");
    EXPECT_EQ(format_size(1024), "1.00 KB");
    EXPECT_EQ(format_size(5ULL * 1024 * 1024), "5.00 MB");
    EXPECT_EQ(format_size(3ULL * 1024 * 1024 * 1024), "3.00 GB");
}

TEST(FormatUnits, DurationSeconds) {
    EXPECT_EQ(format_duration(0), "0s");
    EXPECT_EQ(format_duration(45), "45s");
}

TEST(FormatUnits, DurationMinutes) {
    EXPECT_EQ(format_duration(330), "5m 30s");
}

TEST(FormatUnits, DurationHours) {
    EXPECT_EQ(format_duration(2 * 3600 + 15 * 60 + 9), "2h 15m");
}

TEST(FormatUnits, DurationClampsNonsense) {
    EXPECT_EQ(format_duration(-5), "0s");
    EXPECT_EQ(format_duration(std::numeric_limits<double>::infinity()), "0s");
}
