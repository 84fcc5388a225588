#include <gtest/gtest.h>
#include "utils.hpp"
#include <regex>
#include <string>

// ============================================================
// format_bytes Tests
// ============================================================

TEST(FormatBytesTest, PlainBytesHaveNoDecimals) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(17), "17 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
}

TEST(FormatBytesTest, UnitSteps) {
    EXPECT_EQ(format_bytes(1024), "1.00 KB");
    EXPECT_EQ(format_bytes(3 * 1024 * 1024 / 2), "1.50 MB");
    EXPECT_EQ(format_bytes(static_cast<uint64_t>(5) << 30), "5.00 GB");
    EXPECT_EQ(format_bytes(static_cast<uint64_t>(2) << 40), "2.00 TB");
}

TEST(FormatBytesTest, ShareFileSizes) {
    EXPECT_EQ(format_bytes(2048), "2.00 KB");     // notes.pdf
    EXPECT_EQ(format_bytes(4096), "4.00 KB");     // slides.pdf
    EXPECT_EQ(format_bytes(8192), "8.00 KB");     // One chunk
    EXPECT_EQ(format_bytes(8193), "8.00 KB");
    EXPECT_EQ(format_bytes(1536000), "1.46 MB");
}

TEST(FormatBytesTest, StaysInTerabytes) {
    std::string s = format_bytes(UINT64_MAX);
    EXPECT_NE(s.find(" TB"), std::string::npos);
}

// ============================================================
// format_throughput Tests
// ============================================================

TEST(FormatThroughputTest, AlwaysTwoDecimals) {
    EXPECT_EQ(format_throughput(0), "0.00 B/s");
    EXPECT_EQ(format_throughput(512), "512.00 B/s");
    EXPECT_EQ(format_throughput(0.004), "0.00 B/s");
}

TEST(FormatThroughputTest, LanSpeeds) {
    EXPECT_EQ(format_throughput(1500), "1.46 KB/s");
    EXPECT_EQ(format_throughput(12.5 * 1024 * 1024), "12.50 MB/s");   // 100 Mbit
    EXPECT_EQ(format_throughput(117.0 * 1024 * 1024), "117.00 MB/s"); // Gigabit
    EXPECT_EQ(format_throughput(1.25 * 1024 * 1024 * 1024), "1.25 GB/s");
}

// ============================================================
// Logging
// ============================================================

TEST(LogTimestampTest, Layout) {
    std::string ts = log_timestamp();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_TRUE(std::regex_match(ts, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));
}

TEST(LogInfoTest, PrefixesTimestamp) {
    testing::internal::CaptureStdout();
    log_info("Connection #{} from {}", 3, "10.0.0.7");
    std::string out = testing::internal::GetCapturedStdout();

    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), '[');
    EXPECT_NE(out.find("] Connection #3 from 10.0.0.7\n"), std::string::npos);
}

TEST(LogErrorTest, GoesToStderr) {
    testing::internal::CaptureStderr();
    log_error("FATAL: {}", "Share directory missing");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("] FATAL: Share directory missing"), std::string::npos);
}
