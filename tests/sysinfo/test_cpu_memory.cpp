#include <gtest/gtest.h>

#include "airmon/sysinfo/cpu.hpp"
#include "airmon/sysinfo/memory.hpp"

namespace airmon::sysinfo::test {

TEST(CpuTest, ParsesAggregateLine) {
    auto times = parseProcStatCpu(
        "cpu  100 20 30 400 50 6 4 0 0 0\n"
        "cpu0 50 10 15 200 25 3 2 0 0 0\n");
    ASSERT_TRUE(times.has_value());
    EXPECT_EQ(times->total, 610U);
    EXPECT_EQ(times->idle, 450U);
}

TEST(CpuTest, RejectsMissingOrMalformedLine) {
    EXPECT_FALSE(parseProcStatCpu("intr 1 2 3\n").has_value());
    EXPECT_FALSE(parseProcStatCpu("cpu 1 2\n").has_value());
    EXPECT_FALSE(parseProcStatCpu("cpu a b c d e\n").has_value());
}

TEST(CpuTest, UsageBetweenSamples) {
    CpuTimes before{400, 1000};
    CpuTimes after{450, 1200};
    EXPECT_FLOAT_EQ(cpuUsageBetween(before, after), 75.0F);
    EXPECT_FLOAT_EQ(cpuUsageBetween(after, before), 0.0F);
    EXPECT_FLOAT_EQ(cpuUsageBetween(before, before), 0.0F);
}

TEST(CpuTest, LiveSampleIsAPercentage) {
    const float usage = getCurrentCpuUsage(std::chrono::milliseconds(20));
    EXPECT_GE(usage, 0.0F);
    EXPECT_LE(usage, 100.0F);
}

TEST(MemoryTest, PrefersMemAvailable) {
    auto usage = parseMeminfoUsage(
        "MemTotal:       1000 kB\n"
        "MemFree:         100 kB\n"
        "MemAvailable:    250 kB\n"
        "Buffers:          50 kB\n"
        "Cached:          100 kB\n");
    ASSERT_TRUE(usage.has_value());
    EXPECT_FLOAT_EQ(*usage, 75.0F);
}

TEST(MemoryTest, FallsBackToFreeBuffersCached) {
    auto usage = parseMeminfoUsage(
        "MemTotal:       1000 kB\n"
        "MemFree:         100 kB\n"
        "Buffers:          50 kB\n"
        "Cached:          250 kB\n");
    ASSERT_TRUE(usage.has_value());
    EXPECT_FLOAT_EQ(*usage, 60.0F);
}

TEST(MemoryTest, MissingTotalIsUnknown) {
    EXPECT_FALSE(parseMeminfoUsage("MemFree: 10 kB\n").has_value());
    EXPECT_FALSE(parseMeminfoUsage("").has_value());
}

TEST(MemoryTest, LiveUsageIsAPercentage) {
    const float usage = getMemoryUsage();
    EXPECT_GE(usage, 0.0F);
    EXPECT_LE(usage, 100.0F);
}

}  // namespace airmon::sysinfo::test
