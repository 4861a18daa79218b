#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "airmon/sysinfo/system_monitor.hpp"

namespace airmon::sysinfo::test {

using namespace std::chrono_literals;

auto fakeSample() -> TelemetrySample {
    TelemetrySample sample;
    sample.system.platform = "Linux";
    sample.system.cpuUsage = 12.5F;
    sample.system.batteryPercentage = 42;
    sample.battery.percentage = 42;
    sample.battery.plugged = true;
    return sample;
}

template <typename Predicate>
auto waitFor(Predicate predicate, std::chrono::milliseconds limit = 5s)
    -> bool {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

TEST(SystemMonitorTest, DeliversSamplesAndCachesThem) {
    SystemMonitor monitor(fakeSample);
    std::atomic<int> calls{0};
    std::atomic<int> lastBattery{-1};
    ASSERT_TRUE(monitor.start(
        [&](const SystemInfo& info, const BatteryReport& battery) {
            EXPECT_EQ(info.platform, "Linux");
            lastBattery = battery.percentage.value_or(-1);
            ++calls;
        },
        std::chrono::duration<double>(0.01)));
    EXPECT_TRUE(monitor.isRunning());
    ASSERT_TRUE(waitFor([&] { return calls.load() >= 3; }));
    monitor.stop();

    EXPECT_FALSE(monitor.isRunning());
    EXPECT_EQ(lastBattery.load(), 42);
    auto cached = monitor.cachedSystemInfo();
    ASSERT_TRUE(cached.has_value());
    EXPECT_FLOAT_EQ(cached->cpuUsage, 12.5F);
    EXPECT_TRUE(monitor.cachedBattery().plugged);
    EXPECT_GE(monitor.sampleCount(), 3U);
}

TEST(SystemMonitorTest, SecondStartIsRejected) {
    SystemMonitor monitor(fakeSample);
    EXPECT_TRUE(monitor.start({}, std::chrono::duration<double>(0.01)));
    EXPECT_FALSE(monitor.start({}, std::chrono::duration<double>(0.01)));
    monitor.stop();
    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
}

TEST(SystemMonitorTest, RejectsNonPositiveInterval) {
    SystemMonitor monitor(fakeSample);
    EXPECT_FALSE(monitor.start({}, std::chrono::duration<double>(0.0)));
    EXPECT_FALSE(monitor.isRunning());
}

TEST(SystemMonitorTest, StopInterruptsLongInterval) {
    SystemMonitor monitor(fakeSample);
    ASSERT_TRUE(monitor.start({}, std::chrono::duration<double>(60.0)));
    ASSERT_TRUE(waitFor([&] { return monitor.sampleCount() >= 1; }));
    const auto start = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(SystemMonitorTest, FailuresDoNotStopTheLoop) {
    std::atomic<int> rounds{0};
    SystemMonitor monitor([&]() -> TelemetrySample {
        if (rounds.fetch_add(1) % 2 == 0) {
            throw std::runtime_error("sensor unavailable");
        }
        return fakeSample();
    });
    std::atomic<int> calls{0};
    ASSERT_TRUE(monitor.start(
        [&](const SystemInfo&, const BatteryReport&) {
            ++calls;
            throw std::runtime_error("callback failure");
        },
        std::chrono::duration<double>(0.005)));
    ASSERT_TRUE(waitFor([&] { return calls.load() >= 2; }));
    monitor.stop();
    EXPECT_GE(rounds.load(), 4);
}

TEST(SystemMonitorTest, RestartAfterStop) {
    SystemMonitor monitor(fakeSample);
    ASSERT_TRUE(monitor.start({}, std::chrono::duration<double>(0.01)));
    monitor.stop();
    ASSERT_TRUE(monitor.start({}, std::chrono::duration<double>(0.01)));
    EXPECT_TRUE(monitor.isRunning());
    monitor.stop();
}

TEST(SystemInfoJsonTest, UsesNullForMissingBattery) {
    SystemInfo info;
    info.platform = "Linux";
    info.networkInterfaces = {"lo", "wlan0"};
    nlohmann::json j = info;
    EXPECT_EQ(j["platform"], "Linux");
    EXPECT_TRUE(j["battery_percentage"].is_null());
    EXPECT_EQ(j["network_interfaces"].size(), 2U);

    BatteryReport report;
    report.powerWatts = 7.5;
    nlohmann::json b = report;
    EXPECT_TRUE(b["percentage"].is_null());
    EXPECT_DOUBLE_EQ(b["power_consumption"].get<double>(), 7.5);
}

TEST(CollectSampleTest, FillsPlatformFields) {
    system::ProcessCommandRunner runner;
    auto sample = collectSample(runner, nullptr);
    EXPECT_FALSE(sample.system.platform.empty());
    EXPECT_FALSE(sample.system.architecture.empty());
    EXPECT_TRUE(sample.system.networkInterfaces.empty());
    EXPECT_EQ(sample.system.batteryPercentage, sample.battery.percentage);
}

}  // namespace airmon::sysinfo::test
