#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "airmon/sysinfo/battery.hpp"

namespace airmon::sysinfo::test {

namespace fs = std::filesystem;

class SysfsBatteryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                (std::string("airmon_power_supply_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override { fs::remove_all(root_); }

    void write(const std::string& entry, const std::string& attribute,
               const std::string& value) {
        fs::create_directories(root_ / entry);
        std::ofstream(root_ / entry / attribute) << value << "\n";
    }

    fs::path root_;
};

TEST_F(SysfsBatteryTest, FindsFirstBatteryDirectory) {
    write("AC", "online", "1");
    write("BAT1", "capacity", "50");
    write("BAT0", "capacity", "80");
    auto dir = findBatteryDirectory(root_);
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(dir->filename(), "BAT0");

    EXPECT_FALSE(findBatteryDirectory(root_ / "missing").has_value());
}

TEST_F(SysfsBatteryTest, ReadsDischargingBattery) {
    write("BAT0", "capacity", "64");
    write("BAT0", "status", "Discharging");
    write("BAT0", "time_to_empty_now", "5400");
    write("BAT0", "time_to_full_now", "1200");
    write("BAT0", "power_now", "12500000");
    write("BAT0", "temp", "312");

    auto report = readSysfsBattery(root_ / "BAT0");
    EXPECT_EQ(report.percentage, 64);
    EXPECT_FALSE(report.plugged);
    EXPECT_EQ(report.secondsLeft, 5400);
    ASSERT_TRUE(report.powerWatts.has_value());
    EXPECT_DOUBLE_EQ(*report.powerWatts, 12.5);
    ASSERT_TRUE(report.temperatureCelsius.has_value());
    EXPECT_DOUBLE_EQ(*report.temperatureCelsius, 31.2);
    EXPECT_TRUE(report.present());
}

TEST_F(SysfsBatteryTest, ChargingUsesTimeToFullAndSkipsBadValues) {
    write("BAT0", "capacity", "garbage");
    write("BAT0", "status", "Full");
    write("BAT0", "time_to_full_now", "1200");

    auto report = readSysfsBattery(root_ / "BAT0");
    EXPECT_FALSE(report.percentage.has_value());
    EXPECT_TRUE(report.plugged);
    EXPECT_EQ(report.secondsLeft, 1200);
    EXPECT_FALSE(report.powerWatts.has_value());
    EXPECT_FALSE(report.present());
}

TEST(SystemProfilerPowerTest, ParsesStateOfCharge) {
    auto report = parseSystemProfilerPower(
        "Battery Information:\n"
        "\n"
        "      Charge Information:\n"
        "          State of Charge (%): 87\n"
        "          Fully Charged: No\n"
        "          Charging: Yes\n"
        "      Time Remaining: 1:45\n");
    EXPECT_EQ(report.percentage, 87);
    EXPECT_TRUE(report.plugged);
    EXPECT_EQ(report.secondsLeft, 105 * 60);
}

TEST(SystemProfilerPowerTest, DerivesPercentageFromCapacity) {
    auto report = parseSystemProfilerPower(
        "Charge Remaining (mAh): 999\n"
        "Battery Information:\n"
        "    Charge Remaining (mAh): 2500\n"
        "    Full Charge Capacity (mAh): 5000\n"
        "    Fully Charged: No\n"
        "    Charging: No\n"
        "    Time Remaining: 0:00\n");
    EXPECT_EQ(report.percentage, 50);
    EXPECT_FALSE(report.plugged);
    EXPECT_FALSE(report.secondsLeft.has_value());
}

TEST(SystemProfilerPowerTest, IgnoresOutputWithoutBatterySection) {
    auto report = parseSystemProfilerPower("AC Charger Information:\n"
                                           "    Connected: Yes\n");
    EXPECT_EQ(report, BatteryReport{});
}

}  // namespace airmon::sysinfo::test
