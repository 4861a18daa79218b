#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "airmon/device/bluetooth_detector.hpp"
#include "fakes.hpp"

namespace airmon::device::test {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

TEST(BluetoothctlParserTest, ControllerLineBecomesEnabledController) {
    auto devices =
        parseBluetoothctlOutput("Controller AA:BB:CC:DD:EE:FF MyPhone\n",
                                "Controller", "Bluetooth Controller",
                                DeviceStatus::Enabled);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "MyPhone");
    EXPECT_EQ(devices[0].macAddress, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(devices[0].status, DeviceStatus::Enabled);
    EXPECT_EQ(devices[0].deviceType, DeviceType::Bluetooth);
    EXPECT_EQ(devices[0].interface, "Bluetooth Controller");
}

TEST(BluetoothctlParserTest, KeepsSpacesInNames) {
    auto devices = parseBluetoothctlOutput(
        "Device 11:22:33:44:55:66 Jane's  Headphones Pro\n", "Device",
        "Bluetooth Device", DeviceStatus::Paired);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "Jane's Headphones Pro");
    EXPECT_EQ(devices[0].status, DeviceStatus::Paired);
}

TEST(BluetoothctlParserTest, SkipsShortAndForeignLines) {
    auto devices = parseBluetoothctlOutput(
        "Controller AA:BB\n"
        "Agent registered\n"
        "\n"
        "Controller 00:11:22:33:44:55 hci0 [default]\n",
        "Controller", "Bluetooth Controller", DeviceStatus::Enabled);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "hci0 [default]");
}

TEST(SystemProfilerBluetoothTest, NameComesFromNearestHeading) {
    const char* output =
        "Bluetooth:\n"
        "\n"
        "      Bluetooth Controller:\n"
        "          Address: 8C:85:90:00:11:22\n"
        "      Devices (Paired, Configured, etc.):\n"
        "          Magic Keyboard\n"
        "              Connected: Yes\n"
        "              Address: 04:4B:ED:AA:BB:CC\n";
    auto devices = parseSystemProfilerBluetooth(output);
    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].name, "Bluetooth Device");
    EXPECT_EQ(devices[0].macAddress, "8C:85:90:00:11:22");
    EXPECT_EQ(devices[1].name, "Magic Keyboard");
    EXPECT_EQ(devices[1].macAddress, "04:4B:ED:AA:BB:CC");
    EXPECT_EQ(devices[1].status, DeviceStatus::Connected);
    EXPECT_EQ(devices[1].interface, "Bluetooth");
}

TEST(SystemProfilerBluetoothTest, NameLookbackStopsAfterFiveLines) {
    const std::string fields =
        "              Vendor ID: 0x004C\n"
        "              Product ID: 0x0267\n"
        "              Firmware Version: 1.0\n"
        "              Minor Type: Keyboard\n";

    // Heading exactly five lines above the address.
    auto near = parseSystemProfilerBluetooth(
        "          Magic Keyboard\n" + fields +
        "              Address: 04:4B:ED:AA:BB:CC\n");
    ASSERT_EQ(near.size(), 1U);
    EXPECT_EQ(near[0].name, "Magic Keyboard");

    // One more field line pushes the heading out of range.
    auto far = parseSystemProfilerBluetooth(
        "          Magic Keyboard\n" + fields +
        "              Connected: Yes\n"
        "              Address: 04:4B:ED:AA:BB:CC\n");
    ASSERT_EQ(far.size(), 1U);
    EXPECT_EQ(far[0].name, "Bluetooth Device");
}

TEST(SystemProfilerBluetoothTest, AddressOnFirstLineUsesDefaultName) {
    auto devices =
        parseSystemProfilerBluetooth("Address: 04:4B:ED:AA:BB:CC\n");
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "Bluetooth Device");
    EXPECT_EQ(devices[0].macAddress, "04:4B:ED:AA:BB:CC");
}

class BluetoothDetectorTest : public ::testing::Test {
protected:
    std::shared_ptr<StrictMock<MockCommandRunner>> runner =
        std::make_shared<StrictMock<MockCommandRunner>>();
};

TEST_F(BluetoothDetectorTest, LinuxCombinesControllersAndPairedDevices) {
    EXPECT_CALL(*runner,
                run(ElementsAre("bluetoothctl", "list"), _))
        .WillOnce(Return(ok("Controller AA:BB:CC:DD:EE:FF laptop\n")));
    EXPECT_CALL(*runner, run(ElementsAre("bluetoothctl", "paired-devices"), _))
        .WillOnce(Return(ok("Device 11:22:33:44:55:66 Earbuds\n")));

    BluetoothDetector detector(backendsFor(system::Platform::Linux, runner));
    auto devices = detector.detect();
    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].interface, "Bluetooth Controller");
    EXPECT_EQ(devices[0].status, DeviceStatus::Enabled);
    EXPECT_EQ(devices[1].interface, "Bluetooth Device");
    EXPECT_EQ(devices[1].status, DeviceStatus::Paired);
}

TEST_F(BluetoothDetectorTest, LinuxFailingListDoesNotBlockPairedDevices) {
    EXPECT_CALL(*runner, run(ElementsAre("bluetoothctl", "list"), _))
        .WillOnce(Throw(error::CommandTimeout("f", 1, "fn", "timed out")));
    EXPECT_CALL(*runner, run(ElementsAre("bluetoothctl", "paired-devices"), _))
        .WillOnce(Return(ok("Device 11:22:33:44:55:66 Earbuds\n")));

    BluetoothDetector detector(backendsFor(system::Platform::Linux, runner));
    auto devices = detector.detect();
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "Earbuds");
}

TEST_F(BluetoothDetectorTest, LinuxNonZeroExitYieldsNothing) {
    EXPECT_CALL(*runner, run(_, _)).WillRepeatedly(Return(failed()));
    BluetoothDetector detector(backendsFor(system::Platform::Linux, runner));
    EXPECT_TRUE(detector.detect().empty());
}

TEST_F(BluetoothDetectorTest, MacosUsesSystemProfiler) {
    EXPECT_CALL(*runner,
                run(ElementsAre("system_profiler", "SPBluetoothDataType"), _))
        .WillOnce(Return(ok("      Mouse\n          Address: 01:02:03:04:05:06\n")));
    BluetoothDetector detector(backendsFor(system::Platform::MacOS, runner));
    auto devices = detector.detect();
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "Mouse");
}

TEST_F(BluetoothDetectorTest, WindowsFiltersPnpEntitiesByName) {
    auto wmi = std::make_shared<FakeWmiService>();
    wmi->rows = {
        {{"Name", "Intel(R) Wireless Bluetooth(R)"},
         {"Status", "OK"},
         {"DeviceID", "USB\\VID_8087&PID_0026"},
         {"Manufacturer", "Intel Corporation"}},
        {{"Name", "Generic Bluetooth Radio"}, {"Status", "Error"}},
        {{"Name", "USB Root Hub"}, {"Status", "OK"}},
        {{"Status", "OK"}},
    };
    auto backends = backendsFor(system::Platform::Windows, runner);
    backends.wmi = wmi;

    BluetoothDetector detector(backends);
    auto devices = detector.detect();
    EXPECT_THAT(wmi->lastQuery, ::testing::HasSubstr("Win32_PnPEntity"));
    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].status, DeviceStatus::Enabled);
    EXPECT_EQ(devices[0].info("manufacturer"), "Intel Corporation");
    EXPECT_EQ(devices[1].status, DeviceStatus::Disabled);
}

TEST_F(BluetoothDetectorTest, WindowsQueryFailureYieldsNothing) {
    auto wmi = std::make_shared<FakeWmiService>();
    wmi->throwOnQuery = true;
    auto backends = backendsFor(system::Platform::Windows, runner);
    backends.wmi = wmi;
    BluetoothDetector detector(backends);
    EXPECT_TRUE(detector.detect().empty());
}

TEST_F(BluetoothDetectorTest, CanManageOnlyBluetooth) {
    BluetoothDetector detector(backendsFor(system::Platform::Linux, runner));
    EXPECT_TRUE(detector.canManage(
        makeDevice("a", DeviceType::Bluetooth, "Bluetooth")));
    EXPECT_FALSE(detector.canManage(
        makeDevice("b", DeviceType::WiFiAdapter, "wlan0")));
    EXPECT_FALSE(detector.canManage(
        makeDevice("c", DeviceType::RFDongle, "USB")));
}

TEST_F(BluetoothDetectorTest, PowerToggleSucceedsWhenCommandRuns) {
    EXPECT_CALL(*runner,
                run(ElementsAre("bluetoothctl", "power", "on"), _))
        .WillOnce(Return(ok("Changing power on succeeded\n")));
    EXPECT_CALL(*runner,
                run(ElementsAre("bluetoothctl", "power", "off"), _))
        .WillOnce(Return(failed(1)));

    BluetoothDetector detector(backendsFor(system::Platform::Linux, runner));
    auto device = makeDevice("hci0", DeviceType::Bluetooth, "Bluetooth");
    EXPECT_TRUE(detector.enable(device));
    // A non-zero exit still counts: the command was issued.
    EXPECT_TRUE(detector.disable(device));
}

TEST_F(BluetoothDetectorTest, PowerToggleFailsWhenCommandCannotRun) {
    EXPECT_CALL(*runner, run(_, _))
        .WillOnce(Throw(error::CommandError("f", 1, "fn", "not found")));
    BluetoothDetector detector(backendsFor(system::Platform::Linux, runner));
    EXPECT_FALSE(detector.enable(
        makeDevice("hci0", DeviceType::Bluetooth, "Bluetooth")));
}

TEST_F(BluetoothDetectorTest, PowerToggleUnsupportedOffLinux) {
    BluetoothDetector detector(backendsFor(system::Platform::MacOS, runner));
    EXPECT_FALSE(detector.enable(
        makeDevice("hci0", DeviceType::Bluetooth, "Bluetooth")));
}

}  // namespace airmon::device::test
