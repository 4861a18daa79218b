#include <gtest/gtest.h>

#include "airmon/device/classify.hpp"
#include "airmon/device/device_json.hpp"
#include "airmon/device/net_interfaces.hpp"
#include "airmon/device/wireless_device.hpp"
#include "fakes.hpp"

namespace airmon::device::test {

TEST(WirelessDeviceTest, MatchesOnNameTypeAndInterface) {
    auto a = makeDevice("hci0", DeviceType::Bluetooth, "Bluetooth Controller");
    auto b = a;
    b.status = DeviceStatus::Disabled;
    b.vendorId = "8087";
    EXPECT_TRUE(a.matches(b));

    b.interface = "other";
    EXPECT_FALSE(a.matches(b));
}

TEST(WirelessDeviceTest, MatchesOnSharedMacAlone) {
    auto a = makeDevice("one", DeviceType::Bluetooth, "x");
    auto b = makeDevice("two", DeviceType::WiFiAdapter, "y");
    EXPECT_FALSE(a.matches(b));
    a.macAddress = "AA:BB:CC:DD:EE:FF";
    EXPECT_FALSE(a.matches(b));
    b.macAddress = "AA:BB:CC:DD:EE:FF";
    EXPECT_TRUE(a.matches(b));
    EXPECT_TRUE(b.matches(a));
}

TEST(WirelessDeviceTest, DisplayNamesRoundTrip) {
    EXPECT_EQ(toString(DeviceType::RFDongle), "RF Dongle");
    EXPECT_EQ(toString(DeviceType::WiFiAdapter), "WiFi Adapter");
    EXPECT_EQ(toString(DeviceStatus::Discoverable), "Discoverable");
    EXPECT_EQ(deviceTypeFromString("Wireless Audio"), DeviceType::WirelessAudio);
    EXPECT_EQ(deviceStatusFromString("Paired"), DeviceStatus::Paired);
    EXPECT_FALSE(deviceTypeFromString("rf dongle").has_value());
}

TEST(WirelessDeviceTest, AttributesRenderAndLookup) {
    WirelessDevice device;
    device.additionalInfo["method"] = std::string("lsusb");
    device.additionalInfo["bus"] = std::int64_t{3};
    device.additionalInfo["ratio"] = 0.5;
    EXPECT_EQ(attributeToString(device.additionalInfo["bus"]), "3");
    EXPECT_EQ(attributeToString(device.additionalInfo["ratio"]), "0.5");
    EXPECT_EQ(device.info("method"), "lsusb");
    EXPECT_FALSE(device.info("bus").has_value());
    EXPECT_FALSE(device.info("missing").has_value());
}

TEST(ClassifyTest, EnumeratedClassifierOrder) {
    EXPECT_EQ(classifyEnumeratedUsb("Wireless Receiver"), DeviceType::RFDongle);
    EXPECT_EQ(classifyEnumeratedUsb("802.11ac NIC"), DeviceType::WiFiAdapter);
    EXPECT_EQ(classifyEnumeratedUsb("Bluetooth Radio"), DeviceType::Bluetooth);
    EXPECT_EQ(classifyEnumeratedUsb("Bluetooth Audio"), DeviceType::Bluetooth);
    EXPECT_EQ(classifyEnumeratedUsb("USB Headset"), DeviceType::WirelessAudio);
    EXPECT_EQ(classifyEnumeratedUsb("Mystery"), DeviceType::RFDongle);
}

TEST(ClassifyTest, NameClassifierHasNoBluetoothBranch) {
    EXPECT_EQ(classifyUsbByName("Bluetooth Radio"), DeviceType::UnknownWireless);
    EXPECT_EQ(classifyUsbByName("WLAN stick"), DeviceType::WiFiAdapter);
    EXPECT_EQ(classifyUsbByName("Unifying"), DeviceType::RFDongle);
    EXPECT_EQ(classifyUsbByName("speaker"), DeviceType::WirelessAudio);
}

TEST(ClassifyTest, Ieee80211MeansWifiUnlessReceiver) {
    for (const char* name : {"802.11n", "Realtek 802.11AC adapter",
                             "IEEE 802.11 WIRELESS", "x802.11y"}) {
        EXPECT_EQ(classifyEnumeratedUsb(name), DeviceType::WiFiAdapter) << name;
        EXPECT_EQ(classifyUsbByName(name), DeviceType::WiFiAdapter) << name;
    }
    EXPECT_EQ(classifyEnumeratedUsb("802.11 Dongle"), DeviceType::RFDongle);
}

TEST(ClassifyTest, WirelessCandidateRules) {
    const std::vector<std::uint8_t> none;
    const std::vector<std::uint8_t> hid{USB_CLASS_HID};
    const std::vector<std::uint8_t> radio{8, USB_CLASS_WIRELESS_CONTROLLER};
    const std::vector<std::uint8_t> storage{8};
    EXPECT_TRUE(isWirelessUsbCandidate(0x8087, 0xef, none));
    EXPECT_TRUE(isWirelessUsbCandidate(0x1111, USB_CLASS_HUB, none));
    EXPECT_TRUE(isWirelessUsbCandidate(0x1111, USB_CLASS_HID, none));
    EXPECT_TRUE(isWirelessUsbCandidate(0x1111, 0, hid));
    EXPECT_TRUE(isWirelessUsbCandidate(0x1111, 0, radio));
    EXPECT_FALSE(isWirelessUsbCandidate(0x1111, 0, storage));
    EXPECT_EQ(knownWirelessVendor(0x148f), "Ralink");
    EXPECT_FALSE(knownWirelessVendor(0x1d6b).has_value());
}

TEST(ClassifyTest, KeywordFilters) {
    EXPECT_TRUE(hasWirelessKeyword("Intel WiFi 6"));
    EXPECT_TRUE(hasWirelessKeyword("BLUETOOTH"));
    EXPECT_FALSE(hasWirelessKeyword("Unifying Receiver"));
    EXPECT_TRUE(namesRadioReceiver("Unifying Receiver"));
    EXPECT_TRUE(isWirelessInterfaceName("wlan0"));
    EXPECT_TRUE(isWirelessInterfaceName("wlp2s0"));
    EXPECT_FALSE(isWirelessInterfaceName("eth0"));
    EXPECT_FALSE(isWirelessInterfaceName("lo"));
    EXPECT_TRUE(isWirelessInterfaceName("WLAN1"));
    // Known false positive of the substring match.
    EXPECT_TRUE(isWirelessInterfaceName("ra0"));
}

TEST(NetInterfacesTest, FormatsMacUppercase) {
    const unsigned char bytes[] = {0x00, 0x1a, 0x2b, 0xc3, 0xd4, 0xef};
    EXPECT_EQ(formatMacAddress(bytes, sizeof(bytes)), "00:1A:2B:C3:D4:EF");
    EXPECT_EQ(formatMacAddress(bytes, 0), "");
}

TEST(DeviceJsonTest, SerializesWithNullOptionals) {
    auto device = makeDevice("Logitech USB Receiver", DeviceType::RFDongle,
                             "USB (Bus 1, Device 4)", DeviceStatus::Connected);
    device.vendorId = "046d";
    device.additionalInfo["bus"] = std::int64_t{1};
    device.additionalInfo["detection_method"] = std::string("libusb");

    nlohmann::json j = device;
    EXPECT_EQ(j["device_type"], "RF Dongle");
    EXPECT_EQ(j["status"], "Connected");
    EXPECT_EQ(j["vendor_id"], "046d");
    EXPECT_TRUE(j["mac_address"].is_null());
    EXPECT_TRUE(j["battery_level"].is_null());
    EXPECT_EQ(j["additional_info"]["bus"], 1);

    EXPECT_EQ(j.get<WirelessDevice>(), device);
}

TEST(DeviceJsonTest, StatisticsLayout) {
    DeviceStatistics stats;
    stats.totalDevices = 3;
    stats.byType[DeviceType::Bluetooth] = 2;
    stats.byType[DeviceType::WiFiAdapter] = 1;
    stats.byStatus[DeviceStatus::Paired] = 3;
    stats.manageable = 3;

    nlohmann::json j = stats;
    EXPECT_EQ(j["total_devices"], 3);
    EXPECT_EQ(j["by_type"]["Bluetooth"], 2);
    EXPECT_EQ(j["by_type"]["WiFi Adapter"], 1);
    EXPECT_EQ(j["by_status"].size(), 1U);
    EXPECT_EQ(j["manageable"], 3);
}

TEST(DeviceJsonTest, DescribesMissingBackendsAsNull) {
    DetectionBackends backends;
    backends.platform = system::Platform::Linux;
    backends.usb = std::make_shared<FakeUsbBackend>();
    auto j = describeBackends(backends);
    EXPECT_EQ(j["platform"], "Linux");
    EXPECT_EQ(j["usb"], "fake");
    EXPECT_TRUE(j["network"].is_null());
    EXPECT_EQ(j["wmi"], false);
}

}  // namespace airmon::device::test
