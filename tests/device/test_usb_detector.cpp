#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "airmon/device/classify.hpp"
#include "airmon/device/usb_detector.hpp"
#include "fakes.hpp"

namespace airmon::device::test {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

namespace fs = std::filesystem;

TEST(LsusbParserTest, UnifyingReceiverIsRfDongle) {
    auto devices = parseLsusbOutput(
        "Bus 001 Device 004: ID 046d:c52b Logitech, Inc. Unifying Receiver\n");
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].vendorId, "046d");
    EXPECT_EQ(devices[0].productId, "c52b");
    EXPECT_EQ(devices[0].deviceType, DeviceType::RFDongle);
    EXPECT_EQ(devices[0].name, "Logitech, Inc. Unifying Receiver");
    EXPECT_EQ(devices[0].interface, "USB (Bus 001, Device 004)");
    EXPECT_EQ(devices[0].status, DeviceStatus::Connected);
    EXPECT_EQ(devices[0].info("detection_method"), "lsusb");
}

TEST(LsusbParserTest, FiltersByKeywordAndSkipsMalformedIds) {
    auto devices = parseLsusbOutput(
        "Bus 001 Device 001: ID 1d6b:0002 Linux Foundation 2.0 root hub\n"
        "Bus 002 Device 003: ID 0bda:8179 Realtek 802.11n Wireless LAN\n"
        "Bus 002 Device 005: ID zzzz Broken wireless thing\n"
        "Bus 003 Device 002: ID 8087:0a2b Intel Corp. Bluetooth wireless interface\n"
        "short line\n");
    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].deviceType, DeviceType::WiFiAdapter);
    EXPECT_EQ(devices[0].vendorId, "0bda");
    // The name-based classifier has no Bluetooth branch.
    EXPECT_EQ(devices[1].deviceType, DeviceType::UnknownWireless);
}

TEST(SystemProfilerUsbTest, EmitsRecordAtVendorLine) {
    const char* output =
        "USB:\n"
        "    USB 3.1 Bus:\n"
        "        Wireless Dongle:\n"
        "          Product ID: 0x1234\n"
        "          Vendor ID: 0x046d  (Logitech Inc.)\n"
        "        Keyboard:\n"
        "          Product ID: 0x0001\n"
        "          Vendor ID: 0x05ac\n";
    auto devices = parseSystemProfilerUsb(output);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].name, "Wireless Dongle");
    EXPECT_EQ(devices[0].deviceType, DeviceType::RFDongle);
    EXPECT_EQ(devices[0].productId, "0x1234");
    EXPECT_EQ(devices[0].vendorId, "0x046d  (Logitech Inc.)");
    EXPECT_EQ(devices[0].info("detection_method"), "system_profiler");
}

TEST(EnumeratedUsbRecordTest, DescribesKnownVendorDevice) {
    FakeUsbBackend backend;
    UsbDeviceInfo info;
    info.vendorId = 0x046d;
    info.productId = 0xc52b;
    info.bus = 1;
    info.address = 4;
    info.product = "USB Receiver";

    auto device = makeEnumeratedUsbRecord(backend, info);
    EXPECT_EQ(device.name, "Logitech USB Receiver");
    EXPECT_EQ(device.deviceType, DeviceType::RFDongle);
    EXPECT_EQ(device.interface, "USB (Bus 1, Device 4)");
    EXPECT_EQ(device.vendorId, "046d");
    EXPECT_EQ(device.productId, "c52b");
    EXPECT_EQ(device.status, DeviceStatus::Connected);
    EXPECT_EQ(std::get<std::int64_t>(device.additionalInfo.at("bus")), 1);
    EXPECT_EQ(std::get<std::int64_t>(device.additionalInfo.at("address")), 4);
    EXPECT_EQ(device.info("vendor_name"), "Logitech");
    EXPECT_EQ(device.info("detection_method"), "fake");
}

TEST(EnumeratedUsbRecordTest, MissingProductStringFallsBackToIds) {
    FakeUsbBackend backend;
    backend.throwOnProduct = true;
    UsbDeviceInfo info;
    info.vendorId = 0x1234;
    info.productId = 0x00ab;
    info.deviceClass = USB_CLASS_HID;

    auto device = makeEnumeratedUsbRecord(backend, info);
    EXPECT_EQ(device.name, "Unknown USB Device 1234:00ab");
    EXPECT_EQ(device.deviceType, DeviceType::RFDongle);
}

TEST(EnumeratedUsbRecordTest, UnexpectedFailureYieldsErrorRecord) {
    FakeUsbBackend backend;
    backend.throwRuntimeOnProduct = true;
    UsbDeviceInfo info;
    info.vendorId = 0x046d;

    auto device = makeEnumeratedUsbRecord(backend, info);
    EXPECT_EQ(device.name, "Unknown USB Wireless Device");
    EXPECT_EQ(device.deviceType, DeviceType::UnknownWireless);
    EXPECT_EQ(device.status, DeviceStatus::Unknown);
    EXPECT_TRUE(device.info("error").has_value());
}

class UsbDetectorTest : public ::testing::Test {
protected:
    std::shared_ptr<StrictMock<MockCommandRunner>> runner =
        std::make_shared<StrictMock<MockCommandRunner>>();
    std::shared_ptr<FakeUsbBackend> usb = std::make_shared<FakeUsbBackend>();

    auto detector(system::Platform platform, bool withBackend = true)
        -> UsbWirelessDetector {
        auto backends = backendsFor(platform, runner);
        if (withBackend) {
            backends.usb = usb;
        }
        return UsbWirelessDetector(backends);
    }
};

TEST_F(UsbDetectorTest, BackendPathKeepsOnlyWirelessCandidates) {
    UsbDeviceInfo dongle;
    dongle.vendorId = 0x046d;
    dongle.product = "Nano Receiver";
    UsbDeviceInfo storage;
    storage.vendorId = 0x0781;
    storage.deviceClass = 8;
    storage.interfaceClasses = {8};
    UsbDeviceInfo radio;
    radio.vendorId = 0x2c7c;
    radio.interfaceClasses = {USB_CLASS_WIRELESS_CONTROLLER};
    radio.product = "BT Audio Headset";
    usb->devices = {dongle, storage, radio};

    auto devices = detector(system::Platform::Linux).detect();
    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].deviceType, DeviceType::RFDongle);
    EXPECT_EQ(devices[1].name, "Unknown BT Audio Headset");
    EXPECT_EQ(devices[1].deviceType, DeviceType::WirelessAudio);
}

TEST_F(UsbDetectorTest, ScanEnumeratesOnceAndReadsOnlyCandidates) {
    std::vector<UsbDeviceInfo> attached;
    for (int i = 0; i < 6; ++i) {
        UsbDeviceInfo info;
        info.bus = 1;
        info.address = i + 1;
        info.vendorId = (i % 2 == 0) ? 0x046d : 0x0781;
        info.deviceClass = (i % 2 == 0) ? 0 : 8;
        info.interfaceClasses = {static_cast<std::uint8_t>(i % 2 == 0 ? 3 : 8)};
        info.product = "Receiver " + std::to_string(i);
        attached.push_back(info);
    }
    usb->devices = attached;

    auto devices = detector(system::Platform::Linux).detect();
    EXPECT_EQ(devices.size(), 3U);
    EXPECT_EQ(usb->listCalls, 1);
    EXPECT_EQ(usb->productCalls, 3);
}

TEST_F(UsbDetectorTest, BackendFailureFallsBackToLsusb) {
    usb->throwOnList = true;
    EXPECT_CALL(*runner, run(ElementsAre("lsusb"), _))
        .WillOnce(Return(ok(
            "Bus 001 Device 004: ID 046d:c52b Logitech, Inc. Unifying Receiver\n")));

    auto devices = detector(system::Platform::Linux).detect();
    EXPECT_EQ(usb->listCalls, 1);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].info("detection_method"), "lsusb");
}

TEST_F(UsbDetectorTest, NoBackendUsesPlatformFallback) {
    EXPECT_CALL(*runner, run(ElementsAre("system_profiler", "SPUSBDataType"), _))
        .WillOnce(Return(failed()));
    EXPECT_TRUE(detector(system::Platform::MacOS, false).detect().empty());
}

TEST_F(UsbDetectorTest, WindowsFallbackFiltersDependentNames) {
    auto wmi = std::make_shared<FakeWmiService>();
    wmi->usbNames = {"USB Composite Device", "Wireless Adapter 802.11ac",
                     "", "Bluetooth Dongle"};
    auto backends = backendsFor(system::Platform::Windows, runner);
    backends.wmi = wmi;
    UsbWirelessDetector usbDetector(backends);

    auto devices = usbDetector.detect();
    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].deviceType, DeviceType::WiFiAdapter);
    EXPECT_EQ(devices[1].deviceType, DeviceType::RFDongle);
    EXPECT_EQ(devices[1].info("detection_method"), "WMI");
}

TEST_F(UsbDetectorTest, CanManageDonglesAndAdaptersButNeverToggles) {
    auto usbDetector = detector(system::Platform::Linux);
    auto dongle = makeDevice("d", DeviceType::RFDongle, "USB");
    EXPECT_TRUE(usbDetector.canManage(dongle));
    EXPECT_TRUE(usbDetector.canManage(
        makeDevice("w", DeviceType::WiFiAdapter, "USB")));
    EXPECT_FALSE(usbDetector.canManage(
        makeDevice("b", DeviceType::Bluetooth, "USB")));
    EXPECT_FALSE(usbDetector.enable(dongle));
    EXPECT_FALSE(usbDetector.disable(dongle));
}

class SysfsBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("airmon_sysfs_" + std::to_string(::testing::UnitTest::GetInstance()
                                                      ->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override { fs::remove_all(root_); }

    void write(const fs::path& file, const std::string& content) {
        fs::create_directories(file.parent_path());
        std::ofstream(file) << content << "\n";
    }

    fs::path root_;
};

TEST_F(SysfsBackendTest, ReadsDevicesAndInterfaceClasses) {
    write(root_ / "1-2" / "idVendor", "046d");
    write(root_ / "1-2" / "idProduct", "c52b");
    write(root_ / "1-2" / "bDeviceClass", "00");
    write(root_ / "1-2" / "busnum", "1");
    write(root_ / "1-2" / "devnum", "7");
    write(root_ / "1-2" / "product", "USB Receiver");
    write(root_ / "1-2" / "1-2:1.0" / "bInterfaceClass", "03");
    write(root_ / "1-2" / "1-2:1.1" / "bInterfaceClass", "e0");
    // Interface entries at the top level are ignored.
    write(root_ / "1-2:1.0" / "bInterfaceClass", "03");
    // Incomplete descriptors are skipped.
    write(root_ / "usb9" / "idVendor", "1d6b");

    SysfsUsbBackend backend(root_);
    auto devices = backend.listDevices();
    ASSERT_EQ(devices.size(), 1U);
    const auto& info = devices[0];
    EXPECT_EQ(info.vendorId, 0x046d);
    EXPECT_EQ(info.productId, 0xc52b);
    EXPECT_EQ(info.bus, 1);
    EXPECT_EQ(info.address, 7);
    EXPECT_THAT(info.interfaceClasses,
                ::testing::UnorderedElementsAre(3, 0xe0));
    EXPECT_EQ(backend.readProduct(info), "USB Receiver");
}

TEST_F(SysfsBackendTest, MissingRootThrows) {
    EXPECT_THROW(SysfsUsbBackend(root_ / "absent"), error::UsbBackendError);
}

TEST(UsbBackendSelectionTest, FirstWorkingFactoryWins) {
    int calls = 0;
    auto fake = std::make_shared<FakeUsbBackend>();
    std::vector<UsbBackendFactory> factories{
        [&]() -> std::shared_ptr<UsbBackend> {
            ++calls;
            THROW_USB_BACKEND_ERROR("libusb_init failed");
        },
        [&]() -> std::shared_ptr<UsbBackend> {
            ++calls;
            return nullptr;
        },
        [&]() -> std::shared_ptr<UsbBackend> {
            ++calls;
            return fake;
        },
        [&]() -> std::shared_ptr<UsbBackend> {
            ++calls;
            return std::make_shared<FakeUsbBackend>();
        },
    };
    EXPECT_EQ(selectUsbBackend(factories), fake);
    EXPECT_EQ(calls, 3);
}

TEST(UsbBackendSelectionTest, NoWorkingFactoryGivesNull) {
    std::vector<UsbBackendFactory> factories{
        []() -> std::shared_ptr<UsbBackend> { return nullptr; }};
    EXPECT_EQ(selectUsbBackend(factories), nullptr);
    EXPECT_EQ(selectUsbBackend({}), nullptr);
}

}  // namespace airmon::device::test
