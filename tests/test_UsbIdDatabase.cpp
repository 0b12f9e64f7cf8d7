// tests/test_UsbIdDatabase.cpp
#include <gtest/gtest.h>
#include "UsbIdDatabase.hpp"
#include "Fakes.hpp"
#include <QFile>

namespace usb_peripheral {
namespace testing {

namespace {

const char* const USB_IDS =
    "#\n"
    "#\tList of USB ID's\n"
    "#\n"
    "046d  Logitech, Inc.\n"
    "\tc52b  Unifying Receiver\n"
    "\t0825  Webcam C270\n"
    "\t\t00  Video Control\n"
    "1d6b  Linux Foundation\n"
    "\t0002  2.0 root hub\n"
    "\n"
    "# List of known device classes, subclasses and protocols\n"
    "C 03  Human Interface Device\n"
    "\t01  Boot Interface Subclass\n"
    "\t\t01  Keyboard\n"
    "\t\t02  Mouse\n"
    "C 09  Hub\n"
    "\t00  Unused\n"
    "\t\t00  Full speed (or root) hub\n"
    "\t\t03  USB 3.0 hub\n"
    "C 0e  Video\n"
    "\t01  Video Control\n"
    "\n"
    "AT 0409  English (United States)\n"
    "HID 21  HID\n"
    "R 00  None\n"
    "BIAS 0  Not applicable\n";

}

class UsbIdDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(database.loadFromString(USB_IDS));
    }

    UsbIdDatabase database;
};

TEST_F(UsbIdDatabaseTest, ResolvesVendorAndProduct) {
    EXPECT_EQ(database.vendorCount(), 2u);
    EXPECT_EQ(database.vendorName(0x046d), "Logitech, Inc.");
    EXPECT_EQ(database.productName(0x046d, 0xc52b), "Unifying Receiver");
    EXPECT_EQ(database.productName(0x046d, 0x0825), "Webcam C270");
    EXPECT_EQ(database.productName(0x1d6b, 0x0002), "2.0 root hub");
}

TEST_F(UsbIdDatabaseTest, UnknownVendorOrProductIsEmpty) {
    EXPECT_TRUE(database.vendorName(0xdead).empty());
    EXPECT_TRUE(database.productName(0xdead, 0xbeef).empty());
    EXPECT_TRUE(database.productName(0x046d, 0xffff).empty());
}

TEST_F(UsbIdDatabaseTest, TrailingSectionsDoNotLeakIntoVendors) {
    EXPECT_TRUE(database.vendorName(0x0409).empty());
    EXPECT_TRUE(database.productName(0x046d, 0x0021).empty());
}

TEST_F(UsbIdDatabaseTest, ClassifiesToDeepestKnownLevel) {
    EXPECT_EQ(database.classify({0x09, 0x00, 0x03}), "Hub (Unused) USB 3.0 hub");
    EXPECT_EQ(database.classify({0x03, 0x01, 0x07}), "Human Interface Device (Boot Interface Subclass)");
    EXPECT_EQ(database.classify({0x0e, 0x02, 0x00}), "Video");
    EXPECT_EQ(database.classify({0x42, 0x01, 0x02}), "Unknown 42.01.02");
}

TEST(UsbIdDatabaseBuiltinTest, ClassNamesWithoutDatabaseFile) {
    UsbIdDatabase database;

    EXPECT_EQ(database.vendorCount(), 0u);
    EXPECT_EQ(database.className(0x00), "(Defined at Interface level)");
    EXPECT_EQ(database.className(0x08), "Mass Storage");
    EXPECT_EQ(database.className(0xff), "Vendor Specific Class");
    EXPECT_TRUE(database.className(0x42).empty());
    EXPECT_EQ(database.classify({0x09, 0x00, 0x00}), "Hub");
}

TEST(UsbIdDatabaseBuiltinTest, ClassesAreOrderedAndDeduplicated) {
    UsbIdDatabase database;
    DeviceDescriptor device = makeDevice(0x046d, 0x0825, 1, 5, {0x0e, 0x0e, 0x01, 0x01, 0x0e});

    ConfigDescriptor second;
    InterfaceDescriptor intf;
    AltSettingDescriptor alt0;
    alt0.code.classCode = 0x03;
    AltSettingDescriptor alt1;
    alt1.number = 1;
    alt1.code.classCode = 0x01;
    intf.altSettings = {alt0, alt1};
    second.interfaces.push_back(intf);
    device.configs.push_back(second);

    std::vector<std::string> expected = {"Video", "Audio", "Human Interface Device"};
    EXPECT_EQ(database.classes(device), expected);
}

TEST(UsbIdDatabaseBuiltinTest, ClassificationIsRepeatable) {
    UsbIdDatabase database;
    DeviceDescriptor device = makeDevice(0x1234, 0x5678, 2, 3, {0xff, 0x08, 0x42, 0xff});

    auto first = database.classes(device);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(database.classes(device), first);
    }
    std::vector<std::string> expected = {"Vendor Specific Class", "Mass Storage", "Unknown class 42"};
    EXPECT_EQ(first, expected);
}

TEST(UsbIdDatabaseBuiltinTest, DeviceWithoutConfigurationsHasNoClasses) {
    UsbIdDatabase database;
    DeviceDescriptor device;
    EXPECT_TRUE(database.classes(device).empty());
}

TEST(UsbIdDatabaseBuiltinTest, MissingFileFailsToLoad) {
    UsbIdDatabase database;
    EXPECT_FALSE(database.loadFromFile("/nonexistent/usb.ids"));
    EXPECT_EQ(database.className(0x03), "Human Interface Device");
}

TEST(UsbIdDatabaseEmbeddedTest, CompiledInCopyIsTheDefault) {
    if (!QFile::exists(UsbIdDatabase::EMBEDDED_PATH)) {
        GTEST_SKIP() << "built without an embedded usb.ids";
    }

    EXPECT_EQ(UsbIdDatabase::defaultPath(), UsbIdDatabase::EMBEDDED_PATH);

    UsbIdDatabase database;
    ASSERT_TRUE(database.loadFromFile(UsbIdDatabase::defaultPath()));
    EXPECT_GT(database.vendorCount(), 1000u);
    EXPECT_EQ(database.vendorName(0x1d6b), "Linux Foundation");
    EXPECT_EQ(database.productName(0x1d6b, 0x0002), "2.0 root hub");
}

} // namespace testing
} // namespace usb_peripheral
