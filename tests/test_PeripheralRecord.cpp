// tests/test_PeripheralRecord.cpp
#include <gtest/gtest.h>
#include "PeripheralRecord.hpp"
#include <QJsonArray>

namespace usb_peripheral {
namespace testing {

namespace {

PeripheralRecord minimalRecord(const std::string& identifier) {
    PeripheralRecord record;
    record.identifier = identifier;
    record.name = "UNNAMED USB Device with ID " + identifier;
    record.description = "USB device [] with ID " + identifier + ". Protocol: Hub";
    record.interface = "USB";
    record.available = "True";
    record.classes = {"Hub"};
    return record;
}

}

TEST(PeripheralRecordTest, IdentifierIsLowerCaseHex) {
    EXPECT_EQ(PeripheralRecord::makeIdentifier(0x046d, 0xc52b), "046d:c52b");
    EXPECT_EQ(PeripheralRecord::makeIdentifier(0x1, 0x2), "0001:0002");
    EXPECT_EQ(PeripheralRecord::makeIdentifier(0xFFFF, 0xABCD), "ffff:abcd");
}

TEST(PeripheralRecordTest, EmptyOptionalFieldsAreOmitted) {
    QJsonObject json = minimalRecord("1d6b:0002").toJson();

    EXPECT_FALSE(json.contains("vendor"));
    EXPECT_FALSE(json.contains("product"));
    EXPECT_FALSE(json.contains("device-path"));
    EXPECT_FALSE(json.contains("serial-number"));
    EXPECT_FALSE(json.contains("video-device"));

    EXPECT_EQ(json["identifier"].toString(), "1d6b:0002");
    EXPECT_EQ(json["interface"].toString(), "USB");
    EXPECT_EQ(json["available"].toString(), "True");
    EXPECT_EQ(json["classes"].toArray().size(), 1);
    EXPECT_EQ(json.size(), 6);
}

TEST(PeripheralRecordTest, PresentOptionalFieldsAreWritten) {
    PeripheralRecord record = minimalRecord("046d:0825");
    record.vendor = "Logitech, Inc.";
    record.product = "Webcam C270";
    record.devicePath = "/dev/bus/usb/001/005";
    record.serialNumber = "ABC123";
    record.videoDevice = "/dev/video0";

    QJsonObject json = record.toJson();
    EXPECT_EQ(json["vendor"].toString(), "Logitech, Inc.");
    EXPECT_EQ(json["product"].toString(), "Webcam C270");
    EXPECT_EQ(json["device-path"].toString(), "/dev/bus/usb/001/005");
    EXPECT_EQ(json["serial-number"].toString(), "ABC123");
    EXPECT_EQ(json["video-device"].toString(), "/dev/video0");
}

TEST(PeripheralRecordTest, ClassOrderIsPreserved) {
    PeripheralRecord record = minimalRecord("046d:0825");
    record.classes = {"Video", "Audio", "Human Interface Device"};

    QJsonArray classes = record.toJson()["classes"].toArray();
    ASSERT_EQ(classes.size(), 3);
    EXPECT_EQ(classes[0].toString(), "Video");
    EXPECT_EQ(classes[1].toString(), "Audio");
    EXPECT_EQ(classes[2].toString(), "Human Interface Device");
}

TEST(InventorySnapshotTest, KeysMatchIdentifiers) {
    InventorySnapshot snapshot;
    snapshot.insert(minimalRecord("1d6b:0002"));
    snapshot.insert(minimalRecord("046d:c52b"));
    snapshot.insert(minimalRecord("0bda:8153"));

    ASSERT_EQ(snapshot.size(), 3u);
    for (const auto& [key, record] : snapshot.records()) {
        EXPECT_EQ(key, record.identifier);
    }

    QJsonObject json = snapshot.toJson();
    for (auto it = json.begin(); it != json.end(); ++it) {
        EXPECT_EQ(it.key(), it.value().toObject()["identifier"].toString());
    }
}

TEST(InventorySnapshotTest, SameIdentifierOverwritesEarlierRecord) {
    PeripheralRecord first = minimalRecord("0781:5567");
    first.devicePath = "/dev/bus/usb/001/002";
    PeripheralRecord second = minimalRecord("0781:5567");
    second.devicePath = "/dev/bus/usb/002/003";

    InventorySnapshot snapshot;
    snapshot.insert(first);
    snapshot.insert(second);

    ASSERT_EQ(snapshot.size(), 1u);
    ASSERT_TRUE(snapshot.contains("0781:5567"));
    EXPECT_EQ(snapshot.find("0781:5567")->devicePath, "/dev/bus/usb/002/003");
}

TEST(InventorySnapshotTest, EmptySnapshotSerializesToEmptyObject) {
    InventorySnapshot snapshot;
    EXPECT_TRUE(snapshot.empty());
    EXPECT_TRUE(snapshot.toJson().isEmpty());
    EXPECT_EQ(snapshot.find("0000:0000"), nullptr);
}

} // namespace testing
} // namespace usb_peripheral
