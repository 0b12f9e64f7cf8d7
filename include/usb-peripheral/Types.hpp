#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace usb_peripheral {

struct DeviceIdentifier {
    uint16_t vendorId;
    uint16_t productId;
    uint8_t busNumber;
    uint8_t deviceAddress;
};

// Class triple as found in device and interface descriptors
struct ClassCode {
    uint8_t classCode{0};
    uint8_t subClass{0};
    uint8_t protocol{0};
};

struct AltSettingDescriptor {
    uint8_t number{0};
    ClassCode code;
};

struct InterfaceDescriptor {
    uint8_t number{0};
    std::vector<AltSettingDescriptor> altSettings;
};

struct ConfigDescriptor {
    uint8_t value{0};
    std::vector<InterfaceDescriptor> interfaces;
};

// Everything the enumerator reads from one attached device
struct DeviceDescriptor {
    DeviceIdentifier identifier{};
    ClassCode code;
    std::vector<ConfigDescriptor> configs;
};

enum class DeviceClass {
    Unspecified = 0x00,
    Audio = 0x01,
    CDC = 0x02,
    HID = 0x03,
    Physical = 0x05,
    Image = 0x06,
    Printer = 0x07,
    MassStorage = 0x08,
    Hub = 0x09,
    CDC_Data = 0x0A,
    SmartCard = 0x0B,
    ContentSecurity = 0x0D,
    Video = 0x0E,
    PersonalHealthcare = 0x0F,
    AudioVideo = 0x10,
    Billboard = 0x11,
    TypeCBridge = 0x12,
    Diagnostic = 0xDC,
    Wireless = 0xE0,
    Miscellaneous = 0xEF,
    ApplicationSpecific = 0xFE,
    VendorSpecific = 0xFF
};

}
