#pragma once
#include "DeviceSource.hpp"
#include "AttributeWalker.hpp"
#include <usb-peripheral/Constants.hpp>
#include <usb-peripheral/Types.hpp>
#include <map>
#include <string>
#include <vector>

namespace usb_peripheral {
namespace testing {

class FakeDeviceSource : public DeviceSource {
public:
    int acquireResult{ErrorCodes::SUCCESS};
    int enumerateResult{ErrorCodes::SUCCESS};
    std::vector<DeviceDescriptor> devices;
    int acquireCalls{0};
    int enumerateCalls{0};
    int releaseCalls{0};

    int acquire() override {
        ++acquireCalls;
        return acquireResult;
    }

    void release() override {
        ++releaseCalls;
    }

    int enumerate(std::vector<DeviceDescriptor>& out) override {
        ++enumerateCalls;
        out = devices;
        return enumerateResult;
    }
};

// Canned attribute walks per device path; unknown paths produce no lines
class FakeAttributeWalker : public AttributeWalker {
public:
    std::map<std::string, std::vector<std::string>> outputs;
    int failWith{ErrorCodes::SUCCESS};
    std::vector<std::string> calls;

    int walk(const std::string& devicePath,
             std::vector<std::string>& lines) override {
        calls.push_back(devicePath);
        lines.clear();
        if (failWith != ErrorCodes::SUCCESS) {
            return failWith;
        }
        auto it = outputs.find(devicePath);
        if (it != outputs.end()) {
            lines = it->second;
        }
        return ErrorCodes::SUCCESS;
    }
};

inline DeviceDescriptor makeDevice(uint16_t vendorId, uint16_t productId,
                                   uint8_t bus, uint8_t address,
                                   std::vector<uint8_t> interfaceClasses = {}) {
    DeviceDescriptor device;
    device.identifier.vendorId = vendorId;
    device.identifier.productId = productId;
    device.identifier.busNumber = bus;
    device.identifier.deviceAddress = address;

    ConfigDescriptor config;
    config.value = 1;
    uint8_t number = 0;
    for (uint8_t classCode : interfaceClasses) {
        InterfaceDescriptor intf;
        intf.number = number++;
        AltSettingDescriptor alt;
        alt.code.classCode = classCode;
        intf.altSettings.push_back(alt);
        config.interfaces.push_back(intf);
    }
    device.configs.push_back(config);
    return device;
}

inline std::vector<std::string> serialWalk(const std::string& serial) {
    return {
        "  looking at device '/devices/pci0000:00/0000:00:14.0/usb1/1-2':",
        "    KERNEL==\"1-2\"",
        "    SUBSYSTEM==\"usb\"",
        "    ATTRS{serial}==\"" + serial + "\"",
        ""
    };
}

}
}
