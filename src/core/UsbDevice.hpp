#pragma once
#include <usb-peripheral/Types.hpp>
#include <libusb-1.0/libusb.h>
#include <memory>
#include <string>

namespace usb_peripheral {

// Reads identifying data and the descriptor tree of one libusb device.
// The device is never opened, everything comes from cached descriptors.
class UsbDevice {
public:
    explicit UsbDevice(libusb_device* device);
    ~UsbDevice();

    UsbDevice(const UsbDevice&) = delete;
    UsbDevice& operator=(const UsbDevice&) = delete;

    bool isValid() const;
    DeviceIdentifier identifier() const;
    ClassCode classCode() const;

    // /dev/bus/usb/BBB/AAA
    std::string devicePath() const;

    // Fills out with the identifier, class code and every configuration
    // that could be read. Returns an ErrorCodes value.
    int readDescriptor(DeviceDescriptor& out) const;

    static std::string devicePath(uint8_t busNumber, uint8_t deviceAddress);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
