#pragma once
#include "DeviceSource.hpp"
#include <memory>

namespace usb_peripheral {

class UsbContext;

// libusb backed DeviceSource
class DeviceEnumerator : public DeviceSource {
public:
    DeviceEnumerator();
    ~DeviceEnumerator() override;

    int acquire() override;
    void release() override;
    int enumerate(std::vector<DeviceDescriptor>& devices) override;

    UsbContext& context() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
