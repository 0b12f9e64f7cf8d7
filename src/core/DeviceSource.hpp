#pragma once
#include <usb-peripheral/Types.hpp>
#include <vector>

namespace usb_peripheral {

// Seam between the discovery loop and the host USB stack
class DeviceSource {
public:
    virtual ~DeviceSource() = default;

    virtual int acquire() = 0;
    virtual void release() = 0;

    // Fills devices with every attached device. An error code means the
    // query failed, devices then holds whatever was read before the failure.
    virtual int enumerate(std::vector<DeviceDescriptor>& devices) = 0;
};

}
