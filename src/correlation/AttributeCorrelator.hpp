#pragma once
#include "PeripheralRecord.hpp"
#include <usb-peripheral/Types.hpp>
#include <string>

namespace usb_peripheral {

class UsbIdDatabase;
class SerialResolver;

// Turns a raw device descriptor into a PeripheralRecord, adding names from
// the USB ID database, the udev serial number and the matching video node.
class AttributeCorrelator {
public:
    AttributeCorrelator(const UsbIdDatabase& database,
                        const SerialResolver& serials,
                        std::string videoDevicesDir);

    // ErrorCodes::SUCCESS, or IO_ERROR when the video device directory could
    // not be listed. In that case the record must not be published.
    int correlate(const DeviceDescriptor& device, PeripheralRecord& record) const;

    // Path of the first video* node under the video directory whose serial
    // equals serialNumber, empty when none matches
    int correlateVideoDevice(const std::string& serialNumber,
                             std::string& videoDevice) const;

    const std::string& videoDevicesDir() const { return m_videoDevicesDir; }

private:
    const UsbIdDatabase& m_database;
    const SerialResolver& m_serials;
    std::string m_videoDevicesDir;
};

}
