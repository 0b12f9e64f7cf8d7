#pragma once
#include <usb-peripheral/Types.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace usb_peripheral {

// Vendor, product and class names in the usb.ids format maintained by
// linux-usb.org. Class names for the standard codes are compiled in, so
// classification works without a database file.
class UsbIdDatabase {
public:
    UsbIdDatabase();
    ~UsbIdDatabase();

    UsbIdDatabase(UsbIdDatabase&&) noexcept;
    UsbIdDatabase& operator=(UsbIdDatabase&&) noexcept;

    // Merges the vendor and class sections of a usb.ids file
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& contents);

    // Copy compiled into the binary as a Qt resource
    static constexpr const char* EMBEDDED_PATH = ":/usb.ids";

    // The embedded copy, else the first existing hwdata location, else empty
    static std::string defaultPath();

    std::string vendorName(uint16_t vendorId) const;
    std::string productName(uint16_t vendorId, uint16_t productId) const;
    std::string className(uint8_t classCode) const;

    // "Class (SubClass) Protocol", shortened to what the database knows
    std::string classify(const ClassCode& code) const;

    // Class names of every configuration, interface and alt setting,
    // in order of first appearance without duplicates
    std::vector<std::string> classes(const DeviceDescriptor& device) const;

    size_t vendorCount() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
