#pragma once
#include <string>
#include <vector>

namespace usb_peripheral {

class AttributeWalker;

// Recovers a device serial number from its udev attribute walk.
//
// The first line mentioning "serial" wins, except lines that also mention
// ".usb": those belong to the host controller interface and are only used
// when no other serial shows up.
class SerialResolver {
public:
    explicit SerialResolver(AttributeWalker& walker);

    // Empty when nothing was found or the walk itself failed
    std::string resolveSerialNumber(const std::string& devicePath) const;

    static std::string parseSerialNumber(const std::vector<std::string>& lines);

private:
    AttributeWalker& m_walker;
};

}
