#pragma once
#include <string>
#include <vector>

namespace usb_peripheral {

// Produces the udev attribute walk of a device node, one output line per
// entry. Returns an ErrorCodes value.
class AttributeWalker {
public:
    virtual ~AttributeWalker() = default;

    virtual int walk(const std::string& devicePath,
                     std::vector<std::string>& lines) = 0;
};

// Runs `<command> info --attribute-walk <path>` as a child process,
// killed once the timeout expires. A timeout <= 0 falls back to the default.
class UdevadmAttributeWalker : public AttributeWalker {
public:
    explicit UdevadmAttributeWalker(std::string command = "udevadm",
                                    int timeoutMs = 5000);

    int walk(const std::string& devicePath,
             std::vector<std::string>& lines) override;

    const std::string& command() const { return m_command; }
    int timeout() const { return m_timeoutMs; }

private:
    std::string m_command;
    int m_timeoutMs;
};

}
