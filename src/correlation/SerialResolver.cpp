#include "SerialResolver.hpp"
#include "AttributeWalker.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>

namespace usb_peripheral {

namespace {

// Text between the first two double quotes, false when there is none
bool quotedValue(const std::string& line, std::string& value) {
    auto open = line.find('"');
    if (open == std::string::npos) {
        return false;
    }
    auto close = line.find('"', open + 1);
    if (close == std::string::npos) {
        value = line.substr(open + 1);
    } else {
        value = line.substr(open + 1, close - open - 1);
    }
    return true;
}

}

SerialResolver::SerialResolver(AttributeWalker& walker)
    : m_walker(walker) {
}

std::string SerialResolver::resolveSerialNumber(const std::string& devicePath) const {
    std::vector<std::string> lines;
    int ret = m_walker.walk(devicePath, lines);
    if (ret != ErrorCodes::SUCCESS) {
        LOG_WARNING("No serial number for " + devicePath + ": attribute walk failed (" +
                    errorName(ret) + ")");
        return "";
    }

    return parseSerialNumber(lines);
}

std::string SerialResolver::parseSerialNumber(const std::vector<std::string>& lines) {
    std::string fallback;

    for (const auto& line : lines) {
        if (line.find("serial") == std::string::npos) {
            continue;
        }

        std::string value;
        if (!quotedValue(line, value)) {
            continue;
        }

        if (line.find(".usb") != std::string::npos) {
            fallback = value;
            continue;
        }

        // an empty primary value still ends the scan
        return value.empty() ? fallback : value;
    }

    return fallback;
}

}
