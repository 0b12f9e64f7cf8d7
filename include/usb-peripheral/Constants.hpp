#pragma once

namespace usb_peripheral {

constexpr int SCAN_INTERVAL = 30000;          // ms
constexpr int GRACE_PERIOD = 10000;           // ms
constexpr int ATTRIBUTE_WALK_TIMEOUT = 5000;  // ms

constexpr int LOG_MAX_FILE_SIZE = 10 * 1024 * 1024;  // bytes
constexpr int LOG_MAX_AGE = 24 * 7;                  // hours

constexpr const char* SHARED_ROOT = "/srv/nuvlaedge/shared/";
constexpr const char* PERIPHERALS_FOLDER = ".peripherals/";
constexpr const char* PERIPHERAL_NAME = "usb";
constexpr const char* BUFFER_FOLDER = "buffer";
constexpr const char* VIDEO_DEVICES_DIR = "/dev/";
constexpr const char* ATTRIBUTE_WALK_COMMAND = "udevadm";

constexpr const char* DEVICE_INTERFACE = "USB";
constexpr const char* DEVICE_AVAILABLE = "True";
constexpr const char* UNNAMED_DEVICE = "UNNAMED USB Device";

// QDateTime format, month day year hour minute second
constexpr const char* FILE_TIMESTAMP_FORMAT = "MMddyyyyHHmmss";

namespace ErrorCodes {
    constexpr int SUCCESS = 0;
    constexpr int DEVICE_NOT_FOUND = -1;
    constexpr int ACCESS_DENIED = -2;
    constexpr int INVALID_PARAM = -3;
    constexpr int IO_ERROR = -4;
    constexpr int BUFFER_OVERFLOW = -5;
    constexpr int PIPE_ERROR = -6;
    constexpr int SYSTEM_ERROR = -7;
    constexpr int BUSY = -8;
    constexpr int NOT_SUPPORTED = -9;
    constexpr int TIMEOUT = -10;
}

const char* errorName(int code);

}
