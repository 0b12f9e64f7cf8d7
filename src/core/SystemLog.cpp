#include "SystemLog.hpp"
#include <syslog.h>

namespace usb_peripheral {
namespace SystemLog {

namespace {

int priority(int severity) {
    switch (severity) {
        case 0:  return LOG_DEBUG;
        case 1:  return LOG_INFO;
        case 2:  return LOG_WARNING;
        case 3:  return LOG_ERR;
        case 4:  return LOG_CRIT;
        default: return LOG_INFO;
    }
}

}

void open(const char* ident) {
    openlog(ident, LOG_PID, LOG_DAEMON);
}

void write(int severity, const std::string& line) {
    syslog(priority(severity), "%s", line.c_str());
}

void close() {
    closelog();
}

}
}
