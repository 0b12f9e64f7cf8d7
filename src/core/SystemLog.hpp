#pragma once
#include <string>

namespace usb_peripheral {

// syslog(3) access for the Logger. <syslog.h> defines LOG_DEBUG, LOG_INFO
// and LOG_WARNING, so it is only included by SystemLog.cpp.
namespace SystemLog {

// Severity follows LogLevel: 0 debug ... 4 critical
void open(const char* ident);
void write(int severity, const std::string& line);
void close();

}

}
