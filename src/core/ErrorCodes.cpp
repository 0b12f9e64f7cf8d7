#include <usb-peripheral/Constants.hpp>

namespace usb_peripheral {

const char* errorName(int code) {
    switch (code) {
        case ErrorCodes::SUCCESS:          return "SUCCESS";
        case ErrorCodes::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
        case ErrorCodes::ACCESS_DENIED:    return "ACCESS_DENIED";
        case ErrorCodes::INVALID_PARAM:    return "INVALID_PARAM";
        case ErrorCodes::IO_ERROR:         return "IO_ERROR";
        case ErrorCodes::BUFFER_OVERFLOW:  return "BUFFER_OVERFLOW";
        case ErrorCodes::PIPE_ERROR:       return "PIPE_ERROR";
        case ErrorCodes::SYSTEM_ERROR:     return "SYSTEM_ERROR";
        case ErrorCodes::BUSY:             return "BUSY";
        case ErrorCodes::NOT_SUPPORTED:    return "NOT_SUPPORTED";
        case ErrorCodes::TIMEOUT:          return "TIMEOUT";
        default:                           return "UNKNOWN";
    }
}

}
