#include "UsbContext.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <libusb-1.0/libusb.h>

namespace usb_peripheral {

class UsbContext::Private {
public:
    libusb_context* context{nullptr};
};

UsbContext::UsbContext()
    : d(std::make_unique<Private>()) {
}

UsbContext::~UsbContext() {
    release();
}

int UsbContext::acquire() {
    if (d->context) {
        return ErrorCodes::SUCCESS;
    }

    int ret = libusb_init(&d->context);
    if (ret != LIBUSB_SUCCESS) {
        d->context = nullptr;
        LOG_DEBUG("libusb_init failed: " + std::string(libusb_error_name(ret)));
        return translateError(ret);
    }

    LOG_DEBUG("libusb context initialized");
    return ErrorCodes::SUCCESS;
}

void UsbContext::release() {
    // libusb_exit has no error path to report
    if (d->context) {
        libusb_exit(d->context);
        d->context = nullptr;
    }
}

bool UsbContext::isAcquired() const {
    return d->context != nullptr;
}

libusb_context* UsbContext::native() const {
    return d->context;
}

int UsbContext::translateError(int libusbError) {
    switch (libusbError) {
        case LIBUSB_SUCCESS:             return ErrorCodes::SUCCESS;
        case LIBUSB_ERROR_IO:            return ErrorCodes::IO_ERROR;
        case LIBUSB_ERROR_INVALID_PARAM: return ErrorCodes::INVALID_PARAM;
        case LIBUSB_ERROR_ACCESS:        return ErrorCodes::ACCESS_DENIED;
        case LIBUSB_ERROR_NO_DEVICE:
        case LIBUSB_ERROR_NOT_FOUND:     return ErrorCodes::DEVICE_NOT_FOUND;
        case LIBUSB_ERROR_BUSY:          return ErrorCodes::BUSY;
        case LIBUSB_ERROR_TIMEOUT:       return ErrorCodes::TIMEOUT;
        case LIBUSB_ERROR_OVERFLOW:      return ErrorCodes::BUFFER_OVERFLOW;
        case LIBUSB_ERROR_PIPE:          return ErrorCodes::PIPE_ERROR;
        case LIBUSB_ERROR_NOT_SUPPORTED: return ErrorCodes::NOT_SUPPORTED;
        default:                         return ErrorCodes::SYSTEM_ERROR;
    }
}

}
