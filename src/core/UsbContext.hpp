#pragma once
#include <memory>

struct libusb_context;

namespace usb_peripheral {

// Owns the process-wide libusb context. Acquired once at startup and
// released when the owner goes away.
class UsbContext {
public:
    UsbContext();
    ~UsbContext();

    UsbContext(const UsbContext&) = delete;
    UsbContext& operator=(const UsbContext&) = delete;

    // Returns ErrorCodes::SUCCESS, or the translated libusb_init failure.
    // Calling it again after a success is a no-op.
    int acquire();
    void release();
    bool isAcquired() const;

    libusb_context* native() const;

    // Maps LIBUSB_ERROR_* onto ErrorCodes
    static int translateError(int libusbError);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
