#include "DeviceEnumerator.hpp"
#include "UsbContext.hpp"
#include "UsbDevice.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <libusb-1.0/libusb.h>

namespace usb_peripheral {

class DeviceEnumerator::Private {
public:
    std::unique_ptr<UsbContext> context;
};

DeviceEnumerator::DeviceEnumerator()
    : d(std::make_unique<Private>()) {
    d->context = std::make_unique<UsbContext>();
}

DeviceEnumerator::~DeviceEnumerator() = default;

int DeviceEnumerator::acquire() {
    return d->context->acquire();
}

void DeviceEnumerator::release() {
    d->context->release();
}

UsbContext& DeviceEnumerator::context() const {
    return *d->context;
}

int DeviceEnumerator::enumerate(std::vector<DeviceDescriptor>& devices) {
    devices.clear();

    if (!d->context->isAcquired()) {
        return ErrorCodes::NOT_SUPPORTED;
    }

    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(d->context->native(), &list);

    if (count < 0) {
        LOG_ERROR("Failed to get device list: " +
                  std::string(libusb_error_name(static_cast<int>(count))));
        return UsbContext::translateError(static_cast<int>(count));
    }

    devices.reserve(static_cast<size_t>(count));
    for (ssize_t i = 0; i < count; i++) {
        UsbDevice device(list[i]);

        DeviceDescriptor descriptor;
        if (device.readDescriptor(descriptor) != ErrorCodes::SUCCESS) {
            LOG_WARNING("Skipping " + device.devicePath() +
                        ": device descriptor unavailable");
            continue;
        }

        devices.push_back(std::move(descriptor));
    }

    libusb_free_device_list(list, 1);

    LOG_DEBUG("Enumerated " + std::to_string(devices.size()) + " USB devices");
    return ErrorCodes::SUCCESS;
}

} // namespace usb_peripheral
