#include "UsbDevice.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <iomanip>
#include <sstream>

namespace usb_peripheral {

class UsbDevice::Private {
public:
    libusb_device* device{nullptr};
    libusb_device_descriptor descriptor{};
    DeviceIdentifier identifier{};
    bool valid{false};


    static ConfigDescriptor convertConfig(const libusb_config_descriptor* config) {
        ConfigDescriptor result;
        result.value = config->bConfigurationValue;

        for (int i = 0; i < config->bNumInterfaces; ++i) {
            const libusb_interface& intf = config->interface[i];

            InterfaceDescriptor interfaceDesc;
            for (int a = 0; a < intf.num_altsetting; ++a) {
                const libusb_interface_descriptor& alt = intf.altsetting[a];
                if (a == 0) {
                    interfaceDesc.number = alt.bInterfaceNumber;
                }

                AltSettingDescriptor altDesc;
                altDesc.number = alt.bAlternateSetting;
                altDesc.code.classCode = alt.bInterfaceClass;
                altDesc.code.subClass = alt.bInterfaceSubClass;
                altDesc.code.protocol = alt.bInterfaceProtocol;
                interfaceDesc.altSettings.push_back(altDesc);
            }

            result.interfaces.push_back(std::move(interfaceDesc));
        }

        return result;
    }
};

UsbDevice::UsbDevice(libusb_device* device)
    : d(std::make_unique<Private>()) {

    d->device = device;
    libusb_ref_device(device);

    // Location is known even when the descriptor is not
    d->identifier.busNumber = libusb_get_bus_number(device);
    d->identifier.deviceAddress = libusb_get_device_address(device);

    if (libusb_get_device_descriptor(device, &d->descriptor) == 0) {
        d->identifier.vendorId = d->descriptor.idVendor;
        d->identifier.productId = d->descriptor.idProduct;
        d->valid = true;
    }
}

UsbDevice::~UsbDevice() {
    if (d->device) {
        libusb_unref_device(d->device);
    }
}

bool UsbDevice::isValid() const {
    return d->valid;
}

DeviceIdentifier UsbDevice::identifier() const {
    return d->identifier;
}

ClassCode UsbDevice::classCode() const {
    ClassCode code;
    code.classCode = d->descriptor.bDeviceClass;
    code.subClass = d->descriptor.bDeviceSubClass;
    code.protocol = d->descriptor.bDeviceProtocol;
    return code;
}

std::string UsbDevice::devicePath() const {
    return devicePath(d->identifier.busNumber, d->identifier.deviceAddress);
}

std::string UsbDevice::devicePath(uint8_t busNumber, uint8_t deviceAddress) {
    std::stringstream ss;
    ss << "/dev/bus/usb/"
       << std::setw(3) << std::setfill('0') << static_cast<int>(busNumber) << "/"
       << std::setw(3) << std::setfill('0') << static_cast<int>(deviceAddress);
    return ss.str();
}

int UsbDevice::readDescriptor(DeviceDescriptor& out) const {
    if (!d->valid) {
        return ErrorCodes::IO_ERROR;
    }

    out.identifier = d->identifier;
    out.code = classCode();
    out.configs.clear();

    for (uint8_t i = 0; i < d->descriptor.bNumConfigurations; ++i) {
        libusb_config_descriptor* config = nullptr;
        int ret = libusb_get_config_descriptor(d->device, i, &config);
        if (ret != LIBUSB_SUCCESS) {
            LOG_WARNING("Unable to read configuration " + std::to_string(i) +
                        " of " + devicePath() + ": " + libusb_error_name(ret));
            continue;
        }

        out.configs.push_back(Private::convertConfig(config));
        libusb_free_config_descriptor(config);
    }

    return ErrorCodes::SUCCESS;
}

} // namespace usb_peripheral
