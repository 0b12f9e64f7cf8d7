#include "AttributeCorrelator.hpp"
#include "SerialResolver.hpp"
#include "UsbDevice.hpp"
#include "UsbIdDatabase.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QDir>
#include <QFileInfo>

namespace usb_peripheral {

AttributeCorrelator::AttributeCorrelator(const UsbIdDatabase& database,
                                         const SerialResolver& serials,
                                         std::string videoDevicesDir)
    : m_database(database)
    , m_serials(serials)
    , m_videoDevicesDir(std::move(videoDevicesDir)) {
}

int AttributeCorrelator::correlate(const DeviceDescriptor& device,
                                   PeripheralRecord& record) const {
    const DeviceIdentifier& id = device.identifier;

    record = PeripheralRecord{};
    record.identifier = PeripheralRecord::makeIdentifier(id.vendorId, id.productId);
    record.interface = DEVICE_INTERFACE;
    record.available = DEVICE_AVAILABLE;
    record.vendor = m_database.vendorName(id.vendorId);
    record.product = m_database.productName(id.vendorId, id.productId);
    record.devicePath = UsbDevice::devicePath(id.busNumber, id.deviceAddress);

    record.description = std::string(DEVICE_INTERFACE) + " device [" + record.product +
                         "] with ID " + record.identifier +
                         ". Protocol: " + m_database.classify(device.code);

    if (!record.product.empty()) {
        record.name = record.product;
    } else {
        record.name = std::string(UNNAMED_DEVICE) + " with ID " + record.identifier;
    }

    record.classes = m_database.classes(device);
    record.serialNumber = m_serials.resolveSerialNumber(record.devicePath);

    return correlateVideoDevice(record.serialNumber, record.videoDevice);
}

int AttributeCorrelator::correlateVideoDevice(const std::string& serialNumber,
                                              std::string& videoDevice) const {
    videoDevice.clear();

    const QString dirPath = QString::fromStdString(m_videoDevicesDir);
    QFileInfo dirInfo(dirPath);
    if (!dirInfo.isDir() || !dirInfo.isReadable()) {
        LOG_ERROR("Unable to read files under " + m_videoDevicesDir);
        return ErrorCodes::IO_ERROR;
    }

    // Nodes without a serial would all match each other
    if (serialNumber.empty()) {
        return ErrorCodes::SUCCESS;
    }

    QDir dir(dirPath);
    const QStringList nodes = dir.entryList(
        QStringList() << "video*",
        QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot | QDir::CaseSensitive,
        QDir::Name);

    for (const QString& node : nodes) {
        const std::string nodePath = QDir::cleanPath(dir.filePath(node)).toStdString();
        if (m_serials.resolveSerialNumber(nodePath) == serialNumber) {
            LOG_DEBUG("Serial " + serialNumber + " matches video node " + nodePath);
            videoDevice = nodePath;
            break;
        }
    }

    return ErrorCodes::SUCCESS;
}

}
