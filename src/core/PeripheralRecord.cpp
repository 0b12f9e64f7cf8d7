#include "PeripheralRecord.hpp"
#include <QJsonArray>
#include <cstdio>

namespace usb_peripheral {

namespace {

void insertIfSet(QJsonObject& json, const char* key, const std::string& value) {
    if (!value.empty()) {
        json[key] = QString::fromStdString(value);
    }
}

}

QJsonObject PeripheralRecord::toJson() const {
    QJsonArray classList;
    for (const auto& className : classes) {
        classList.append(QString::fromStdString(className));
    }

    QJsonObject json;
    json["name"] = QString::fromStdString(name);
    json["description"] = QString::fromStdString(description);
    json["interface"] = QString::fromStdString(interface);
    json["identifier"] = QString::fromStdString(identifier);
    json["classes"] = classList;
    json["available"] = QString::fromStdString(available);

    insertIfSet(json, "vendor", vendor);
    insertIfSet(json, "product", product);
    insertIfSet(json, "device-path", devicePath);
    insertIfSet(json, "serial-number", serialNumber);
    insertIfSet(json, "video-device", videoDevice);

    return json;
}

std::string PeripheralRecord::makeIdentifier(uint16_t vendorId, uint16_t productId) {
    char buffer[10];
    snprintf(buffer, sizeof(buffer), "%04x:%04x", vendorId, productId);
    return buffer;
}

void InventorySnapshot::insert(PeripheralRecord record) {
    std::string key = record.identifier;
    m_records[key] = std::move(record);
}

bool InventorySnapshot::contains(const std::string& identifier) const {
    return m_records.find(identifier) != m_records.end();
}

const PeripheralRecord* InventorySnapshot::find(const std::string& identifier) const {
    auto it = m_records.find(identifier);
    return it != m_records.end() ? &it->second : nullptr;
}

QJsonObject InventorySnapshot::toJson() const {
    QJsonObject json;
    for (const auto& [identifier, record] : m_records) {
        json[QString::fromStdString(identifier)] = record.toJson();
    }
    return json;
}

}
