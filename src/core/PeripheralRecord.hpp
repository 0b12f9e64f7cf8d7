#pragma once
#include <QJsonObject>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace usb_peripheral {

// One discovered USB device as published in the inventory file.
// Optional fields are left empty when unknown and are then omitted
// from the JSON form.
struct PeripheralRecord {
    std::string identifier;
    std::string name;
    std::string description;
    std::string interface;
    std::vector<std::string> classes;
    std::string available;

    std::string vendor;
    std::string product;
    std::string devicePath;
    std::string serialNumber;
    std::string videoDevice;

    QJsonObject toJson() const;

    // "vvvv:pppp" in lower case hex
    static std::string makeIdentifier(uint16_t vendorId, uint16_t productId);
};

// All records of one enumeration pass keyed by identifier. A record whose
// identifier is already present replaces the previous one.
class InventorySnapshot {
public:
    void insert(PeripheralRecord record);

    bool contains(const std::string& identifier) const;
    const PeripheralRecord* find(const std::string& identifier) const;
    size_t size() const { return m_records.size(); }
    bool empty() const { return m_records.empty(); }

    const std::map<std::string, PeripheralRecord>& records() const { return m_records; }

    QJsonObject toJson() const;

private:
    std::map<std::string, PeripheralRecord> m_records;
};

}
