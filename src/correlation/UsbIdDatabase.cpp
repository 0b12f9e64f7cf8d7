#include "UsbIdDatabase.hpp"
#include "Logger.hpp"
#include <QFile>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <cstdio>
#include <set>

namespace usb_peripheral {

namespace {

struct SubClassEntry {
    std::string name;
    std::map<uint8_t, std::string> protocols;
};

struct ClassEntry {
    std::string name;
    std::map<uint8_t, SubClassEntry> subClasses;
};

struct VendorEntry {
    std::string name;
    std::map<uint16_t, std::string> products;
};

const char* const DEFAULT_LOCATIONS[] = {
    "/usr/share/hwdata/usb.ids",
    "/usr/share/misc/usb.ids",
    "/usr/share/usb.ids",
    "/var/lib/usbutils/usb.ids"
};

const std::pair<DeviceClass, const char*> BUILTIN_CLASSES[] = {
    {DeviceClass::Unspecified,         "(Defined at Interface level)"},
    {DeviceClass::Audio,               "Audio"},
    {DeviceClass::CDC,                 "Communications"},
    {DeviceClass::HID,                 "Human Interface Device"},
    {DeviceClass::Physical,            "Physical Interface Device"},
    {DeviceClass::Image,               "Imaging"},
    {DeviceClass::Printer,             "Printer"},
    {DeviceClass::MassStorage,         "Mass Storage"},
    {DeviceClass::Hub,                 "Hub"},
    {DeviceClass::CDC_Data,            "CDC Data"},
    {DeviceClass::SmartCard,           "Chip/SmartCard"},
    {DeviceClass::ContentSecurity,     "Content Security"},
    {DeviceClass::Video,               "Video"},
    {DeviceClass::PersonalHealthcare,  "Personal Healthcare"},
    {DeviceClass::AudioVideo,          "Audio/Video"},
    {DeviceClass::Billboard,           "Billboard"},
    {DeviceClass::TypeCBridge,         "Type-C Bridge"},
    {DeviceClass::Diagnostic,          "Diagnostic"},
    {DeviceClass::Wireless,            "Wireless"},
    {DeviceClass::Miscellaneous,       "Miscellaneous Device"},
    {DeviceClass::ApplicationSpecific, "Application Specific Interface"},
    {DeviceClass::VendorSpecific,      "Vendor Specific Class"}
};

bool isHexToken(const QString& token, int length) {
    if (token.size() != length) {
        return false;
    }
    for (const QChar c : token) {
        const ushort u = c.toLower().unicode();
        if (!((u >= '0' && u <= '9') || (u >= 'a' && u <= 'f'))) {
            return false;
        }
    }
    return true;
}

// "<id>  <name>" with arbitrary whitespace in between
bool splitEntry(const QString& text, int idLength, unsigned& id, std::string& name) {
    const QString trimmed = text.trimmed();
    static const QRegularExpression whitespace("\\s");
    const int space = trimmed.indexOf(whitespace);
    const QString token = space < 0 ? trimmed : trimmed.left(space);
    if (!isHexToken(token, idLength)) {
        return false;
    }

    bool ok = false;
    id = token.toUInt(&ok, 16);
    name = space < 0 ? std::string() : trimmed.mid(space).trimmed().toStdString();
    return ok;
}

std::string hexByte(uint8_t value) {
    char buffer[3];
    std::snprintf(buffer, sizeof(buffer), "%02x", value);
    return buffer;
}

}

class UsbIdDatabase::Private {
public:
    enum class Section { None, Vendor, Class };

    std::map<uint16_t, VendorEntry> vendors;
    std::map<uint8_t, ClassEntry> classes;

    void setBuiltinClasses() {
        for (const auto& [code, name] : BUILTIN_CLASSES) {
            classes[static_cast<uint8_t>(code)].name = name;
        }
    }

    void parse(const QString& contents) {
        Section section = Section::None;
        VendorEntry* vendor = nullptr;
        ClassEntry* klass = nullptr;
        SubClassEntry* subClass = nullptr;

        const QStringList lines = contents.split('\n');
        for (QString line : lines) {
            if (line.endsWith('\r')) {
                line.chop(1);
            }
            if (line.trimmed().isEmpty() || line.startsWith('#')) {
                continue;
            }

            unsigned id = 0;
            std::string name;

            if (line.startsWith("\t\t")) {
                // vendor sections nest interfaces here, only protocols matter
                if (section == Section::Class && subClass &&
                    splitEntry(line, 2, id, name)) {
                    subClass->protocols[static_cast<uint8_t>(id)] = name;
                }
            } else if (line.startsWith('\t')) {
                if (section == Section::Vendor && vendor &&
                    splitEntry(line, 4, id, name)) {
                    vendor->products[static_cast<uint16_t>(id)] = name;
                } else if (section == Section::Class && klass &&
                           splitEntry(line, 2, id, name)) {
                    subClass = &klass->subClasses[static_cast<uint8_t>(id)];
                    subClass->name = name;
                }
            } else if (splitEntry(line, 4, id, name)) {
                section = Section::Vendor;
                vendor = &vendors[static_cast<uint16_t>(id)];
                vendor->name = name;
            } else if (line.startsWith("C ") && splitEntry(line.mid(2), 2, id, name)) {
                section = Section::Class;
                klass = &classes[static_cast<uint8_t>(id)];
                klass->name = name;
                subClass = nullptr;
            } else {
                // AT, HID, R, BIAS, PHY, HUT, L, HCC, VT: not used
                section = Section::None;
                vendor = nullptr;
                klass = nullptr;
                subClass = nullptr;
            }
        }
    }
};

UsbIdDatabase::UsbIdDatabase()
    : d(std::make_unique<Private>()) {
    d->setBuiltinClasses();
}

UsbIdDatabase::~UsbIdDatabase() = default;
UsbIdDatabase::UsbIdDatabase(UsbIdDatabase&&) noexcept = default;
UsbIdDatabase& UsbIdDatabase::operator=(UsbIdDatabase&&) noexcept = default;

bool UsbIdDatabase::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("Unable to open USB ID database " + filename + ": " +
                    file.errorString().toStdString());
        return false;
    }

    d->parse(QString::fromUtf8(file.readAll()));
    LOG_INFO("Loaded " + std::to_string(d->vendors.size()) +
             " USB vendors from " + filename);
    return true;
}

bool UsbIdDatabase::loadFromString(const std::string& contents) {
    d->parse(QString::fromStdString(contents));
    return true;
}

std::string UsbIdDatabase::defaultPath() {
    if (QFile::exists(EMBEDDED_PATH)) {
        return EMBEDDED_PATH;
    }
    for (const char* location : DEFAULT_LOCATIONS) {
        if (QFile::exists(location)) {
            return location;
        }
    }
    return "";
}

std::string UsbIdDatabase::vendorName(uint16_t vendorId) const {
    auto it = d->vendors.find(vendorId);
    return it != d->vendors.end() ? it->second.name : std::string();
}

std::string UsbIdDatabase::productName(uint16_t vendorId, uint16_t productId) const {
    auto vendor = d->vendors.find(vendorId);
    if (vendor == d->vendors.end()) {
        return "";
    }
    auto product = vendor->second.products.find(productId);
    return product != vendor->second.products.end() ? product->second : std::string();
}

std::string UsbIdDatabase::className(uint8_t classCode) const {
    auto it = d->classes.find(classCode);
    return it != d->classes.end() ? it->second.name : std::string();
}

std::string UsbIdDatabase::classify(const ClassCode& code) const {
    auto klass = d->classes.find(code.classCode);
    if (klass == d->classes.end()) {
        return "Unknown " + hexByte(code.classCode) + "." +
               hexByte(code.subClass) + "." + hexByte(code.protocol);
    }

    auto sub = klass->second.subClasses.find(code.subClass);
    if (sub == klass->second.subClasses.end()) {
        return klass->second.name;
    }

    auto protocol = sub->second.protocols.find(code.protocol);
    if (protocol == sub->second.protocols.end()) {
        return klass->second.name + " (" + sub->second.name + ")";
    }

    return klass->second.name + " (" + sub->second.name + ") " + protocol->second;
}

std::vector<std::string> UsbIdDatabase::classes(const DeviceDescriptor& device) const {
    std::vector<std::string> result;
    std::set<std::string> seen;

    for (const auto& config : device.configs) {
        for (const auto& intf : config.interfaces) {
            for (const auto& alt : intf.altSettings) {
                std::string name = className(alt.code.classCode);
                if (name.empty()) {
                    name = "Unknown class " + hexByte(alt.code.classCode);
                }
                if (seen.insert(name).second) {
                    result.push_back(name);
                }
            }
        }
    }

    return result;
}

size_t UsbIdDatabase::vendorCount() const {
    return d->vendors.size();
}

}
