#pragma once
#include <QObject>
#include <memory>
#include <string>
#include <variant>
#include <map>

namespace usb_peripheral {

using ConfigValue = std::variant<bool, int, double, std::string>;

namespace ConfigKeys {
    constexpr const char* SHARED_ROOT = "sharedRoot";
    constexpr const char* PERIPHERALS_FOLDER = "peripheralsFolder";
    constexpr const char* PERIPHERAL_NAME = "peripheralName";
    constexpr const char* SCAN_INTERVAL = "scanInterval";
    constexpr const char* GRACE_PERIOD = "gracePeriod";
    constexpr const char* VIDEO_DEVICES_DIR = "videoDevicesDir";
    constexpr const char* ATTRIBUTE_WALK_COMMAND = "attributeWalkCommand";
    constexpr const char* ATTRIBUTE_WALK_TIMEOUT = "attributeWalkTimeout";
    constexpr const char* USB_IDS_PATH = "usbIdsPath";
    constexpr const char* LOG_LEVEL = "logLevel";
    constexpr const char* LOG_FILE = "logFile";
    constexpr const char* LOG_MAX_FILE_SIZE = "logMaxFileSize";
    constexpr const char* LOG_MAX_AGE = "logMaxAge";
    constexpr const char* LOG_TIMESTAMPS = "logTimestamps";
    constexpr const char* LOG_SOURCE_INFO = "logSourceInfo";
}

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    // Configuration access
    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& key, int value);
    void setString(const std::string& key, const std::string& value);

    // File operations
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    // Applies USB_PERIPHERAL_* variables on top of the current values,
    // returns the number of keys overridden
    int loadFromEnvironment();

    // Default settings
    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
