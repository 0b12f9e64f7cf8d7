#include "ConfigManager.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QByteArray>
#include <cmath>

namespace usb_peripheral {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

namespace {

enum class EnvType { Int, String };

struct EnvBinding {
    const char* variable;
    const char* key;
    EnvType type;
};

const EnvBinding ENV_BINDINGS[] = {
    {"USB_PERIPHERAL_SHARED_ROOT",   ConfigKeys::SHARED_ROOT,            EnvType::String},
    {"USB_PERIPHERAL_SCAN_INTERVAL", ConfigKeys::SCAN_INTERVAL,          EnvType::Int},
    {"USB_PERIPHERAL_VIDEO_DIR",     ConfigKeys::VIDEO_DEVICES_DIR,      EnvType::String},
    {"USB_PERIPHERAL_UDEVADM",       ConfigKeys::ATTRIBUTE_WALK_COMMAND, EnvType::String},
    {"USB_PERIPHERAL_USB_IDS",       ConfigKeys::USB_IDS_PATH,           EnvType::String},
    {"USB_PERIPHERAL_LOG_LEVEL",     ConfigKeys::LOG_LEVEL,              EnvType::Int},
    {"USB_PERIPHERAL_LOG_FILE",      ConfigKeys::LOG_FILE,               EnvType::String},
};

}

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> globalSettings;

    // Utility functions for JSON conversion
    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    ConfigValue fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return json.toBool();
            case QJsonValue::Double: {
                double value = json.toDouble();
                if (std::floor(value) == value) {
                    return json.toInt();
                }
                return value;
            }
            case QJsonValue::String:
                return json.toString().toStdString();
            default:
                return false; // Default value for unsupported types
        }
    }

    void setDefaults() {
        globalSettings = {
            {ConfigKeys::SHARED_ROOT, std::string(SHARED_ROOT)},
            {ConfigKeys::PERIPHERALS_FOLDER, std::string(PERIPHERALS_FOLDER)},
            {ConfigKeys::PERIPHERAL_NAME, std::string(PERIPHERAL_NAME)},
            {ConfigKeys::SCAN_INTERVAL, SCAN_INTERVAL},
            {ConfigKeys::GRACE_PERIOD, GRACE_PERIOD},
            {ConfigKeys::VIDEO_DEVICES_DIR, std::string(VIDEO_DEVICES_DIR)},
            {ConfigKeys::ATTRIBUTE_WALK_COMMAND, std::string(ATTRIBUTE_WALK_COMMAND)},
            {ConfigKeys::ATTRIBUTE_WALK_TIMEOUT, ATTRIBUTE_WALK_TIMEOUT},
            {ConfigKeys::USB_IDS_PATH, std::string()},
            {ConfigKeys::LOG_LEVEL, 1},
            {ConfigKeys::LOG_FILE, std::string()},
            {ConfigKeys::LOG_MAX_FILE_SIZE, LOG_MAX_FILE_SIZE},
            {ConfigKeys::LOG_MAX_AGE, LOG_MAX_AGE},
            {ConfigKeys::LOG_TIMESTAMPS, true},
            {ConfigKeys::LOG_SOURCE_INFO, true}
        };
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<bool>(it->second)) {
            return std::get<bool>(it->second);
        }
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<std::string>(it->second)) {
            return std::get<std::string>(it->second);
        }
    }
    return defaultValue;
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (doc.isNull() || !doc.isObject()) {
        return false;
    }

    QJsonObject globals = doc.object()["global"].toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        std::string key = it.key().toStdString();
        d->globalSettings[key] = d->fromJsonValue(it.value());
        emit configChanged(key);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject globals;
    for (const auto& [key, value] : d->globalSettings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }

    QJsonObject root;
    root["global"] = globals;

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    return file.write(QJsonDocument(root).toJson()) >= 0;
}

int ConfigManager::loadFromEnvironment() {
    int applied = 0;

    for (const auto& binding : ENV_BINDINGS) {
        if (!qEnvironmentVariableIsSet(binding.variable)) {
            continue;
        }
        QString value = qEnvironmentVariable(binding.variable);

        if (binding.type == EnvType::Int) {
            bool ok = false;
            int number = value.toInt(&ok);
            if (!ok) {
                continue;
            }
            setInt(binding.key, number);
        } else {
            setString(binding.key, value.toStdString());
        }
        ++applied;
    }

    return applied;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();

    // Notify about changes
    for (const auto& [key, _] : d->globalSettings) {
        emit configChanged(key);
    }
}

}
