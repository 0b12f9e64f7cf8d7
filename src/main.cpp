#include "core/DiscoveryService.hpp"
#include "core/DeviceEnumerator.hpp"
#include "core/Logger.hpp"
#include "correlation/AttributeWalker.hpp"
#include "correlation/UsbIdDatabase.hpp"
#include "utils/ConfigManager.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <exception>
#include <iostream>

using namespace usb_peripheral;

void initializeLogger(const ConfigManager& config) {
    auto& logger = Logger::instance();

    const std::string logFile = config.getString(ConfigKeys::LOG_FILE);
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
        logger.setLogDestination(LogDestination::All);
    }

    logger.setLogLevel(Logger::levelFromInt(config.getInt(ConfigKeys::LOG_LEVEL, 1)));
    logger.enableTimestamps(config.getBool(ConfigKeys::LOG_TIMESTAMPS, true));
    logger.enableSourceInfo(config.getBool(ConfigKeys::LOG_SOURCE_INFO, true));

    const int maxFileSize = config.getInt(ConfigKeys::LOG_MAX_FILE_SIZE, LOG_MAX_FILE_SIZE);
    if (maxFileSize > 0) {
        logger.setMaxFileSize(static_cast<size_t>(maxFileSize));
    }
    const int maxAge = config.getInt(ConfigKeys::LOG_MAX_AGE, LOG_MAX_AGE);
    if (maxAge > 0) {
        logger.setMaxLogAge(std::chrono::hours(maxAge));
    }

    QObject::connect(&logger, &Logger::logFileRotated,
        [](const std::string& oldFile, const std::string& newFile) {
            LOG_INFO("Rotated log file " + oldFile + ", previous entries are in " + newFile);
        });
}

bool loadConfiguration(ConfigManager& config) {
    QString configPath = qEnvironmentVariable("USB_PERIPHERAL_CONFIG");

    if (configPath.isEmpty()) {
        // Default config locations
        QStringList configLocations = {
            QDir::currentPath() + "/config.json",
            "/etc/usb-peripheral/config.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (!configPath.isEmpty() && !config.loadFromFile(configPath.toStdString())) {
        std::cerr << "Failed to load configuration from "
                  << configPath.toStdString() << std::endl;
        return false;
    }

    config.loadFromEnvironment();
    initializeLogger(config);

    if (configPath.isEmpty()) {
        LOG_INFO("No configuration file found, using defaults");
    } else {
        LOG_INFO("Loaded configuration from " + configPath.toStdString());
    }
    return true;
}

std::unique_ptr<UsbIdDatabase> loadUsbIds(const ConfigManager& config) {
    auto database = std::make_unique<UsbIdDatabase>();

    std::string path = config.getString(ConfigKeys::USB_IDS_PATH);
    if (path.empty()) {
        path = UsbIdDatabase::defaultPath();
    }

    if (path.empty()) {
        LOG_WARNING("No usb.ids database found, vendor and product names will be empty");
    } else if (!database->loadFromFile(path)) {
        LOG_WARNING("Continuing without vendor and product names");
    }

    return database;
}

void handleUnexpectedExceptions() {
    try {
        throw;  // Rethrow the current exception
    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: " + std::string(e.what()));
    } catch (...) {
        LOG_CRITICAL("Unknown unhandled exception");
    }
    Logger::instance().flush();
}

int main(int argc, char *argv[]) {
    // Set up global exception handler
    std::set_terminate([]() {
        if (std::current_exception()) {
            handleUnexpectedExceptions();
        }
        std::abort();
    });

    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("usb-peripheral-discovery");
        app.setApplicationVersion("1.0.0");

        ConfigManager config;
        if (!loadConfiguration(config)) {
            return 1;
        }

        auto walker = std::make_unique<UdevadmAttributeWalker>(
            config.getString(ConfigKeys::ATTRIBUTE_WALK_COMMAND, ATTRIBUTE_WALK_COMMAND),
            config.getInt(ConfigKeys::ATTRIBUTE_WALK_TIMEOUT, ATTRIBUTE_WALK_TIMEOUT));

        DiscoveryService service(std::make_unique<DeviceEnumerator>(),
                                 std::move(walker),
                                 loadUsbIds(config),
                                 DiscoveryOptions::fromConfig(config));

        QObject::connect(&service, &DiscoveryService::finished,
                         &app, &QCoreApplication::exit);

        service.start();
        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
