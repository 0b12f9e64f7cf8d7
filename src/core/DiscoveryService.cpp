#include "DiscoveryService.hpp"
#include "DeviceSource.hpp"
#include "Logger.hpp"
#include "AttributeWalker.hpp"
#include "AttributeCorrelator.hpp"
#include "SerialResolver.hpp"
#include "UsbIdDatabase.hpp"
#include "ConfigManager.hpp"
#include "InventoryWriter.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QJsonDocument>
#include <QTimer>
#include <vector>

namespace usb_peripheral {

namespace {

// Timers need a positive period: a negative one never fires and zero spins
int positiveMs(const ConfigManager& config, const char* key, int fallback) {
    int value = config.getInt(key, fallback);
    if (value <= 0) {
        LOG_WARNING(std::string(key) + " must be a positive number of milliseconds, got " +
                    std::to_string(value) + ". Using " + std::to_string(fallback));
        return fallback;
    }
    return value;
}

}

DiscoveryOptions DiscoveryOptions::fromConfig(const ConfigManager& config) {
    DiscoveryOptions options;
    options.sharedRoot = config.getString(ConfigKeys::SHARED_ROOT, SHARED_ROOT);
    options.peripheralsFolder = config.getString(ConfigKeys::PERIPHERALS_FOLDER, PERIPHERALS_FOLDER);
    options.peripheralName = config.getString(ConfigKeys::PERIPHERAL_NAME, PERIPHERAL_NAME);
    options.videoDevicesDir = config.getString(ConfigKeys::VIDEO_DEVICES_DIR, VIDEO_DEVICES_DIR);
    options.scanInterval = positiveMs(config, ConfigKeys::SCAN_INTERVAL, SCAN_INTERVAL);
    options.gracePeriod = positiveMs(config, ConfigKeys::GRACE_PERIOD, GRACE_PERIOD);
    return options;
}

class DiscoveryService::Private {
public:
    DiscoveryOptions options;
    State state{State::Initializing};

    std::unique_ptr<DeviceSource> source;
    std::unique_ptr<AttributeWalker> walker;
    std::unique_ptr<UsbIdDatabase> database;
    std::unique_ptr<SerialResolver> serials;
    std::unique_ptr<AttributeCorrelator> correlator;
    InventoryWriter* writer{nullptr};
    QTimer* scanTimer{nullptr};
};

DiscoveryService::DiscoveryService(std::unique_ptr<DeviceSource> source,
                                   std::unique_ptr<AttributeWalker> walker,
                                   std::unique_ptr<UsbIdDatabase> database,
                                   const DiscoveryOptions& options,
                                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {

    d->options = options;
    d->source = std::move(source);
    d->walker = std::move(walker);
    d->database = std::move(database);
    d->serials = std::make_unique<SerialResolver>(*d->walker);
    d->correlator = std::make_unique<AttributeCorrelator>(
        *d->database, *d->serials, options.videoDevicesDir);
    d->writer = new InventoryWriter(options.sharedRoot,
                                    options.peripheralsFolder,
                                    options.peripheralName,
                                    this);

    // Restarted after every pass so the interval is measured from the end
    // of the previous write
    d->scanTimer = new QTimer(this);
    d->scanTimer->setSingleShot(true);
    d->scanTimer->setInterval(options.scanInterval);
    connect(d->scanTimer, &QTimer::timeout, this, &DiscoveryService::runPass);
}

DiscoveryService::~DiscoveryService() {
    d->scanTimer->stop();
    if (d->source) {
        d->source->release();
    }
}

DiscoveryService::State DiscoveryService::state() const {
    return d->state;
}

const DiscoveryOptions& DiscoveryService::options() const {
    return d->options;
}

InventoryWriter* DiscoveryService::writer() const {
    return d->writer;
}

void DiscoveryService::start() {
    LOG_INFO("Peripheral Manager USB has started");
    setState(State::Initializing);

    int ret = d->source->acquire();
    if (ret != ErrorCodes::SUCCESS) {
        LOG_WARNING("Unable to initialize USB discovery (" + std::string(errorName(ret)) +
                    "). Host might be incompatible with this peripheral manager. "
                    "Trying again later...");
        finishLater(0, d->options.gracePeriod);
        return;
    }

    if (!d->writer->ensureOutputDirectory()) {
        finishLater(1, 0);
        return;
    }

    runPass();
}

void DiscoveryService::stop() {
    d->scanTimer->stop();
    d->source->release();
    setState(State::Stopped);
}

InventorySnapshot DiscoveryService::scan() {
    InventorySnapshot snapshot;

    std::vector<DeviceDescriptor> devices;
    int ret = d->source->enumerate(devices);
    if (ret != ErrorCodes::SUCCESS) {
        LOG_ERROR("A problem occurred while listing the USB peripherals (" +
                  std::string(errorName(ret)) + "). Continuing...");
    }

    for (const auto& device : devices) {
        PeripheralRecord record;
        if (d->correlator->correlate(device, record) != ErrorCodes::SUCCESS) {
            LOG_ERROR("Dropping " + PeripheralRecord::makeIdentifier(
                          device.identifier.vendorId, device.identifier.productId) +
                      " from this pass");
            continue;
        }
        snapshot.insert(std::move(record));
    }

    return snapshot;
}

bool DiscoveryService::runPass() {
    if (d->state == State::Stopped) {
        return false;
    }
    setState(State::Scanning);

    InventorySnapshot snapshot = scan();

    LOG_INFO("Usb found with feats: " +
             QJsonDocument(snapshot.toJson()).toJson(QJsonDocument::Indented).toStdString());

    bool written = d->writer->write(snapshot);
    if (written) {
        emit snapshotWritten(d->writer->lastWrittenFile(), static_cast<int>(snapshot.size()));
    }

    setState(State::Idle);
    d->scanTimer->start();
    return written;
}

void DiscoveryService::setState(State state) {
    if (d->state == state) {
        return;
    }
    d->state = state;
    emit stateChanged(state);
}

void DiscoveryService::finishLater(int exitCode, int delayMs) {
    QTimer::singleShot(delayMs, this, [this, exitCode]() {
        LOG_INFO("USB discovery exiting with status " + std::to_string(exitCode));
        Logger::instance().flush();
        setState(State::Stopped);
        emit finished(exitCode);
    });
}

}
