#pragma once
#include "PeripheralRecord.hpp"
#include <QObject>
#include <memory>
#include <string>

namespace usb_peripheral {

class AttributeWalker;
class ConfigManager;
class DeviceSource;
class InventoryWriter;
class UsbIdDatabase;

struct DiscoveryOptions {
    std::string sharedRoot;
    std::string peripheralsFolder;
    std::string peripheralName;
    std::string videoDevicesDir;
    int scanInterval{0};  // ms
    int gracePeriod{0};   // ms

    static DiscoveryOptions fromConfig(const ConfigManager& config);
};

// Periodic USB inventory loop.
//
//   Initializing --acquired--> Scanning --written--> Idle --interval--> Scanning
//   Initializing --no USB--> (grace period) --> finished(0)
//   Initializing --no output directory--> finished(1)
//
// Passes run on the Qt event loop, one at a time.
class DiscoveryService : public QObject {
    Q_OBJECT

public:
    enum class State {
        Initializing,
        Scanning,
        Idle,
        Stopped
    };
    Q_ENUM(State)

    DiscoveryService(std::unique_ptr<DeviceSource> source,
                     std::unique_ptr<AttributeWalker> walker,
                     std::unique_ptr<UsbIdDatabase> database,
                     const DiscoveryOptions& options,
                     QObject* parent = nullptr);
    ~DiscoveryService();

    State state() const;
    const DiscoveryOptions& options() const;
    InventoryWriter* writer() const;

    // Enumerates and correlates every attached device
    InventorySnapshot scan();

public slots:
    void start();
    void stop();

    // One Scanning pass followed by Idle; returns whether a file was written
    bool runPass();

signals:
    void stateChanged(DiscoveryService::State state);
    void snapshotWritten(const std::string& filename, int deviceCount);
    void finished(int exitCode);

private:
    void setState(State state);
    void finishLater(int exitCode, int delayMs);

    class Private;
    std::unique_ptr<Private> d;
};

}
