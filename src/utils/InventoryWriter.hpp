#pragma once
#include <QObject>
#include <QDateTime>
#include <memory>
#include <string>

namespace usb_peripheral {

class InventorySnapshot;

// Publishes inventory snapshots into the peripheral channel shared with
// the agent:
//
//   <sharedRoot>/<peripheralsFolder>/<name>/<name>.lock
//   <sharedRoot>/<peripheralsFolder>/<name>/buffer/<MMddyyyyHHmmss>_<name>.json
//
// Every write creates a new file. The channel lock is held while the file
// is committed so the agent never drains a half written buffer.
class InventoryWriter : public QObject {
    Q_OBJECT

public:
    InventoryWriter(const std::string& sharedRoot,
                    const std::string& peripheralsFolder,
                    const std::string& peripheralName,
                    QObject* parent = nullptr);
    ~InventoryWriter();

    std::string channelPath() const;
    std::string bufferPath() const;
    std::string lockPath() const;

    // Creates the buffer directory and its parents. Idempotent.
    bool ensureOutputDirectory();

    bool write(const InventorySnapshot& snapshot,
               const QDateTime& timestamp = QDateTime::currentDateTime());

    std::string lastWrittenFile() const;

    static std::string fileNameFor(const QDateTime& timestamp,
                                   const std::string& peripheralName);

signals:
    void writeComplete(const std::string& filename);
    void writeError(const std::string& error);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
