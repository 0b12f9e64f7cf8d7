#include "InventoryWriter.hpp"
#include "PeripheralRecord.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QDir>
#include <QJsonDocument>
#include <QSaveFile>
#include <QThread>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace usb_peripheral {

namespace {

constexpr int LOCK_ATTEMPTS = 20;
constexpr int LOCK_RETRY_DELAY = 100; // ms

// Advisory flock on the channel lock file, released on destruction
class ChannelLock {
public:
    explicit ChannelLock(const std::string& path) {
        m_fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (m_fd < 0) {
            m_error = std::strerror(errno);
            return;
        }

        for (int attempt = 0; attempt < LOCK_ATTEMPTS; ++attempt) {
            if (::flock(m_fd, LOCK_EX | LOCK_NB) == 0) {
                m_locked = true;
                return;
            }
            if (errno != EWOULDBLOCK) {
                break;
            }
            QThread::msleep(LOCK_RETRY_DELAY);
        }
        m_error = std::strerror(errno);
    }

    ~ChannelLock() {
        if (m_fd >= 0) {
            if (m_locked) {
                ::flock(m_fd, LOCK_UN);
            }
            ::close(m_fd);
        }
    }

    ChannelLock(const ChannelLock&) = delete;
    ChannelLock& operator=(const ChannelLock&) = delete;

    bool locked() const { return m_locked; }
    const std::string& error() const { return m_error; }

private:
    int m_fd{-1};
    bool m_locked{false};
    std::string m_error;
};

}

class InventoryWriter::Private {
public:
    std::string peripheralName;
    QString channelDir;
    QString bufferDir;
    std::string lastFile;
};

InventoryWriter::InventoryWriter(const std::string& sharedRoot,
                                 const std::string& peripheralsFolder,
                                 const std::string& peripheralName,
                                 QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->peripheralName = peripheralName;
    d->channelDir = QDir::cleanPath(QString::fromStdString(sharedRoot) + "/" +
                                    QString::fromStdString(peripheralsFolder) + "/" +
                                    QString::fromStdString(peripheralName));
    d->bufferDir = d->channelDir + "/" + BUFFER_FOLDER;
}

InventoryWriter::~InventoryWriter() = default;

std::string InventoryWriter::channelPath() const {
    return d->channelDir.toStdString();
}

std::string InventoryWriter::bufferPath() const {
    return d->bufferDir.toStdString();
}

std::string InventoryWriter::lockPath() const {
    return (d->channelDir + "/" + QString::fromStdString(d->peripheralName) + ".lock")
        .toStdString();
}

bool InventoryWriter::ensureOutputDirectory() {
    LOG_INFO("Creating USB folder structure " + bufferPath());

    if (!QDir().mkpath(d->bufferDir)) {
        std::string error = "Unable to create " + bufferPath();
        LOG_CRITICAL(error);
        emit writeError(error);
        return false;
    }
    return true;
}

bool InventoryWriter::write(const InventorySnapshot& snapshot,
                            const QDateTime& timestamp) {
    const QString file = d->bufferDir + "/" +
        QString::fromStdString(fileNameFor(timestamp, d->peripheralName));
    LOG_INFO("Saving USB peripherals to " + file.toStdString());

    ChannelLock lock(lockPath());
    if (!lock.locked()) {
        LOG_WARNING("Writing without channel lock " + lockPath() + ": " + lock.error());
    }

    QSaveFile output(file);
    if (!output.open(QIODevice::WriteOnly)) {
        std::string error = "Failed to open " + file.toStdString() + ": " +
                            output.errorString().toStdString();
        LOG_ERROR(error);
        emit writeError(error);
        return false;
    }

    const QByteArray payload = QJsonDocument(snapshot.toJson()).toJson(QJsonDocument::Compact);
    if (output.write(payload) != payload.size() || !output.commit()) {
        std::string error = "Failed to write " + file.toStdString() + ": " +
                            output.errorString().toStdString();
        LOG_ERROR(error);
        emit writeError(error);
        return false;
    }

    d->lastFile = file.toStdString();
    emit writeComplete(d->lastFile);
    return true;
}

std::string InventoryWriter::lastWrittenFile() const {
    return d->lastFile;
}

std::string InventoryWriter::fileNameFor(const QDateTime& timestamp,
                                         const std::string& peripheralName) {
    return timestamp.toString(FILE_TIMESTAMP_FORMAT).toStdString() + "_" +
           peripheralName + ".json";
}

}
