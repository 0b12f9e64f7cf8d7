#include "AttributeWalker.hpp"
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QProcess>
#include <QStringList>

namespace usb_peripheral {

UdevadmAttributeWalker::UdevadmAttributeWalker(std::string command, int timeoutMs)
    : m_command(std::move(command))
    , m_timeoutMs(timeoutMs) {
    // QProcess treats a negative wait as unbounded
    if (m_timeoutMs <= 0) {
        LOG_WARNING("Attribute walk timeout must be positive, got " +
                    std::to_string(m_timeoutMs) + " ms. Using " +
                    std::to_string(ATTRIBUTE_WALK_TIMEOUT) + " ms");
        m_timeoutMs = ATTRIBUTE_WALK_TIMEOUT;
    }
}

int UdevadmAttributeWalker::walk(const std::string& devicePath,
                                 std::vector<std::string>& lines) {
    lines.clear();

    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(QString::fromStdString(m_command),
                  QStringList() << "info" << "--attribute-walk"
                                << QString::fromStdString(devicePath));

    if (!process.waitForStarted(m_timeoutMs)) {
        LOG_ERROR("Unable to run " + m_command + " for device " + devicePath +
                  ". Reason: " + process.errorString().toStdString());
        return ErrorCodes::NOT_SUPPORTED;
    }

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        LOG_ERROR(m_command + " for device " + devicePath + " timed out after " +
                  std::to_string(m_timeoutMs) + " ms");
        return ErrorCodes::TIMEOUT;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        LOG_ERROR("Unable to run " + m_command + " for device " + devicePath +
                  ". Reason: exit code " + std::to_string(process.exitCode()) +
                  ", " + QString::fromLocal8Bit(process.readAllStandardError())
                             .trimmed().toStdString());
        return ErrorCodes::IO_ERROR;
    }

    const QString output = QString::fromLocal8Bit(process.readAllStandardOutput());
    for (const QString& line : output.split('\n')) {
        lines.push_back(line.toStdString());
    }

    return ErrorCodes::SUCCESS;
}

}
