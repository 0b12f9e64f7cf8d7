// tests/test_Logger.cpp
#include <gtest/gtest.h>
#include "Logger.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

namespace usb_peripheral {
namespace testing {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().clear();
    }

    // The logger is process wide, put every setting back
    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogDestination(LogDestination::Console);
        logger.setLogFile("");
        logger.setLogLevel(LogLevel::Info);
        logger.setMaxFileSize(LOG_MAX_FILE_SIZE);
        logger.setMaxLogAge(std::chrono::hours(LOG_MAX_AGE));
        logger.enableTimestamps(true);
        logger.enableSourceInfo(true);
        logger.clear();
    }
};

TEST_F(LoggerTest, MacrosRecordLevelSourceAndFunction) {
    LOG_WARNING("walk failed");

    auto logs = Logger::instance().getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[WARNING] test_Logger.cpp:"), std::string::npos);
    EXPECT_NE(logs[0].find(" - walk failed"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    Logger::instance().setLogLevel(Logger::levelFromInt(2));
    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_ERROR("shown");

    auto logs = Logger::instance().getRecentLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[ERROR]"), std::string::npos);
}

TEST_F(LoggerTest, LevelFromIntClampsToInfo) {
    EXPECT_EQ(Logger::levelFromInt(0), LogLevel::Debug);
    EXPECT_EQ(Logger::levelFromInt(4), LogLevel::Critical);
    EXPECT_EQ(Logger::levelFromInt(-1), LogLevel::Info);
    EXPECT_EQ(Logger::levelFromInt(9), LogLevel::Info);
}

TEST_F(LoggerTest, PlainFormatWithoutTimestampOrSource) {
    Logger::instance().enableTimestamps(false);
    Logger::instance().enableSourceInfo(false);
    LOG_INFO("Peripheral Manager USB has started");

    auto logs = Logger::instance().getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0], "[INFO] Peripheral Manager USB has started");
}

TEST_F(LoggerTest, SystemDestinationKeepsRecentLogs) {
    Logger::instance().setLogDestination(LogDestination::System);
    LOG_CRITICAL("to syslog");

    auto logs = Logger::instance().getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[CRITICAL]"), std::string::npos);
}

TEST_F(LoggerTest, OversizedFileIsRotated) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const std::string logFile = dir.filePath("discovery.log").toStdString();

    auto& logger = Logger::instance();
    logger.setLogFile(logFile);
    logger.setLogDestination(LogDestination::File);
    logger.setMaxFileSize(1);

    std::string rotatedFrom;
    std::string rotatedTo;
    auto connection = QObject::connect(&logger, &Logger::logFileRotated,
        [&](const std::string& oldFile, const std::string& newFile) {
            rotatedFrom = oldFile;
            rotatedTo = newFile;
        });

    LOG_INFO("first line");
    EXPECT_TRUE(rotatedTo.empty());
    LOG_INFO("second line");
    QObject::disconnect(connection);

    EXPECT_EQ(rotatedFrom, logFile);
    ASSERT_FALSE(rotatedTo.empty());
    EXPECT_EQ(rotatedTo.rfind(logFile + ".", 0), 0u);
    EXPECT_TRUE(QFileInfo::exists(QString::fromStdString(rotatedTo)));
    EXPECT_TRUE(QFileInfo::exists(QString::fromStdString(logFile)));
}

} // namespace testing
} // namespace usb_peripheral
