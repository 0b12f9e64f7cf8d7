#include "Logger.hpp"
#include "SystemLog.hpp"
#include <usb-peripheral/Constants.hpp>
#include <QDateTime>
#include <QFileInfo>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <iostream>
#include <mutex>

namespace usb_peripheral {

namespace {

constexpr const char* SYSLOG_IDENT = "usb-peripheral-discovery";
constexpr size_t MAX_RECENT_LOGS = 1000;

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

// __FILE__ carries the build path
std::string baseName(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

}

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{LOG_MAX_FILE_SIZE};
    std::chrono::hours maxLogAge{LOG_MAX_AGE};
    bool includeTimestamps{true};
    bool includeSourceInfo{true};
    bool syslogOpened{false};

    std::deque<LogEntry> recentLogs;
    mutable std::mutex logMutex;
    std::ofstream fileStream;

    bool writesTo(LogDestination target) const {
        return destination == target || destination == LogDestination::All;
    }

    void openLogFile() {
        if (!logFile.empty() && !fileStream.is_open()) {
            fileStream.open(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream.is_open()) {
            fileStream.close();
        }
    }

    void writeToFile(const std::string& line) {
        openLogFile();
        if (fileStream.is_open()) {
            fileStream << line << '\n';
            fileStream.flush();
        }
    }

    void writeToSystem(LogLevel level, const std::string& line) {
        if (!syslogOpened) {
            SystemLog::open(SYSLOG_IDENT);
            syslogOpened = true;
        }
        SystemLog::write(static_cast<int>(level), line);
    }

    bool rotationDue() const {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return false;
        }

        auto size = std::filesystem::file_size(logFile, ec);
        if (!ec && size >= maxFileSize) {
            return true;
        }

        // Age counts from the first line written to the file
        QFileInfo info(QString::fromStdString(logFile));
        QDateTime born = info.birthTime().isValid() ? info.birthTime() : info.lastModified();
        qint64 ageSeconds = born.secsTo(QDateTime::currentDateTime());
        return ageSeconds >= std::chrono::duration_cast<std::chrono::seconds>(maxLogAge).count();
    }

    // Moves the current file aside, returns the new name or empty on failure
    std::string rotate() {
        closeLogFile();

        std::string rotated = logFile + "." +
            QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss").toStdString();

        std::error_code ec;
        std::filesystem::rename(logFile, rotated, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file " << logFile << ": "
                      << ec.message() << std::endl;
            rotated.clear();
        }

        openLogFile();
        return rotated;
    }

    std::string format(const LogEntry& entry, const std::string& levelName) const {
        std::ostringstream ss;

        if (includeTimestamps) {
            std::time_t time = std::chrono::system_clock::to_time_t(entry.timestamp);
            std::tm local{};
            localtime_r(&time, &local);
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ";
        }

        ss << "[" << levelName << "] ";

        if (includeSourceInfo && !entry.source.empty()) {
            ss << entry.source;
            if (!entry.function.empty()) {
                ss << ":" << entry.function;
            }
            ss << " - ";
        }

        ss << entry.message;
        return ss.str();
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() {
    d->closeLogFile();
    if (d->syslogOpened) {
        SystemLog::close();
    }
}

LogLevel Logger::levelFromInt(int level) {
    if (level < static_cast<int>(LogLevel::Debug) ||
        level > static_cast<int>(LogLevel::Critical)) {
        return LogLevel::Info;
    }
    return static_cast<LogLevel>(level);
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

void Logger::setMaxLogAge(std::chrono::hours age) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxLogAge = age;
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

void Logger::debug(const std::string& message, const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message, const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message, const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message, const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message, const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    std::string rotatedFrom;
    std::string rotatedTo;

    {
        std::lock_guard<std::mutex> lock(d->logMutex);
        if (level < d->currentLevel) {
            return;
        }

        d->recentLogs.push_back(LogEntry{
            std::chrono::system_clock::now(), level, message, baseName(source), function});
        if (d->recentLogs.size() > MAX_RECENT_LOGS) {
            d->recentLogs.pop_front();
        }

        const std::string line = d->format(d->recentLogs.back(), getLevelString(level));

        if (d->writesTo(LogDestination::Console)) {
            (level >= LogLevel::Error ? std::cerr : std::cout) << line << std::endl;
        }

        if (d->writesTo(LogDestination::File)) {
            if (d->rotationDue()) {
                rotatedFrom = d->logFile;
                rotatedTo = d->rotate();
            }
            d->writeToFile(line);
        }

        if (d->writesTo(LogDestination::System)) {
            d->writeToSystem(level, line);
        }
    }

    if (!rotatedTo.empty()) {
        emit logFileRotated(rotatedFrom, rotatedTo);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    std::cout.flush();
    std::cerr.flush();
    if (d->fileStream.is_open()) {
        d->fileStream.flush();
    }
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->recentLogs.clear();
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t first = count >= d->recentLogs.size() ? 0 : d->recentLogs.size() - count;

    std::vector<std::string> result;
    result.reserve(d->recentLogs.size() - first);
    for (auto it = d->recentLogs.begin() + first; it != d->recentLogs.end(); ++it) {
        result.push_back(d->format(*it, getLevelString(it->level)));
    }
    return result;
}

std::string Logger::getLevelString(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace usb_peripheral
