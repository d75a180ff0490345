#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

/**
 * @brief Process-wide logger.
 *
 * Every entry goes to the log file (when one is configured) and to stderr.
 * stdout is left alone because the host executable speaks its command
 * protocol there. An optional callback receives every entry that passes the
 * level filter.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    // Empty path disables the file sink.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (static_cast<int>(level) < static_cast<int>(minLevel)) return;

        writeEntry(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    std::string logFilePath = "cowork.log";
    LogLevel minLevel = LogLevel::INFO;
    bool consoleEnabled = true;

    void writeEntry(LogLevel level, const std::string& message);
};
