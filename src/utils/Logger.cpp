#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::SUCCESS: return "[OK] ";
            case LogLevel::INFO: return "[INFO] ";
            default: return "[DEBUG] ";
        }
    }
}

void Logger::writeEntry(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&now, &local);
            logFile << std::put_time(&local, "[%Y-%m-%d %H:%M:%S] ") << levelTag(level)
                    << trimmedMsg << std::endl;
        }
    }

    if (!consoleEnabled) return;

    std::string prefix;
    switch (level) {
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << std::endl;
    }
}
