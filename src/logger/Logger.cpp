#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
std::string Logger::logFolder_;
std::string Logger::currentLogPath_;
std::atomic<std::size_t> Logger::currentLogSize_{0};
std::atomic<LogLevel> Logger::level_{LogLevel::Info};

constexpr std::size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB
constexpr std::size_t MAX_LOG_FILES = 5;

void Logger::init(const std::string &folder, LogLevel level) {
    level_ = level;

    std::lock_guard<std::mutex> lock(logMutex_);
    logFolder_ = folder;
    if (logFolder_.empty()) {
        return;
    }

    rotateLogFile();
    std::cout << "[Logger] Initialized in " << logFolder_ << " (max " << MAX_LOG_SIZE / 1024 / 1024
              << "MB per file, " << MAX_LOG_FILES << " files)" << std::endl;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFolder_.clear();
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() {
    return level_;
}

void Logger::logDebug(const std::string &message) {
    log(LogLevel::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    log(LogLevel::Info, message);
}

void Logger::logWarning(const std::string &message) {
    log(LogLevel::Warning, message);
}

void Logger::logError(const std::string &message) {
    log(LogLevel::Error, message);
}

LogLevel Logger::levelFromString(const std::string &value) {
    std::string lower;
    for (const char c: value) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void Logger::log(LogLevel level, const std::string &message) {
    if (level < level_.load()) {
        return;
    }
    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string formatted = "[" + std::string(levelName(level)) + "] [" + currentTimestamp() + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (level == LogLevel::Error) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    if (!logFile_.is_open()) {
        return;
    }

    if (currentLogSize_ > MAX_LOG_SIZE) {
        rotateLogFile();
    }
    logFile_ << formatted << std::endl;
    currentLogSize_ += formatted.length() + 1;
}

void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    try {
        if (!fs::exists(logFolder_)) {
            fs::create_directories(logFolder_);
        }
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] ERROR: Cannot create log folder " << logFolder_ << ": " << e.what() << std::endl;
        return;
    }

    currentLogPath_ = generateLogFilename();
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
        return;
    }

    cleanupOldLogs();
}

void Logger::cleanupOldLogs() {
    try {
        std::vector<fs::path> logFiles;
        for (const auto &entry: fs::directory_iterator(logFolder_)) {
            const auto filename = entry.path().filename().string();
            if (entry.path().extension() == ".log" && filename.rfind("escpos_", 0) == 0) {
                logFiles.push_back(entry.path());
            }
        }

        if (logFiles.size() <= MAX_LOG_FILES) {
            return;
        }

        // Il nome contiene il timestamp: l'ordine lessicografico è quello cronologico
        std::sort(logFiles.begin(), logFiles.end());
        for (std::size_t i = 0; i < logFiles.size() - MAX_LOG_FILES; ++i) {
            fs::remove(logFiles[i]);
        }
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S") << "_" << std::setw(3) << std::setfill('0')
       << millis;

    return (fs::path(logFolder_) / ("escpos_" + ss.str() + ".log")).string();
}

const char *Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}
