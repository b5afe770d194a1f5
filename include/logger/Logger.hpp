#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * @brief Logger statico: console (errori su stderr) più file opzionale con rotazione.
 *
 * Senza init() scrive solo su console. Con una cartella, il file è
 * <folder>/escpos_<timestamp>.log, ruotato oltre 10MB, mantenendo gli ultimi 5 file.
 */
class Logger {
public:
    static void init(const std::string &folder = "", LogLevel level = LogLevel::Info);

    static void shutdown();

    static void setLevel(LogLevel level);

    static LogLevel level();

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

    static LogLevel levelFromString(const std::string &value);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string logFolder_;
    static std::string currentLogPath_;
    static std::atomic<std::size_t> currentLogSize_;
    static std::atomic<LogLevel> level_;

    static void log(LogLevel level, const std::string &message);

    static void rotateLogFile();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();

    static const char *levelName(LogLevel level);
};
