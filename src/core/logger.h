#pragma once
#include <atomic>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

// "debug", "info", "warn"/"warning", "error"; anything else is Info.
LogLevel logLevelFromString(const std::string& s);

/**
 * Process-wide logger. Writes to the configured file, rotated by size, or
 * to std::clog when no file is set so stdout stays free for results.
 */
class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;
    void setFile(const std::string& path);
    // Tag printed in front of every line, e.g. the program name.
    void setIdent(const std::string& ident);

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* levelToString(LogLevel level);

    void rotateIfNeeded();
    void writeLine(std::ostream& os, LogLevel level, const std::string& message, const std::tm& tm);

    std::ofstream out_;
    std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::string ident_;

    // Rotation state
    std::atomic<size_t> fileSize_{0};
    std::string logPath_;
};
