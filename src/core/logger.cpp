#include "core/logger.h"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace {

constexpr size_t MAX_LOG_SIZE = 100 * 1024 * 1024; // 100 MB
constexpr int MAX_GENERATIONS = 6;                 // file.1 .. file.6

std::string generation(const std::string& base, int n) {
    return base + "." + std::to_string(n);
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

// =======================
// Configuration
// =======================
void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() const {
    return level_;
}

void Logger::setIdent(const std::string& ident) {
    std::lock_guard<std::mutex> lock(mutex_);
    ident_ = ident;
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    logPath_ = path;

    if (out_.is_open())
        out_.close();
    fileSize_ = 0;

    if (path.empty())
        return;

    out_.open(path, std::ios::app);
    if (!out_.is_open()) {
        std::clog << "cannot open log file " << path << ", logging to stderr" << std::endl;
        return;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    fileSize_ = ec ? 0 : static_cast<size_t>(size);
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel logLevelFromString(const std::string& s) {
    if (s == "debug")   return LogLevel::Debug;
    if (s == "info")    return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error")   return LogLevel::Error;
    return LogLevel::Info;
}

// =======================
// Rotation
// =======================
void Logger::rotateIfNeeded() {
    if (!out_.is_open() || fileSize_.load() < MAX_LOG_SIZE)
        return;

    out_.close();
    std::error_code ec;

    // file.5 -> file.6, ..., file -> file.1; the oldest generation is overwritten
    for (int i = MAX_GENERATIONS - 1; i >= 1; --i) {
        if (std::filesystem::exists(generation(logPath_, i), ec))
            std::filesystem::rename(generation(logPath_, i), generation(logPath_, i + 1), ec);
    }
    if (std::filesystem::exists(logPath_, ec))
        std::filesystem::rename(logPath_, generation(logPath_, 1), ec);

    out_.open(logPath_, std::ios::app);
    fileSize_.store(0);
}

// =======================
// Logging
// =======================
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    rotateIfNeeded();

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostream& os = out_.is_open()
        ? static_cast<std::ostream&>(out_)
        : std::clog;

    writeLine(os, level, message, tm);

    fileSize_.fetch_add(message.size() + 64, std::memory_order_relaxed);
}

void Logger::writeLine(std::ostream& os, LogLevel level, const std::string& message,
                       const std::tm& tm) {
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ' ';
    if (!ident_.empty())
        os << ident_ << ' ';
    os << '[' << levelToString(level) << "] " << message << std::endl;
}
