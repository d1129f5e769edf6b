#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace RegionComposite::Shared {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

class Logger {
  public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) { currentLevel_ = level; }
    LogLevel getLevel() const { return currentLevel_; }

    void setTimestampsEnabled(bool enabled) { timestamps_ = enabled; }

    // Accepts "debug", "info", "warn", "error" or "off" in any case
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warn" || lower == "warning") return LogLevel::WARN;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "off") return LogLevel::OFF;
        return fallback;
    }

    template <typename... Args>
    void debug(Args&&... args) {
        log(LogLevel::DEBUG, "DEBUG", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args) {
        log(LogLevel::INFO, "INFO", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        log(LogLevel::WARN, "WARN", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args) {
        log(LogLevel::ERROR, "ERROR", std::forward<Args>(args)...);
    }

  private:
    LogLevel currentLevel_ = LogLevel::INFO;
    bool timestamps_ = true;

    template <typename... Args>
    void log(LogLevel level, const std::string& levelStr, Args&&... args) {
        if (level < currentLevel_) return;

        std::ostringstream oss;
        if (timestamps_) {
            auto now = std::chrono::system_clock::now();
            std::time_t time = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              now.time_since_epoch()) % 1000;
            std::tm tm{};
            localtime_r(&time, &tm);
            oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
                << millis.count() << std::setfill(' ') << ' ';
        }
        oss << "[" << levelStr << "] ";
        ((oss << std::forward<Args>(args)), ...);

        // Warnings and errors go to stderr so app output stays parseable
        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << oss.str() << std::endl;
    }

    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

#define LOG_DEBUG(...) RegionComposite::Shared::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) RegionComposite::Shared::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) RegionComposite::Shared::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) RegionComposite::Shared::Logger::getInstance().error(__VA_ARGS__)

}  // namespace RegionComposite::Shared
