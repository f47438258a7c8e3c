#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace common {

/**
 * @brief Interface for logging
 * Single responsibility: Logging operations
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
};

/**
 * @brief Console logger implementation
 * Timestamped lines; INFO/DEBUG go to stdout, WARN/ERROR to stderr.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(bool debug_enabled = false) : debug_enabled_(debug_enabled) {}

    void set_debug(bool enabled) { debug_enabled_.store(enabled); }

    void info(const std::string& message) override {
        log(std::cout, "INFO", message);
    }

    void warn(const std::string& message) override {
        log(std::cerr, "WARN", message);
    }

    void error(const std::string& message) override {
        log(std::cerr, "ERROR", message);
    }

    void debug(const std::string& message) override {
        if (debug_enabled_.load()) {
            log(std::cout, "DEBUG", message);
        }
    }

private:
    void log(std::ostream& out, const char* level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::lock_guard<std::mutex> lock(mutex_);
        out << "[" << std::put_time(&tm_buf, "%H:%M:%S")
            << "] [" << level << "] " << message << std::endl;
    }

    std::mutex mutex_;
    std::atomic<bool> debug_enabled_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public ILogger {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
    void debug(const std::string&) override {}
};

} // namespace common
