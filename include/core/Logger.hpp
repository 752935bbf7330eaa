#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

namespace core {

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
 * Implements ILogger with timestamped output on stderr.
 * stdout is left untouched so it stays with the pipeline process.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(std::string tag, bool verbose = false)
        : tag_(std::move(tag)), verbose_(verbose) {}

    void info(const std::string& message) override {
        log("INFO", message);
    }

    void warn(const std::string& message) override {
        log("WARN", message);
    }

    void error(const std::string& message) override {
        log("ERROR", message);
    }

    void debug(const std::string& message) override {
        if (verbose_) log("DEBUG", message);
    }

private:
    void log(const char* level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&time, &local);
        std::cerr << "[" << tag_ << "] " << std::put_time(&local, "%H:%M:%S")
                  << " [" << level << "] " << message << std::endl;
    }

    std::string tag_;
    bool verbose_;
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

} // namespace core
