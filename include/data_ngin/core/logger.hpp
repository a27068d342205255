// include/data_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "data_ngin/core/config_base.hpp"

namespace data_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop the run
    FATAL     // Errors that abort the run
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& text);

std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& text);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"data_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Only the front end configures it. Library components that talk to the
 * outside world (gateways, writers) log through the macros below.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    /**
     * @brief Path of the file currently written to, empty for console-only logging
     */
    std::filesystem::path current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // All helpers below assume mutex_ is held
    void enforce_retention(const std::filesystem::path& log_dir);
    void open_part_file();
    void rotate_log_file();
    void write_to_file(const std::string& message);
    void write_to_console(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path current_path_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Wrote " << count << " rows")
 */
#define LOG(level, message)                                                     \
    do {                                                                        \
        if (level >= ::data_ngin::Logger::instance().get_min_level()) {         \
            std::ostringstream os;                                              \
            os << message;                                                      \
            ::data_ngin::Logger::instance().log(level, os.str());               \
        }                                                                       \
    } while (0)

#define TRACE(message) LOG(::data_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::data_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::data_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::data_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::data_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::data_ngin::LogLevel::FATAL, message)
}  // namespace data_ngin
