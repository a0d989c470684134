// include/tablewright/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "tablewright/core/config_base.hpp"

namespace tablewright {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // Per-column and per-pass decisions
    INFO,     // Pipeline summaries
    WARNING,  // Data hazards that were handled (name collisions, dropped columns)
    ERR,      // Errors returned to the caller
    FATAL     // Unrecoverable errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name, keeping the fallback for unknown names
 */
inline LogLevel level_from_string(const std::string& name, LogLevel fallback) {
    if (name == "TRACE")
        return LogLevel::TRACE;
    if (name == "DEBUG")
        return LogLevel::DEBUG;
    if (name == "INFO")
        return LogLevel::INFO;
    if (name == "WARNING")
        return LogLevel::WARNING;
    if (name == "ERROR")
        return LogLevel::ERR;
    if (name == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"tablewright"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // 10MB per part
    size_t max_files{5};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_level"] = level_to_string(min_level);
        j["destination"] = log_destination_to_string(destination);
        j["log_directory"] = log_directory;
        j["filename_prefix"] = filename_prefix;
        j["include_timestamp"] = include_timestamp;
        j["include_level"] = include_level;
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level"))
            min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
        if (j.contains("destination")) {
            std::string dest_str = j.at("destination").get<std::string>();
            if (dest_str == "CONSOLE")
                destination = LogDestination::CONSOLE;
            else if (dest_str == "FILE")
                destination = LogDestination::FILE;
            else if (dest_str == "BOTH")
                destination = LogDestination::BOTH;
        }
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
    }

    Result<void> validate() const override {
        if (max_files == 0) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "max_files must be positive",
                                    "LoggerConfig");
        }
        if (max_file_size == 0) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "max_file_size must be positive", "LoggerConfig");
        }
        return Result<void>();
    }
};

/**
 * @brief Thread-safe process logger
 *
 * The library only writes through this singleton; hosts decide where the
 * output goes by calling initialize() once at startup.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error when the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests() {
        std::lock_guard<std::mutex> lock(instance().mutex_);
        instance().initialized_ = false;
        if (instance().log_file_.is_open()) {
            instance().log_file_.close();
        }
        instance().current_session_timestamp_.clear();
        instance().current_part_number_ = 1;
    }

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

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_part_file();
    void rotate_log_files();
    void enforce_retention();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                \
    do {                                                   \
        if (level >= Logger::instance().get_min_level()) { \
            std::ostringstream os;                         \
            os << message;                                 \
            Logger::instance().log(level, os.str());       \
        }                                                  \
    } while (0)

#define TRACE(message) LOG(LogLevel::TRACE, message)
#define DEBUG(message) LOG(LogLevel::DEBUG, message)
#define INFO(message) LOG(LogLevel::INFO, message)
#define WARN(message) LOG(LogLevel::WARNING, message)
#define ERROR(message) LOG(LogLevel::ERR, message)
#define FATAL(message) LOG(LogLevel::FATAL, message)
}  // namespace tablewright
