// src/core/logger.cpp

#include "tablewright/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "tablewright/core/time_utils.hpp"

namespace tablewright {

thread_local std::string Logger::current_component_;

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        throw std::runtime_error(valid.error()->to_string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Retention runs before the new file exists so the total never exceeds max_files
        enforce_retention();

        current_session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;
        open_part_file();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in: " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        // Library code logs freely; an unconfigured host only sees problems
        if (level >= LogLevel::WARNING) {
            std::cerr << "[" << level_to_string(level) << "] " << message << std::endl;
        }
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(formatted_message);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_console_unsafe(const std::string& message) {
    // Assumes mutex is already held
    std::cout << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    // Assumes mutex is already held
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;
    log_file_.flush();

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::open_part_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    // prefix_YYYYMMDD_HHMMSS_partN.log
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + current_session_timestamp_ + "_part" +
                   std::to_string(current_part_number_) + ".log");
    log_file_.open(log_path, std::ios::app);
}

void Logger::enforce_retention() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    size_t excess = log_files.size() >= config_.max_files
                        ? log_files.size() - config_.max_files + 1
                        : 0;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        if (!std::filesystem::remove(log_files[i], ec) && ec) {
            std::cerr << "Failed to remove old log file " << log_files[i].string() << ": "
                      << ec.message() << std::endl;
        }
    }
}

void Logger::rotate_log_files() {
    log_file_.close();
    enforce_retention();
    current_part_number_++;
    open_part_file();
}

}  // namespace tablewright
