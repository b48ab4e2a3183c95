// include/canslim_bt/core/logger.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "canslim_bt/core/config_base.hpp"

namespace canslim_bt {

/**
 * @brief Log levels, lowest first
 */
enum class LogLevel {
    TRACE,    // Per-row diagnostics
    DEBUG,    // Per-day diagnostics (missing prices and similar)
    INFO,     // Run progress
    WARNING,  // Data-quality events
    ERR,      // Contract violations that do not stop a run
    FATAL     // Conditions that stop a run
};

enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& text, LogLevel fallback = LogLevel::INFO);
std::string destination_to_string(LogDestination dest);
LogDestination destination_from_string(const std::string& text,
                                       LogDestination fallback = LogDestination::CONSOLE);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"canslim_bt"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{20 * 1024 * 1024};  // rotate past this many bytes
    size_t max_files{5};                     // files kept in log_directory

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * Messages are written to stdout, to a rotating file, or both. Each thread may
 * tag its messages with a component name via register_component().
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration, opening the log file when needed
     * @return Error if the log directory or file cannot be created
     */
    Result<void> initialize(const LoggerConfig& config);

    /**
     * @brief Close any open file and mark the logger uninitialized
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from this thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string format_message(LogLevel level, const std::string& message) const;
    Result<void> open_log_file();
    void prune_old_files();
    void rotate_locked();

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::string session_stamp_;
    int part_number_{1};
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    static thread_local std::string current_component_;
};

/**
 * @brief Stream-style logging macro
 * Usage: LOG(LogLevel::INFO, "value: " << value)
 */
#define LOG(level, message)                                                   \
    do {                                                                      \
        if (level >= ::canslim_bt::Logger::instance().get_min_level()) {      \
            std::ostringstream os_;                                           \
            os_ << message;                                                   \
            ::canslim_bt::Logger::instance().log(level, os_.str());           \
        }                                                                     \
    } while (0)

#define TRACE(message) LOG(::canslim_bt::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::canslim_bt::LogLevel::DEBUG, message)
#define INFO(message) LOG(::canslim_bt::LogLevel::INFO, message)
#define WARN(message) LOG(::canslim_bt::LogLevel::WARNING, message)
#define ERROR(message) LOG(::canslim_bt::LogLevel::ERR, message)
#define FATAL(message) LOG(::canslim_bt::LogLevel::FATAL, message)

}  // namespace canslim_bt
