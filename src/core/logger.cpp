// src/core/logger.cpp

#include "canslim_bt/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

thread_local std::string Logger::current_component_;

std::string level_to_string(LogLevel level) {
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
    }
    return "UNKNOWN";
}

LogLevel level_from_string(const std::string& text, LogLevel fallback) {
    if (text == "TRACE")
        return LogLevel::TRACE;
    if (text == "DEBUG")
        return LogLevel::DEBUG;
    if (text == "INFO")
        return LogLevel::INFO;
    if (text == "WARNING" || text == "WARN")
        return LogLevel::WARNING;
    if (text == "ERROR")
        return LogLevel::ERR;
    if (text == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

std::string destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

LogDestination destination_from_string(const std::string& text, LogDestination fallback) {
    if (text == "CONSOLE")
        return LogDestination::CONSOLE;
    if (text == "FILE")
        return LogDestination::FILE;
    if (text == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
    if (j.contains("destination"))
        destination =
            destination_from_string(j.at("destination").get<std::string>(), destination);
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

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

Result<void> Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    config_ = config;
    min_level_.store(config.min_level, std::memory_order_relaxed);

    if (config_.destination != LogDestination::CONSOLE) {
        session_stamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        auto open_result = open_log_file();
        if (open_result.is_error()) {
            return open_result;
        }
    }

    initialized_.store(true, std::memory_order_release);
    return Result<void>();
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.session_stamp_.clear();
    logger.part_number_ = 1;
    logger.config_ = LoggerConfig();
    logger.min_level_.store(logger.config_.min_level, std::memory_order_relaxed);
}

Result<void> Logger::open_log_file() {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::absolute(config_.log_directory, ec);
    if (!ec) {
        fs::create_directories(dir, ec);
    }
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create log directory " + config_.log_directory +
                                    ": " + ec.message(),
                                "Logger");
    }

    prune_old_files();

    fs::path path = dir / (config_.filename_prefix + "_" + session_stamp_ + "_part" +
                           std::to_string(part_number_) + ".log");
    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open log file: " + path.string(), "Logger");
    }
    return Result<void>();
}

void Logger::prune_old_files() {
    namespace fs = std::filesystem;
    std::error_code ec;
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(config_.log_directory, ec)) {
        if (entry.is_regular_file() &&
            entry.path().filename().string().rfind(config_.filename_prefix, 0) == 0) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        std::error_code ea;
        std::error_code eb;
        return fs::last_write_time(a, ea) < fs::last_write_time(b, eb);
    });
    // Leave room for the file about to be opened
    while (!files.empty() && files.size() >= config_.max_files) {
        fs::remove(files.front(), ec);
        files.erase(files.begin());
    }
}

void Logger::rotate_locked() {
    log_file_.close();
    ++part_number_;
    auto result = open_log_file();
    if (result.is_error()) {
        std::cerr << "Log rotation failed: " << result.error()->what() << std::endl;
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
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

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        // Uninitialized: still surface warnings and above
        if (level >= LogLevel::WARNING) {
            std::cerr << "[" << level_to_string(level) << "] " << message << std::endl;
        }
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << line << std::endl;
    }

    if (config_.destination != LogDestination::CONSOLE && log_file_.is_open()) {
        log_file_ << line << std::endl;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            rotate_locked();
        }
    }
}

}  // namespace canslim_bt
