#include "logger.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace spidercore {

namespace {

// Quoted JSON string; invalid UTF-8 from scanned bodies is replaced, not thrown on
std::string json_string(const std::string& text) {
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

bool log_level_from_string(const std::string& name, LogLevel& level) {
    if (name == "debug") level = LogLevel::DEBUG;
    else if (name == "info") level = LogLevel::INFO;
    else if (name == "warn") level = LogLevel::WARN;
    else if (name == "error") level = LogLevel::ERROR;
    else return false;
    return true;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

bool Logger::init(const std::string& level, const std::string& format, const std::string& output) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    LogLevel parsed;
    if (!log_level_from_string(level, parsed)) {
        return false;
    }
    min_level_ = parsed;
    json_format_ = (format == "json");
    use_stderr_ = (output == "stderr");

    file_output_.reset();
    if (output != "stdout" && output != "stderr" && !output.empty()) {
        file_output_ = std::make_unique<std::ofstream>(output, std::ios::app);
        if (!file_output_->is_open()) {
            file_output_.reset();
            return false;
        }
    }
    return true;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lock(log_mutex_);
    std::string formatted = format_message(level, message, component);

    if (file_output_ && file_output_->is_open()) {
        *file_output_ << formatted << std::endl;
    } else if (use_stderr_) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::debug(const std::string& message, const std::string& component) {
    log(LogLevel::DEBUG, message, component);
}

void Logger::info(const std::string& message, const std::string& component) {
    log(LogLevel::INFO, message, component);
}

void Logger::warn(const std::string& message, const std::string& component) {
    log(LogLevel::WARN, message, component);
}

void Logger::error(const std::string& message, const std::string& component) {
    log(LogLevel::ERROR, message, component);
}

std::string Logger::format_message(LogLevel level, const std::string& message, const std::string& component) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    if (json_format_) {
        oss << "{"
            << "\"timestamp\":\"" << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\","
            << "\"level\":\"" << level_to_string(level) << "\",";
        if (!component.empty()) {
            oss << "\"component\":" << json_string(component) << ",";
        }
        oss << "\"message\":" << json_string(message)
            << "}";
    } else {
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << level_to_string(level) << "]";
        if (!component.empty()) {
            oss << " [" << component << "]";
        }
        oss << " " << message;
    }

    return oss.str();
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace spidercore
