#pragma once

#include <string>
#include <atomic>
#include <fstream>
#include <mutex>
#include <memory>

namespace spidercore {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

bool log_level_from_string(const std::string& name, LogLevel& level);

class Logger {
public:
    static Logger& instance();

    // format is "text" or "json"; output is "stdout", "stderr" or a file path
    bool init(const std::string& level, const std::string& format, const std::string& output);

    void set_level(LogLevel level);
    bool enabled(LogLevel level) const { return level >= min_level_.load(); }

    void log(LogLevel level, const std::string& message, const std::string& component = "");
    void debug(const std::string& message, const std::string& component = "");
    void info(const std::string& message, const std::string& component = "");
    void warn(const std::string& message, const std::string& component = "");
    void error(const std::string& message, const std::string& component = "");

private:
    Logger() = default;

    std::string format_message(LogLevel level, const std::string& message, const std::string& component);
    std::string level_to_string(LogLevel level);

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    bool json_format_ = false;
    bool use_stderr_ = false;
    std::unique_ptr<std::ofstream> file_output_;
    std::mutex log_mutex_;
};

} // namespace spidercore
