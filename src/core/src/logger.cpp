#include "bndl/core/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string_view>

LogLevel Logger::current_level_ = LogLevel::ERROR;
std::mutex Logger::log_mutex_;
std::ostream* Logger::output_stream_ = nullptr;
std::ostream* Logger::error_stream_ = nullptr;

namespace {

struct LevelName
{
    std::string_view name;
    LogLevel level;
};

// Names accepted by --log-level; the first match is used when printing
constexpr std::array<LevelName, 6> LEVEL_NAMES = {{
    {"none", LogLevel::NONE},
    {"error", LogLevel::ERROR},
    {"warn", LogLevel::WARNING},
    {"warning", LogLevel::WARNING},
    {"info", LogLevel::INFO},
    {"debug", LogLevel::DEBUG},
}};

std::string_view
level_name(LogLevel level)
{
    for (const auto& entry : LEVEL_NAMES)
    {
        if (entry.level == level)
        {
            return entry.name;
        }
    }
    return "inherit";
}

}  // namespace

bool
Logger::should_log(LogLevel level)
{
    return current_level_ != LogLevel::NONE && level <= current_level_;
}

std::string
Logger::format_timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
        1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
        << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
        << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";
    return oss.str();
}

const char*
Logger::level_prefix(LogLevel level)
{
    switch (level)
    {
        case LogLevel::ERROR:
            return "[ERROR] ";
        case LogLevel::WARNING:
            return "[WARN]  ";
        case LogLevel::INFO:
            return "[INFO]  ";
        case LogLevel::DEBUG:
            return "[DEBUG] ";
        case LogLevel::NONE:
        case LogLevel::INHERIT:
            break;
    }
    return "";
}

void
Logger::emit(LogLevel level, const std::string& line)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::ostream* out = (level <= LogLevel::WARNING)
        ? (error_stream_ ? error_stream_ : &std::cerr)
        : (output_stream_ ? output_stream_ : &std::cout);
    *out << line << std::endl;
}

void
Logger::set_level(LogLevel level)
{
    current_level_ = level;
    if (should_log(LogLevel::DEBUG))
    {
        write_line(
            LogLevel::DEBUG,
            "Log level set to " + std::string(level_name(level)));
    }
}

bool
Logger::set_level(const std::string& level)
{
    std::string lowered = level;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    auto it = std::ranges::find(
        LEVEL_NAMES, std::string_view(lowered), &LevelName::name);
    if (it == LEVEL_NAMES.end())
    {
        return false;
    }
    set_level(it->level);
    return true;
}

LogLevel
Logger::get_level()
{
    return current_level_;
}

void
Logger::set_output_stream(std::ostream* output_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = output_stream;
}

void
Logger::set_error_stream(std::ostream* error_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    error_stream_ = error_stream;
}

void
Logger::reset_streams()
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = nullptr;
    error_stream_ = nullptr;
}
