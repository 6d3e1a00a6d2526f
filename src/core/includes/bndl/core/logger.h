#pragma once

#include <cstring>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                  \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    // "[HH:MM:SS.mmm] " in local time
    static std::string
    format_timestamp();

    static const char*
    level_prefix(LogLevel level);

    // Warnings and errors go to the error stream, the rest to the output
    // stream
    static void
    emit(LogLevel level, const std::string& line);

public:
    static void
    set_level(LogLevel level);

    // Accepts none, error, warn, warning, info and debug in any case
    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect info/debug output (nullptr restores std::cout)
    static void
    set_output_stream(std::ostream* output_stream);

    // Redirect warning/error output (nullptr restores std::cerr)
    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    // Log with efficient formatting using variadic templates
    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;

        // Format before locking
        std::ostringstream oss;
        oss << format_timestamp() << level_prefix(level);
        (oss << ... << args);

        emit(level, oss.str());
    }

    // Write a pre-formatted message without consulting the global level.
    // Used by log partitions, which carry their own level.
    static void
    write_line(LogLevel level, const std::string& message)
    {
        emit(level, format_timestamp() + level_prefix(level) + message);
    }
};

class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel messageLevel) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            messageLevel <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

namespace detail {
// Partitions may be more verbose than the global level
template <typename... Args>
inline void
log_partition(
    const LogPartition& partition,
    LogLevel level,
    const char* file,
    int line,
    const Args&... args)
{
    if (!partition.should_log(level))
        return;

    std::ostringstream oss;
    oss << "[" << partition.name() << "] ";
    (oss << ... << args);
    oss << " (" << file << ":" << line << ")";
    Logger::write_line(level, oss.str());
}
}  // namespace detail

#define PLOGE(partition, ...)    \
    ::detail::log_partition(     \
        partition,               \
        LogLevel::ERROR,         \
        __RELATIVE_FILEPATH__,   \
        __LINE__,                \
        __VA_ARGS__)
#define PLOGW(partition, ...)    \
    ::detail::log_partition(     \
        partition,               \
        LogLevel::WARNING,       \
        __RELATIVE_FILEPATH__,   \
        __LINE__,                \
        __VA_ARGS__)
#define PLOGI(partition, ...)    \
    ::detail::log_partition(     \
        partition,               \
        LogLevel::INFO,          \
        __RELATIVE_FILEPATH__,   \
        __LINE__,                \
        __VA_ARGS__)
#define PLOGD(partition, ...)    \
    ::detail::log_partition(     \
        partition,               \
        LogLevel::DEBUG,         \
        __RELATIVE_FILEPATH__,   \
        __LINE__,                \
        __VA_ARGS__)

#define LOGE(...)              \
    Logger::log(               \
        LogLevel::ERROR,       \
        __VA_ARGS__,           \
        " (",                  \
        __RELATIVE_FILEPATH__, \
        ":",                   \
        __LINE__,              \
        ")")
#define LOGW(...)                                 \
    if (Logger::get_level() >= LogLevel::WARNING) \
    Logger::log(                                  \
        LogLevel::WARNING,                        \
        __VA_ARGS__,                              \
        " (",                                     \
        __RELATIVE_FILEPATH__,                    \
        ":",                                      \
        __LINE__,                                 \
        ")")
#define LOGI(...)                              \
    if (Logger::get_level() >= LogLevel::INFO) \
    Logger::log(                               \
        LogLevel::INFO,                        \
        __VA_ARGS__,                           \
        " (",                                  \
        __RELATIVE_FILEPATH__,                 \
        ":",                                   \
        __LINE__,                              \
        ")")
#define LOGD(...)                               \
    if (Logger::get_level() >= LogLevel::DEBUG) \
    Logger::log(                                \
        LogLevel::DEBUG,                        \
        __VA_ARGS__,                            \
        " (",                                   \
        __RELATIVE_FILEPATH__,                  \
        ":",                                    \
        __LINE__,                               \
        ")")
