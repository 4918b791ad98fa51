#pragma once

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace wizctl
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Helper function to get log level name
inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

/**
 * @brief Sink for log messages emitted by the protocol engines.
 *
 * A logger is handed to every engine explicitly. Logging never influences control flow.
 */
class Logger
{
public:
    virtual ~Logger() = default;

    /// Whether a message at this level would be kept. Lets the macros skip formatting.
    virtual bool should_log(LogLevel level) const = 0;

    virtual void log(LogLevel level, const std::string& message) = 0;
};

/// Discards everything. The default for all engines.
class NullLogger : public Logger
{
public:
    bool should_log(LogLevel /*level*/) const override { return false; }
    void log(LogLevel /*level*/, const std::string& /*message*/) override { }
};

/// Prints "[LEVEL] message" lines to std::cout for every level up to max_level.
class ConsoleLogger : public Logger
{
public:
    explicit ConsoleLogger(LogLevel max_level = LogLevel::Info);

    bool should_log(LogLevel level) const override;
    void log(LogLevel level, const std::string& message) override;

    void set_max_level(LogLevel max_level) { _max_level = max_level; }
    LogLevel max_level() const { return _max_level; }

private:
    LogLevel _max_level;
};

/// Forwards every message up to max_level to a user supplied function.
class CallbackLogger : public Logger
{
public:
    using Callback = std::function<void(LogLevel level, const std::string& message)>;

    CallbackLogger(LogLevel max_level, Callback callback);

    bool should_log(LogLevel level) const override;
    void log(LogLevel level, const std::string& message) override;

private:
    LogLevel _max_level;
    Callback _callback;
};

/// Shared logger that drops every message.
Logger& null_logger();

} // namespace logging
} // namespace wizctl

// Logging macros that accept stream expressions
#define WIZCTL_LOG_AT(logger, level, message)                                                                                        \
    do                                                                                                                               \
    {                                                                                                                                \
        if ((logger).should_log(level))                                                                                              \
        {                                                                                                                            \
            std::ostringstream oss;                                                                                                  \
            oss << __func__ << ": " << message;                                                                                      \
            (logger).log(level, oss.str());                                                                                          \
        }                                                                                                                            \
    } while (0)

#define WIZCTL_LOG_ERROR(logger, message)   WIZCTL_LOG_AT(logger, wizctl::logging::LogLevel::Error, message)
#define WIZCTL_LOG_WARNING(logger, message) WIZCTL_LOG_AT(logger, wizctl::logging::LogLevel::Warning, message)
#define WIZCTL_LOG_INFO(logger, message)    WIZCTL_LOG_AT(logger, wizctl::logging::LogLevel::Info, message)
#define WIZCTL_LOG_DEBUG(logger, message)   WIZCTL_LOG_AT(logger, wizctl::logging::LogLevel::Debug, message)
#define WIZCTL_LOG_TRACE(logger, message)   WIZCTL_LOG_AT(logger, wizctl::logging::LogLevel::Trace, message)
