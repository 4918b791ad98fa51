#include "wizctl/logging/wizctl_logging.hpp"

#include <utility>

namespace wizctl
{
namespace logging
{

namespace
{
bool within(LogLevel level, LogLevel max_level)
{
    return static_cast<int>(level) <= static_cast<int>(max_level);
}
} // namespace

ConsoleLogger::ConsoleLogger(LogLevel max_level) : _max_level(max_level)
{
}

bool ConsoleLogger::should_log(LogLevel level) const
{
    return within(level, _max_level);
}

void ConsoleLogger::log(LogLevel level, const std::string& message)
{
    if (!should_log(level))
    {
        return;
    }

    std::ostringstream oss;
    oss << "[" << get_log_level_name(level) << "] " << message << "\n";
    std::cout << oss.str();
}

CallbackLogger::CallbackLogger(LogLevel max_level, Callback callback) : _max_level(max_level), _callback(std::move(callback))
{
}

bool CallbackLogger::should_log(LogLevel level) const
{
    return _callback && within(level, _max_level);
}

void CallbackLogger::log(LogLevel level, const std::string& message)
{
    if (should_log(level))
    {
        _callback(level, message);
    }
}

Logger& null_logger()
{
    static NullLogger logger;
    return logger;
}

} // namespace logging
} // namespace wizctl
