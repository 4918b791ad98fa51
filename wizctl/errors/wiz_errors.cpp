#include "wizctl/errors/wiz_errors.hpp"

#include <sstream>

namespace wizctl
{

namespace
{
std::string describe_connection_error(const std::string& message, const std::string& cause)
{
    if (cause.empty())
    {
        return message;
    }
    return message + " (caused by: " + cause + ")";
}

std::string describe_timeout(const std::string& address, std::chrono::milliseconds timeout, std::size_t attempts)
{
    std::ostringstream oss;
    oss << "Light at " << address << " did not respond after " << attempts << " attempts (" << timeout.count() << "ms timeout)";
    return oss.str();
}

std::string describe_response_error(const std::string& message, const std::optional<int>& error_code, const std::string& raw_response)
{
    std::ostringstream oss;
    oss << message;
    if (error_code)
    {
        oss << " (code: " << *error_code << ")";
    }
    if (!raw_response.empty())
    {
        oss << " (response: " << raw_response << ")";
    }
    return oss.str();
}
} // namespace

WizError::WizError(const std::string& message) : std::runtime_error(message)
{
}

ConnectionError::ConnectionError(const std::string& message, const std::string& cause)
    : WizError(describe_connection_error(message, cause)), _cause(cause)
{
}

TimeoutError::TimeoutError(const std::string& address, std::chrono::milliseconds timeout, std::size_t attempts)
    : WizError(describe_timeout(address, timeout, attempts)), _address(address), _timeout(timeout), _attempts(attempts)
{
}

MethodNotFoundError::MethodNotFoundError(const std::string& method, const std::string& address)
    : WizError("Method \"" + method + "\" not supported by light at " + address), _method(method), _address(address)
{
}

ResponseError::ResponseError(const std::string& message, std::optional<int> error_code, const std::string& raw_response)
    : WizError(describe_response_error(message, error_code, raw_response)), _raw_response(raw_response), _error_code(error_code)
{
}

ArgumentError::ArgumentError(const std::string& argument_name, const std::string& invalid_value, const std::string& message)
    : WizError(message + " (argument: " + argument_name + ", value: " + invalid_value + ")")
    , _argument_name(argument_name)
    , _invalid_value(invalid_value)
{
}

} // namespace wizctl
