#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace wizctl
{

/// Base of every error raised by the protocol engines.
class WizError : public std::runtime_error
{
public:
    explicit WizError(const std::string& message);
};

/// Local socket failure: open, bind, option, send error or short write. Never retried.
class ConnectionError : public WizError
{
public:
    explicit ConnectionError(const std::string& message, const std::string& cause = std::string());

    const std::string& cause() const noexcept { return _cause; }

private:
    std::string _cause;
};

/// No reply from the device after every attempt was used up.
class TimeoutError : public WizError
{
public:
    TimeoutError(const std::string& address, std::chrono::milliseconds timeout, std::size_t attempts);

    const std::string& address() const noexcept { return _address; }
    std::chrono::milliseconds timeout() const noexcept { return _timeout; }

    /// Number of attempts made before giving up.
    std::size_t attempts() const noexcept { return _attempts; }

private:
    std::string _address;
    std::chrono::milliseconds _timeout;
    std::size_t _attempts;
};

/// The device firmware rejected the method (error code -32601).
class MethodNotFoundError : public WizError
{
public:
    MethodNotFoundError(const std::string& method, const std::string& address);

    const std::string& method() const noexcept { return _method; }
    const std::string& address() const noexcept { return _address; }

private:
    std::string _method;
    std::string _address;
};

/// The device answered with an error object, or with something that could not be parsed.
class ResponseError : public WizError
{
public:
    ResponseError(const std::string& message, std::optional<int> error_code, const std::string& raw_response);

    const std::optional<int>& error_code() const noexcept { return _error_code; }
    const std::string& raw_response() const noexcept { return _raw_response; }

private:
    std::string _raw_response;
    std::optional<int> _error_code;
};

/// An argument that cannot be used, such as an address that does not parse.
class ArgumentError : public WizError
{
public:
    ArgumentError(const std::string& argument_name, const std::string& invalid_value, const std::string& message);

    const std::string& argument_name() const noexcept { return _argument_name; }
    const std::string& invalid_value() const noexcept { return _invalid_value; }

private:
    std::string _argument_name;
    std::string _invalid_value;
};

} // namespace wizctl
