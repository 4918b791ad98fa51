#include "wizctl/exchange/exchange.hpp"
#include "wizctl/errors/wiz_errors.hpp"

#include "boost/asio/error.hpp"
#include "boost/asio/post.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace wizctl
{

namespace
{
// Longest bound handed to io_context::run_for; beyond it the clock arithmetic would overflow.
constexpr std::chrono::milliseconds max_run_bound = std::chrono::hours(24 * 30);

std::shared_ptr<const std::string> serialize(const nlohmann::json& message)
{
    try
    {
        return std::make_shared<const std::string>(message.dump());
    }
    catch (const nlohmann::json::exception& error)
    {
        throw ArgumentError("message", "<json>", std::string("Message cannot be serialized: ") + error.what());
    }
}
// The integer error code, or nothing when it is missing, not an integer or outside the range of int.
std::optional<int> error_code_of(const nlohmann::json& value)
{
    if (value.is_number_unsigned())
    {
        auto code = value.get<std::uint64_t>();
        if (code <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        {
            return static_cast<int>(code);
        }
        return std::nullopt;
    }
    if (value.is_number_integer())
    {
        auto code = value.get<std::int64_t>();
        if (code >= std::numeric_limits<int>::min() && code <= std::numeric_limits<int>::max())
        {
            return static_cast<int>(code);
        }
    }
    return std::nullopt;
}
} // namespace

Exchange::Exchange(boost::asio::io_context& io_context, const boost::asio::ip::udp::endpoint& peer, const nlohmann::json& message,
                   std::chrono::milliseconds timeout, const RetryPolicy& retry, logging::Logger& logger)
    : _io_context(io_context)
    , _logger(logger)
    , _transport(io_context, logger)
    , _peer(peer)
    , _address(peer.address().to_string())
    , _method(protocol::method_of(message))
    , _payload(serialize(message))
    , _timeout(timeout)
    , _retry(retry)
    , _current_interval(retry.base_interval())
    , _attempt_timer(io_context)
    , _retry_timer(io_context)
{
}

bool Exchange::async_start(std::function<void()> on_complete)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(ExchangeState::running) || !_result.is_pending())
        {
            return false;
        }

        _flags.set_flag(ExchangeState::running);
        _on_complete = std::move(on_complete);
    }

    WIZCTL_LOG_INFO(_logger, "Sending " << _method << " to " << _peer);
    WIZCTL_LOG_DEBUG(_logger, "Request: " << *_payload);

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          if (_result.is_pending())
                          {
                              start_receive();
                              begin_attempt();
                          }
                          else
                          {
                              resolve_on_completed();
                          }
                      });

    return true;
}

void Exchange::start_receive()
{
    _flags.set_flag(ExchangeState::receiving_async);
    _transport.async_receive([this](const boost::system::error_code& error_code, const Datagram& datagram)
                             { handle_receive(error_code, datagram); });
}

void Exchange::begin_attempt()
{
    ++_attempt;
    WIZCTL_LOG_DEBUG(_logger, "Attempt " << _attempt << "/" << _retry.total_attempts() << ": sending " << _payload->size() << " bytes");

    _flags.set_flag(ExchangeState::sending_async);
    _transport.async_send_to(_payload, _peer,
                             [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                             { handle_send(error_code, bytes_transferred); });
}

void Exchange::handle_send(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(ExchangeState::sending_async);

    if (!_result.is_pending())
    {
        resolve_on_completed();
        return;
    }

    if (error_code)
    {
        WIZCTL_LOG_ERROR(_logger, "Failed to send to " << _peer << ": " << error_code.message());
        settle_failure(ConnectionError("Failed to send to " + _address + ":" + std::to_string(_peer.port()), error_code.message()));
        return;
    }

    if (bytes_transferred != _payload->size())
    {
        WIZCTL_LOG_ERROR(_logger, "Incomplete send: " << bytes_transferred << "/" << _payload->size() << " bytes");
        settle_failure(ConnectionError("Failed to send to " + _address + ":" + std::to_string(_peer.port())));
        return;
    }

    _flags.set_flag(ExchangeState::attempt_timer_running);
    _attempt_timer.expires_at(saturating_deadline(std::chrono::steady_clock::now(), _timeout));
    _attempt_timer.async_wait([this](const boost::system::error_code& error_code) { handle_attempt_timeout(error_code); });
}

void Exchange::handle_receive(const boost::system::error_code& error_code, const Datagram& datagram)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(ExchangeState::receiving_async);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            WIZCTL_LOG_TRACE(_logger, "Receive aborted.");
        }
        else
        {
            WIZCTL_LOG_ERROR(_logger, "Error receiving from " << _peer << ": " << error_code.message());
            settle_failure(ConnectionError("Failed to receive from " + _address, error_code.message()));
            return;
        }
    }
    else if (!_result.is_pending())
    {
        WIZCTL_LOG_TRACE(_logger, "Ignoring late datagram from " << datagram.sender);
    }
    else
    {
        handle_reply(datagram);
    }

    if (_result.is_pending() && !error_code)
    {
        start_receive();
        return;
    }
    resolve_on_completed();
}

void Exchange::handle_reply(const Datagram& datagram)
{
    WIZCTL_LOG_DEBUG(_logger, "Received from " << datagram.sender << ": " << datagram.payload);

    nlohmann::json response = nlohmann::json::parse(datagram.payload, nullptr, false);
    if (response.is_discarded() || !response.is_object())
    {
        WIZCTL_LOG_ERROR(_logger, "Failed to parse response from " << _address);
        settle_failure(ResponseError("Failed to parse response from " + _address, std::nullopt, datagram.payload));
        return;
    }

    auto error_iter = response.find(protocol::key_error);
    if (error_iter != response.end())
    {
        std::optional<int> code;
        std::string message = "Unknown error";
        if (error_iter->is_object())
        {
            auto code_iter = error_iter->find(protocol::key_code);
            if (code_iter != error_iter->end())
            {
                code = error_code_of(*code_iter);
            }
            auto message_iter = error_iter->find(protocol::key_message);
            if (message_iter != error_iter->end() && message_iter->is_string())
            {
                message = message_iter->get<std::string>();
            }
        }

        WIZCTL_LOG_ERROR(_logger, "Error response: code=" << (code ? std::to_string(*code) : "none") << ", message=" << message);

        if (code == protocol::error_code_method_not_found)
        {
            settle_failure(MethodNotFoundError(_method, _address));
        }
        else
        {
            settle_failure(ResponseError("Error from light: " + message, code, datagram.payload));
        }
        return;
    }

    WIZCTL_LOG_INFO(_logger, "Success: " << _method << " response from " << _address);
    settle_success(Reply {std::move(response), datagram.sender});
}

void Exchange::handle_attempt_timeout(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(ExchangeState::attempt_timer_running);

    if (error_code == boost::asio::error::operation_aborted || !_result.is_pending())
    {
        resolve_on_completed();
        return;
    }
    if (error_code)
    {
        WIZCTL_LOG_ERROR(_logger, "Timer error: " << error_code.message());
    }

    WIZCTL_LOG_DEBUG(_logger, "Attempt " << _attempt << " timed out after " << _timeout.count() << "ms");

    if (_attempt < _retry.total_attempts())
    {
        WIZCTL_LOG_TRACE(_logger, "Waiting " << _current_interval.count() << "ms before retry");
        _flags.set_flag(ExchangeState::retry_timer_running);
        _retry_timer.expires_at(saturating_deadline(std::chrono::steady_clock::now(), _current_interval));
        _retry_timer.async_wait([this](const boost::system::error_code& error_code) { handle_retry_interval(error_code); });
    }
    else
    {
        WIZCTL_LOG_ERROR(_logger, "Timeout after " << _attempt << " attempts to " << _address);
        settle_failure(TimeoutError(_address, _timeout, _attempt));
    }
}

void Exchange::handle_retry_interval(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(ExchangeState::retry_timer_running);

    if (error_code == boost::asio::error::operation_aborted || !_result.is_pending())
    {
        resolve_on_completed();
        return;
    }

    _current_interval = _retry.next_interval(_current_interval);
    begin_attempt();
}

void Exchange::settle_success(Reply reply)
{
    if (_result.try_succeed(std::move(reply)))
    {
        cancel_outstanding();
    }
    resolve_on_completed();
}

template <typename ErrorType>
void Exchange::settle_failure(ErrorType error)
{
    if (_result.try_fail_with(std::move(error)))
    {
        cancel_outstanding();
    }
    resolve_on_completed();
}

void Exchange::cancel_outstanding()
{
    _attempt_timer.cancel();
    _retry_timer.cancel();
    _transport.cancel();
}

void Exchange::resolve_on_completed()
{
    if (_result.is_pending() || !_flags.get_flag(ExchangeState::running))
    {
        return;
    }

    if (_flags.any_of({ExchangeState::sending_async, ExchangeState::receiving_async, ExchangeState::attempt_timer_running,
                       ExchangeState::retry_timer_running}))
    {
        return;
    }

    _flags.clear_flag(ExchangeState::running);
    _transport.close();

    if (_on_complete)
    {
        boost::asio::post(_io_context, std::move(_on_complete));
        _on_complete = nullptr;
    }
}

Reply Exchange::take_result()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_result.is_pending())
    {
        WIZCTL_LOG_ERROR(_logger, "Exchange with " << _address << " never settled (" << to_string() << "), failing after " << _attempt
                                                   << " attempts");
        _result.try_fail_with(TimeoutError(_address, _timeout, _attempt));
        cancel_outstanding();
        _transport.close();
    }
    lock.unlock();

    return _result.take();
}

bool Exchange::is_settled() const
{
    return !_result.is_pending();
}

std::size_t Exchange::attempts() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _attempt;
}

std::chrono::milliseconds Exchange::worst_case_duration() const
{
    return saturating_add(saturating_multiply(_timeout, _retry.total_attempts()), _retry.total_retry_delay());
}

std::string Exchange::to_string() const
{
    static constexpr std::array<ExchangeState, 5> states = {ExchangeState::running, ExchangeState::sending_async,
                                                            ExchangeState::receiving_async, ExchangeState::attempt_timer_running,
                                                            ExchangeState::retry_timer_running};

    std::string result = "Exchange flags: [";
    bool first         = true;
    for (ExchangeState state : states)
    {
        if (_flags.get_flag(state))
        {
            if (!first)
            {
                result += ", ";
            }
            result += wizctl::to_string(state);
            first = false;
        }
    }
    result += "]";
    return result;
}

void run_within(boost::asio::io_context& io_context, std::chrono::milliseconds bound)
{
    if (bound >= max_run_bound)
    {
        io_context.run();
    }
    else
    {
        io_context.run_for(bound);
    }
}

RetryPolicy default_send_retry_policy()
{
    return RetryPolicy::exponential(protocol::max_send_datagrams - 1, protocol::first_send_interval, protocol::max_backoff);
}

Reply send(const std::string& address, unsigned short port, const nlohmann::json& message, std::chrono::milliseconds timeout,
           const RetryPolicy& retry, logging::Logger& logger)
{
    boost::asio::io_context io_context;
    Exchange exchange(io_context, make_endpoint(address, port), message, timeout, retry, logger);
    exchange.async_start();

    run_within(io_context, saturating_add(exchange.worst_case_duration(), safety_grace));

    return exchange.take_result();
}

} // namespace wizctl
