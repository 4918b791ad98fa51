#pragma once

#include "boost/asio/io_context.hpp"
#include "boost/asio/ip/udp.hpp"
#include "boost/asio/steady_timer.hpp"
#include "wizctl/exchange/exchange_states.hpp"
#include "wizctl/exchange/result_slot.hpp"
#include "wizctl/flags/flags.hpp"
#include "wizctl/logging/wizctl_logging.hpp"
#include "wizctl/net/udp_transport.hpp"
#include "wizctl/protocol/message.hpp"
#include "wizctl/protocol/protocol_constants.hpp"
#include "wizctl/retry/retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace wizctl
{

/**
 * @brief One request to one device, retried over silence with a per-attempt timeout.
 *
 * Each attempt sends the serialized message, then waits up to @c timeout for a reply.
 * Silence is retried after the retry policy's interval; any reply settles the exchange:
 * a plain object succeeds, an error object or unparsable bytes fail. A send error or a
 * short write fails immediately with ConnectionError.
 *
 * The exchange owns its socket. Once the outcome is settled every timer and the receive
 * are cancelled, and @c on_complete is posted after all of them have drained.
 *
 * Usage Example:
 * @code
 * boost::asio::io_context io_context;
 * Exchange exchange(io_context, make_endpoint("192.168.1.100", protocol::wiz_port),
 *                   protocol::make_request(protocol::method_get_pilot), std::chrono::seconds(1),
 *                   RetryPolicy::fixed(2, std::chrono::milliseconds(500)));
 * exchange.async_start();
 * io_context.run();
 * Reply reply = exchange.take_result(); // throws on failure
 * @endcode
 *
 * Any reply arriving on the socket is accepted, whether or not it answers this request's method.
 */
class Exchange
{
public:
    /**
     * @param io_context Context all operations complete on. Must be run for the exchange to progress.
     * @param peer Device endpoint.
     * @param message Request object; serialized once.
     * @param timeout Per-attempt wait for a reply.
     * @param retry Number of retries and spacing between them.
     * @param logger Diagnostics sink.
     * @throws ConnectionError if no socket can be acquired
     * @throws ArgumentError if the message cannot be serialized
     */
    Exchange(boost::asio::io_context& io_context, const boost::asio::ip::udp::endpoint& peer, const nlohmann::json& message,
             std::chrono::milliseconds timeout, const RetryPolicy& retry, logging::Logger& logger = logging::null_logger());

    ~Exchange() = default;

    Exchange(const Exchange&)            = delete;
    Exchange& operator=(const Exchange&) = delete;
    Exchange(Exchange&&)                 = delete;
    Exchange& operator=(Exchange&&)      = delete;

    /**
     * Starts the first attempt.
     * @param on_complete Posted once the outcome is settled and no operation is outstanding.
     * @return false if already started or already settled
     */
    bool async_start(std::function<void()> on_complete = {});

    /**
     * Returns the reply or rethrows the failure.
     * If the outcome was never settled (the io_context stopped early) it is settled here as a
     * TimeoutError carrying the attempts made so far.
     */
    Reply take_result();

    bool is_settled() const;

    std::size_t attempts() const;

    /// timeout * attempts + every retry interval, the longest a well-behaved exchange can take.
    std::chrono::milliseconds worst_case_duration() const;

    /// Names of the outstanding operations, for diagnostics.
    std::string to_string() const;

private:
    void start_receive();
    void begin_attempt();
    void handle_send(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_receive(const boost::system::error_code& error_code, const Datagram& datagram);
    void handle_reply(const Datagram& datagram);
    void handle_attempt_timeout(const boost::system::error_code& error_code);
    void handle_retry_interval(const boost::system::error_code& error_code);

    void settle_success(Reply reply);
    template <typename ErrorType> void settle_failure(ErrorType error);
    void cancel_outstanding();
    void resolve_on_completed();

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    logging::Logger& _logger;
    UdpTransport _transport;
    boost::asio::ip::udp::endpoint _peer;
    std::string _address;
    std::string _method;
    std::shared_ptr<const std::string> _payload;
    std::chrono::milliseconds _timeout;
    RetryPolicy _retry;

    std::size_t _attempt = 0;
    std::chrono::milliseconds _current_interval;
    boost::asio::steady_timer _attempt_timer;
    boost::asio::steady_timer _retry_timer;

    ResultSlot<Reply> _result;
    Flags<ExchangeState> _flags;
    std::function<void()> _on_complete;
};

/// Extra time granted after worst_case_duration() before a synchronous send gives up waiting.
constexpr std::chrono::milliseconds safety_grace = std::chrono::seconds(1);

/**
 * Runs @p io_context until it is out of work or @p bound has passed, whichever comes first.
 * Bounds too large for the clock run without limit.
 */
void run_within(boost::asio::io_context& io_context, std::chrono::milliseconds bound);

/// Exponential backoff, 5 retries from 750ms capped at 3s.
RetryPolicy default_send_retry_policy();

/**
 * @brief Sends one message to one device and waits for its reply.
 *
 * Runs an Exchange on a private io_context on the calling thread. Independent calls may run
 * on different threads at the same time.
 *
 * @throws TimeoutError no reply after every attempt
 * @throws ConnectionError socket failure
 * @throws MethodNotFoundError the device does not support the method
 * @throws ResponseError the device answered with an error or with unparsable bytes
 * @throws ArgumentError @p address is not an IPv4 address
 */
Reply send(const std::string& address, unsigned short port, const nlohmann::json& message,
           std::chrono::milliseconds timeout = protocol::default_timeout, const RetryPolicy& retry = default_send_retry_policy(),
           logging::Logger& logger = logging::null_logger());

} // namespace wizctl
