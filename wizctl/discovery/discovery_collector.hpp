#pragma once

#include "boost/asio/io_context.hpp"
#include "boost/asio/ip/udp.hpp"
#include "boost/asio/steady_timer.hpp"
#include "wizctl/discovery/discovery_states.hpp"
#include "wizctl/flags/flags.hpp"
#include "wizctl/logging/wizctl_logging.hpp"
#include "wizctl/net/network_utils.hpp"
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
#include <unordered_set>
#include <vector>

namespace wizctl
{

/**
 * @brief Broadcasts a registration request and collects every device that answers within one window.
 *
 * The window is a single total deadline. The initial broadcast goes out immediately; when the
 * retry policy is enabled up to max_retries repeats follow, spaced by the policy. A repeat whose
 * timer fires after the window has elapsed is dropped along with all later ones.
 *
 * Replies are deduplicated by MAC address, first reply wins. Malformed datagrams and send
 * failures are logged and otherwise ignored.
 */
class DiscoveryCollector
{
public:
    /**
     * @param io_context Context all operations complete on.
     * @param broadcast_endpoint Broadcast address and device port.
     * @param total_timeout Length of the collection window.
     * @param retry Repeat broadcasts; disabled() sends one broadcast only.
     * @param logger Diagnostics sink.
     * @param local_address Address to bind the socket to, selecting the interface.
     * @throws ConnectionError if no broadcast-capable socket can be acquired
     */
    DiscoveryCollector(boost::asio::io_context& io_context, const boost::asio::ip::udp::endpoint& broadcast_endpoint,
                       std::chrono::milliseconds total_timeout, const RetryPolicy& retry, logging::Logger& logger = logging::null_logger(),
                       const boost::asio::ip::address_v4& local_address = boost::asio::ip::address_v4::any());

    ~DiscoveryCollector() = default;

    DiscoveryCollector(const DiscoveryCollector&)            = delete;
    DiscoveryCollector& operator=(const DiscoveryCollector&) = delete;
    DiscoveryCollector(DiscoveryCollector&&)                 = delete;
    DiscoveryCollector& operator=(DiscoveryCollector&&)      = delete;

    /**
     * Opens the window and sends the initial broadcast.
     * @param on_complete Posted after the window closed and every operation drained.
     * @return false if already started
     */
    bool async_start(std::function<void()> on_complete = {});

    /// Devices collected so far, in arrival order.
    std::vector<DiscoveredDevice> devices() const;

    /// Broadcasts handed to the socket, the initial one included.
    std::size_t broadcasts_sent() const;

    bool is_complete() const;

private:
    void start_receive();
    void send_broadcast();
    void schedule_repeat();
    void handle_send(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_receive(const boost::system::error_code& error_code, const Datagram& datagram);
    void handle_repeat(const boost::system::error_code& error_code);
    void handle_window_closed(const boost::system::error_code& error_code);
    void resolve_on_completed();

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    logging::Logger& _logger;
    UdpTransport _transport;
    boost::asio::ip::udp::endpoint _broadcast_endpoint;
    std::chrono::milliseconds _total_timeout;
    RetryPolicy _retry;
    std::shared_ptr<const std::string> _payload;

    std::chrono::steady_clock::time_point _window_start;
    boost::asio::steady_timer _window_timer;
    boost::asio::steady_timer _repeat_timer;
    std::chrono::milliseconds _current_interval;
    std::size_t _repeats_sent    = 0;
    std::size_t _broadcasts_sent = 0;
    std::size_t _sends_in_flight = 0;

    std::unordered_set<std::string> _seen_macs;
    std::vector<DiscoveredDevice> _devices;

    Flags<DiscoveryState> _flags;
    bool _complete = false;
    std::function<void()> _on_complete;
};

/// Exponential backoff, 5 repeats from 500ms capped at 3s.
RetryPolicy default_discovery_retry_policy();

/**
 * @brief Finds the devices reachable through a broadcast address.
 *
 * Blocks for @p total_timeout. An empty result is not an error.
 *
 * @param broadcast_address Usually 255.255.255.255, or a subnet broadcast address.
 * @param local_address Bind address selecting the outgoing interface, empty for any.
 * @throws ConnectionError the broadcast socket cannot be acquired
 * @throws ArgumentError an address does not parse
 */
std::vector<DiscoveredDevice> discover(const std::string& broadcast_address = protocol::default_broadcast_address,
                                       std::chrono::milliseconds total_timeout = protocol::default_discovery_timeout,
                                       const RetryPolicy& retry = default_discovery_retry_policy(),
                                       unsigned short port = protocol::wiz_port, logging::Logger& logger = logging::null_logger(),
                                       const std::string& local_address = std::string());

/// Discovery through a single interface.
using InterfaceDiscovery = std::function<std::vector<DiscoveredDevice>(const NetworkInterface& network_interface)>;

/**
 * @brief Runs @p discover_on for each interface in turn and merges the results by MAC.
 *
 * The first interface to report a MAC wins. A WizError from one interface is logged and the
 * remaining interfaces are still tried.
 */
std::vector<DiscoveredDevice> merge_interface_discoveries(const std::vector<NetworkInterface>& interfaces,
                                                          const InterfaceDiscovery& discover_on,
                                                          logging::Logger& logger = logging::null_logger());

/**
 * @brief Runs discover() once per local IPv4 interface and merges the results by MAC.
 *
 * Each interface gets its own full window, so the call takes total_timeout per interface.
 * An interface whose discovery fails is skipped.
 */
std::vector<DiscoveredDevice> discover_on_all_interfaces(std::chrono::milliseconds total_timeout = protocol::default_discovery_timeout,
                                                         const RetryPolicy& retry = default_discovery_retry_policy(),
                                                         unsigned short port = protocol::wiz_port,
                                                         logging::Logger& logger = logging::null_logger());

} // namespace wizctl
