#pragma once

#include "boost/asio/io_context.hpp"
#include "boost/asio/ip/udp.hpp"
#include "wizctl/logging/wizctl_logging.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace wizctl
{

/// One received datagram and where it came from.
struct Datagram
{
    std::string payload;
    boost::asio::ip::udp::endpoint sender;
};

/**
 * @brief Owns one IPv4 UDP socket bound to an ephemeral local port.
 *
 * The socket is opened and bound in the constructor and closed in the destructor, so its
 * lifetime is the lifetime of the owning call. At most one receive may be outstanding.
 * Acquisition failures throw ConnectionError.
 */
class UdpTransport
{
public:
    using SendHandler    = std::function<void(const boost::system::error_code& error_code, std::size_t bytes_transferred)>;
    using ReceiveHandler = std::function<void(const boost::system::error_code& error_code, const Datagram& datagram)>;

    /// Size of the receive buffer in bytes. Larger datagrams are truncated.
    static constexpr std::size_t recv_buffer_size = 8192;

    /**
     * @param io_context Context the socket's operations complete on.
     * @param logger Sink for diagnostics.
     * @param broadcast Enable SO_BROADCAST.
     * @param local_address Address to bind to; the port is always chosen by the OS.
     */
    UdpTransport(boost::asio::io_context& io_context, logging::Logger& logger, bool broadcast = false,
                 const boost::asio::ip::address_v4& local_address = boost::asio::ip::address_v4::any());

    ~UdpTransport();

    UdpTransport(const UdpTransport&)            = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;
    UdpTransport(UdpTransport&&)                 = delete;
    UdpTransport& operator=(UdpTransport&&)      = delete;

    /// Sends the whole payload. The payload is kept alive until the handler has run.
    void async_send_to(std::shared_ptr<const std::string> payload, const boost::asio::ip::udp::endpoint& destination,
                       SendHandler handler);

    void async_receive(ReceiveHandler handler);

    /// Aborts outstanding operations; their handlers run with operation_aborted.
    void cancel();

    void close();

    bool is_open() const { return _socket.is_open(); }
    unsigned short local_port() const;

private:
    logging::Logger& _logger;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    std::array<char, recv_buffer_size> _recv_buffer;
};

/**
 * Parses an IPv4 address and pairs it with a port.
 * @throws ArgumentError when @p address is not an IPv4 address.
 */
boost::asio::ip::udp::endpoint make_endpoint(const std::string& address, unsigned short port);

} // namespace wizctl
