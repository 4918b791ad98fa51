#include "wizctl/net/udp_transport.hpp"
#include "wizctl/errors/wiz_errors.hpp"

#include "boost/asio/buffer.hpp"
#include "boost/asio/error.hpp"
#include <boost/system/error_code.hpp>

#include <utility>

namespace wizctl
{

UdpTransport::UdpTransport(boost::asio::io_context& io_context, logging::Logger& logger, bool broadcast,
                           const boost::asio::ip::address_v4& local_address)
    : _logger(logger), _socket(io_context), _recv_buffer()
{
    boost::system::error_code error_code;

    _socket.open(boost::asio::ip::udp::v4(), error_code);
    if (error_code)
    {
        WIZCTL_LOG_ERROR(_logger, "Failed to open socket: " << error_code.message());
        throw ConnectionError("Failed to open UDP socket", error_code.message());
    }

    if (broadcast)
    {
        _socket.set_option(boost::asio::socket_base::broadcast(true), error_code);
        if (error_code)
        {
            WIZCTL_LOG_ERROR(_logger, "Failed to enable broadcast: " << error_code.message());
            throw ConnectionError("Failed to enable broadcast on UDP socket", error_code.message());
        }
    }

    _socket.bind(boost::asio::ip::udp::endpoint(local_address, 0), error_code);
    if (error_code)
    {
        WIZCTL_LOG_ERROR(_logger, "Failed to bind to " << local_address << ": " << error_code.message());
        throw ConnectionError("Failed to bind UDP socket to " + local_address.to_string(), error_code.message());
    }

    WIZCTL_LOG_TRACE(_logger, "Bound to local port " << local_port() << (broadcast ? " (broadcast)" : ""));
}

UdpTransport::~UdpTransport()
{
    close();
}

void UdpTransport::async_send_to(std::shared_ptr<const std::string> payload, const boost::asio::ip::udp::endpoint& destination,
                                 SendHandler handler)
{
    const std::string& data = *payload;
    _socket.async_send_to(boost::asio::buffer(data), destination,
                          [payload = std::move(payload), handler = std::move(handler)](const boost::system::error_code& error_code,
                                                                                       std::size_t bytes_transferred)
                          { handler(error_code, bytes_transferred); });
}

void UdpTransport::async_receive(ReceiveHandler handler)
{
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [this, handler = std::move(handler)](const boost::system::error_code& error_code,
                                                                    std::size_t bytes_transferred)
                               {
                                   Datagram datagram;
                                   if (!error_code)
                                   {
                                       datagram.payload.assign(_recv_buffer.data(), bytes_transferred);
                                       datagram.sender = _remote_endpoint;
                                   }
                                   handler(error_code, datagram);
                               });
}

void UdpTransport::cancel()
{
    boost::system::error_code error_code;
    _socket.cancel(error_code);
    if (error_code && error_code != boost::asio::error::bad_descriptor)
    {
        WIZCTL_LOG_DEBUG(_logger, "Cancel failed: " << error_code.message());
    }
}

void UdpTransport::close()
{
    if (!_socket.is_open())
    {
        return;
    }

    boost::system::error_code error_code;
    _socket.close(error_code);
    if (error_code)
    {
        WIZCTL_LOG_ERROR(_logger, "Failed to close socket: " << error_code.message());
    }
    else
    {
        WIZCTL_LOG_TRACE(_logger, "Socket closed");
    }
}

unsigned short UdpTransport::local_port() const
{
    boost::system::error_code error_code;
    auto endpoint = _socket.local_endpoint(error_code);
    return error_code ? 0 : endpoint.port();
}

boost::asio::ip::udp::endpoint make_endpoint(const std::string& address, unsigned short port)
{
    boost::system::error_code error_code;
    auto parsed = boost::asio::ip::make_address_v4(address, error_code);
    if (error_code)
    {
        throw ArgumentError("address", address, "Not a valid IPv4 address");
    }
    return boost::asio::ip::udp::endpoint(parsed, port);
}

} // namespace wizctl
