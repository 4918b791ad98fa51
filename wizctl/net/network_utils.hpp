#pragma once

#include "wizctl/logging/wizctl_logging.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <optional>
#include <string>
#include <vector>

namespace wizctl
{

/**
 * @brief An IPv4 address assigned to a local network interface.
 */
struct NetworkInterface
{
    std::string name;                                          ///< Interface name, e.g. "eth0"
    boost::asio::ip::address_v4 address;                       ///< Address assigned to the interface
    std::optional<boost::asio::ip::address_v4> broadcast;      ///< Subnet broadcast address, if the interface has one
};

/**
 * Lists the IPv4 addresses of every local interface that is up.
 *
 * Loopback interfaces and link-local (169.254.0.0/16) addresses are skipped. An interface with
 * several IPv4 addresses appears once per address.
 *
 * Note: Uses getifaddrs(); this is a local kernel query and does not touch the network.
 *
 * @param logger Sink for diagnostics
 * @return The interfaces found, empty if enumeration failed
 */
std::vector<NetworkInterface> list_ipv4_interfaces(logging::Logger& logger = logging::null_logger());

} // namespace wizctl
