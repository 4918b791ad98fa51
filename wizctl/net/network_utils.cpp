#include "wizctl/net/network_utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <memory>
#include <net/if.h>
#include <netinet/in.h>
#include <utility>

namespace wizctl
{

namespace
{
struct IfaddrsDeleter
{
    void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

boost::asio::ip::address_v4 to_address(const sockaddr* address)
{
    const auto* ipv4 = reinterpret_cast<const sockaddr_in*>(address);
    return boost::asio::ip::address_v4(ntohl(ipv4->sin_addr.s_addr));
}

bool is_link_local(const boost::asio::ip::address_v4& address)
{
    return (address.to_uint() >> 16) == 0xA9FE;
}
} // namespace

std::vector<NetworkInterface> list_ipv4_interfaces(logging::Logger& logger)
{
    std::vector<NetworkInterface> interfaces;

    ifaddrs* raw_list = nullptr;
    if (getifaddrs(&raw_list) != 0)
    {
        WIZCTL_LOG_ERROR(logger, "getifaddrs failed: " << std::strerror(errno));
        return interfaces;
    }
    std::unique_ptr<ifaddrs, IfaddrsDeleter> list(raw_list);

    for (const ifaddrs* entry = list.get(); entry != nullptr; entry = entry->ifa_next)
    {
        if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }
        if ((entry->ifa_flags & IFF_UP) == 0 || (entry->ifa_flags & IFF_LOOPBACK) != 0)
        {
            continue;
        }

        NetworkInterface network_interface;
        network_interface.name    = entry->ifa_name != nullptr ? entry->ifa_name : "";
        network_interface.address = to_address(entry->ifa_addr);

        if (network_interface.address.is_loopback() || is_link_local(network_interface.address))
        {
            continue;
        }

        if ((entry->ifa_flags & IFF_BROADCAST) != 0 && entry->ifa_broadaddr != nullptr && entry->ifa_broadaddr->sa_family == AF_INET)
        {
            network_interface.broadcast = to_address(entry->ifa_broadaddr);
        }

        WIZCTL_LOG_DEBUG(logger, "Interface " << network_interface.name << ": " << network_interface.address);
        interfaces.push_back(std::move(network_interface));
    }

    return interfaces;
}

} // namespace wizctl
