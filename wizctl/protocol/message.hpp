#pragma once

#include <optional>
#include <ostream>
#include <string>

#include <boost/asio/ip/udp.hpp>
#include <nlohmann/json.hpp>

namespace wizctl
{

/**
 * @brief A parsed reply datagram together with the endpoint that sent it.
 */
struct Reply
{
    nlohmann::json body;                     ///< Top-level JSON object as received
    boost::asio::ip::udp::endpoint sender;   ///< Address and port the datagram came from

    /// The "result" object, or the whole body when the device sent none.
    const nlohmann::json& result() const;
};

/**
 * @brief A device that answered a registration broadcast.
 */
struct DiscoveredDevice
{
    std::string ip;
    std::string mac;
    std::optional<std::string> module_name;
    std::optional<std::string> fw_version;

    /**
     * @brief Builds a device from a registration reply.
     * @param reply Parsed reply; fields are read from "result" when present, otherwise from the top level.
     * @param ip Address the reply came from.
     * @return The device, or std::nullopt when the reply carries no MAC address.
     */
    static std::optional<DiscoveredDevice> from_json(const nlohmann::json& reply, const std::string& ip);
};

bool operator==(const DiscoveredDevice& lhs, const DiscoveredDevice& rhs);
std::ostream& operator<<(std::ostream& stream, const DiscoveredDevice& device);

namespace protocol
{

/// {"method": method, "params": params}
nlohmann::json make_request(const std::string& method, const nlohmann::json& params = nlohmann::json::object());

/// The registration request broadcast during discovery.
nlohmann::json make_registration_request();

/// Method name of a request, "unknown" when it has none.
std::string method_of(const nlohmann::json& message);

} // namespace protocol
} // namespace wizctl
