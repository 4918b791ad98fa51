#include "wizctl/protocol/message.hpp"
#include "wizctl/protocol/protocol_constants.hpp"

namespace wizctl
{

namespace
{
std::optional<std::string> optional_string(const nlohmann::json& object, const char* key)
{
    auto iter = object.find(key);
    if (iter != object.end() && iter->is_string())
    {
        return iter->get<std::string>();
    }
    return std::nullopt;
}
} // namespace

const nlohmann::json& Reply::result() const
{
    auto iter = body.find(protocol::key_result);
    if (iter != body.end() && iter->is_object())
    {
        return *iter;
    }
    return body;
}

std::optional<DiscoveredDevice> DiscoveredDevice::from_json(const nlohmann::json& reply, const std::string& ip)
{
    if (!reply.is_object())
    {
        return std::nullopt;
    }

    const nlohmann::json* fields = &reply;
    auto result_iter             = reply.find(protocol::key_result);
    if (result_iter != reply.end() && result_iter->is_object())
    {
        fields = &*result_iter;
    }

    auto mac = optional_string(*fields, protocol::key_mac);
    if (!mac || mac->empty())
    {
        return std::nullopt;
    }

    return DiscoveredDevice {ip, *mac, optional_string(*fields, protocol::key_module_name),
                             optional_string(*fields, protocol::key_fw_version)};
}

bool operator==(const DiscoveredDevice& lhs, const DiscoveredDevice& rhs)
{
    return lhs.ip == rhs.ip && lhs.mac == rhs.mac;
}

std::ostream& operator<<(std::ostream& stream, const DiscoveredDevice& device)
{
    stream << "DiscoveredDevice(ip: " << device.ip << ", mac: " << device.mac;
    if (device.module_name)
    {
        stream << ", module: " << *device.module_name;
    }
    return stream << ")";
}

namespace protocol
{

nlohmann::json make_request(const std::string& method, const nlohmann::json& params)
{
    return nlohmann::json {{key_method, method}, {key_params, params}};
}

nlohmann::json make_registration_request()
{
    return make_request(method_registration, {{"phoneMac", discovery_phone_mac},
                                              {"register", false},
                                              {"phoneIp", discovery_phone_ip},
                                              {"id", discovery_request_id}});
}

std::string method_of(const nlohmann::json& message)
{
    if (message.is_object())
    {
        auto iter = message.find(key_method);
        if (iter != message.end() && iter->is_string())
        {
            return iter->get<std::string>();
        }
    }
    return "unknown";
}

} // namespace protocol
} // namespace wizctl
