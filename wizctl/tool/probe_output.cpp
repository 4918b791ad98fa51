#include "wizctl/tool/probe_output.hpp"
#include "wizctl/protocol/protocol_constants.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace wizctl
{

namespace
{
constexpr int indent = 2;

std::string dump(const nlohmann::json& value)
{
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json to_json(const DiscoveredDevice& device)
{
    nlohmann::json result = {{"ip", device.ip}, {"mac", device.mac}};
    if (device.module_name)
    {
        result[protocol::key_module_name] = *device.module_name;
    }
    if (device.fw_version)
    {
        result[protocol::key_fw_version] = *device.fw_version;
    }
    return result;
}
} // namespace

std::string format_devices(const std::vector<DiscoveredDevice>& devices)
{
    nlohmann::json output = nlohmann::json::array();
    for (const auto& device : devices)
    {
        output.push_back(to_json(device));
    }
    return dump(output);
}

std::string format_reply(const Reply& reply)
{
    return dump(reply.body);
}

std::string format_group_results(const std::vector<GroupResult>& results)
{
    nlohmann::json output = nlohmann::json::array();
    for (const auto& result : results)
    {
        nlohmann::json entry = {{"address", result.address}, {"success", result.success}};
        if (result.success)
        {
            entry["reply"] = result.reply;
        }
        else
        {
            entry["error"] = result.error_message();
        }
        output.push_back(std::move(entry));
    }
    return dump(output);
}

} // namespace wizctl
