#include "wizctl/control/light.hpp"
#include "wizctl/errors/wiz_errors.hpp"
#include "wizctl/protocol/message.hpp"

#include <utility>

namespace wizctl
{

Light::Light(std::string address, unsigned short port, std::chrono::milliseconds timeout, RetryPolicy retry, logging::Logger& logger)
    : _address(std::move(address)), _port(port), _timeout(timeout), _retry(std::move(retry)), _logger(logger)
{
}

nlohmann::json Light::get_pilot()
{
    return call(protocol::method_get_pilot);
}

nlohmann::json Light::get_system_config()
{
    return call(protocol::method_get_system_config);
}

std::optional<nlohmann::json> Light::get_model_config()
{
    try
    {
        return call(protocol::method_get_model_config);
    }
    catch (const MethodNotFoundError&)
    {
        WIZCTL_LOG_DEBUG(_logger, "Light at " << _address << " has no model configuration");
        return std::nullopt;
    }
}

nlohmann::json Light::get_user_config()
{
    return call(protocol::method_get_user_config);
}

void Light::set_pilot(const nlohmann::json& params)
{
    call(protocol::method_set_pilot, params);
}

void Light::turn_on(std::optional<int> brightness)
{
    nlohmann::json params = {{protocol::key_state, true}};
    if (brightness)
    {
        params[protocol::key_dimming] = *brightness;
    }
    set_pilot(params);
}

void Light::turn_off()
{
    set_pilot({{protocol::key_state, false}});
}

void Light::reboot()
{
    call(protocol::method_reboot);
}

void Light::reset()
{
    call(protocol::method_reset);
}

Reply Light::request(const nlohmann::json& message)
{
    return send(_address, _port, message, _timeout, _retry, _logger);
}

nlohmann::json Light::call(const char* method, const nlohmann::json& params)
{
    return request(protocol::make_request(method, params)).result();
}

} // namespace wizctl
