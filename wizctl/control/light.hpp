#pragma once

#include "wizctl/exchange/exchange.hpp"
#include "wizctl/logging/wizctl_logging.hpp"
#include "wizctl/protocol/protocol_constants.hpp"
#include "wizctl/retry/retry_policy.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace wizctl
{

/**
 * @brief A single device addressed by IP.
 *
 * Every call is one send(); the replies are returned as raw "result" objects for a state
 * decoder to interpret. Values are passed through unchecked.
 */
class Light
{
public:
    explicit Light(std::string address, unsigned short port = protocol::wiz_port,
                   std::chrono::milliseconds timeout = protocol::default_timeout, RetryPolicy retry = default_send_retry_policy(),
                   logging::Logger& logger = logging::null_logger());

    const std::string& address() const noexcept { return _address; }
    unsigned short port() const noexcept { return _port; }

    /// Current pilot state ("result" of getPilot).
    nlohmann::json get_pilot();

    nlohmann::json get_system_config();

    /// Model configuration, or std::nullopt on firmware without getModelConfig.
    std::optional<nlohmann::json> get_model_config();

    nlohmann::json get_user_config();

    void set_pilot(const nlohmann::json& params);

    /// @param brightness Dimming percentage sent along, if given.
    void turn_on(std::optional<int> brightness = std::nullopt);
    void turn_off();

    void reboot();
    void reset();

    /// Sends an arbitrary message and returns the whole reply.
    Reply request(const nlohmann::json& message);

private:
    nlohmann::json call(const char* method, const nlohmann::json& params = nlohmann::json::object());

    std::string _address;
    unsigned short _port;
    std::chrono::milliseconds _timeout;
    RetryPolicy _retry;
    logging::Logger& _logger;
};

} // namespace wizctl
