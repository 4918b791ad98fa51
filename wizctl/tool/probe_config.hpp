#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wizctl/logging/wizctl_logging.hpp"
#include "wizctl/protocol/protocol_constants.hpp"
#include "wizctl/retry/retry_policy.hpp"

namespace wizctl
{

enum class ProbeMode
{
    discover,
    send
};

struct ProbeConfig
{
    ProbeMode mode = ProbeMode::discover;

    // discover
    std::string broadcast_address    = protocol::default_broadcast_address;
    bool all_interfaces              = false;
    std::chrono::milliseconds window = protocol::default_discovery_timeout;

    // send
    std::vector<std::string> addresses;
    std::string method = protocol::method_get_pilot;
    nlohmann::json params             = nlohmann::json::object();
    std::chrono::milliseconds timeout = protocol::default_timeout;

    unsigned short port = protocol::wiz_port;
    RetryPolicy retry   = RetryPolicy::disabled();
    logging::LogLevel log_level = logging::LogLevel::Warning;
};

} // namespace wizctl
