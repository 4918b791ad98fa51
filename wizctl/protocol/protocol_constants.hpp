#pragma once

#include <chrono>
#include <cstddef>

namespace wizctl
{
namespace protocol
{

/// UDP port used for unicast requests and discovery broadcasts alike.
constexpr unsigned short wiz_port = 38899;

constexpr const char* default_broadcast_address = "255.255.255.255";

/// Per-attempt timeout for point-to-point requests.
constexpr std::chrono::milliseconds default_timeout = std::chrono::seconds(3);

/// Total window for discovery.
constexpr std::chrono::milliseconds default_discovery_timeout = std::chrono::seconds(10);

// Point-to-point retry defaults: 6 datagrams in total, backing off from 750ms up to 3s.
constexpr std::size_t max_send_datagrams                = 6;
constexpr std::chrono::milliseconds first_send_interval = std::chrono::milliseconds(750);
constexpr std::chrono::milliseconds max_backoff         = std::chrono::seconds(3);

// Discovery retry defaults.
constexpr std::size_t discovery_retries                      = 5;
constexpr std::chrono::milliseconds discovery_first_interval = std::chrono::milliseconds(500);

constexpr const char* method_get_pilot         = "getPilot";
constexpr const char* method_set_pilot         = "setPilot";
constexpr const char* method_registration      = "registration";
constexpr const char* method_get_system_config = "getSystemConfig";
constexpr const char* method_get_user_config   = "getUserConfig";
constexpr const char* method_get_model_config  = "getModelConfig";
constexpr const char* method_reboot            = "reboot";
constexpr const char* method_reset             = "reset";

constexpr const char* key_method      = "method";
constexpr const char* key_params      = "params";
constexpr const char* key_result      = "result";
constexpr const char* key_error       = "error";
constexpr const char* key_code        = "code";
constexpr const char* key_message     = "message";
constexpr const char* key_state       = "state";
constexpr const char* key_dimming     = "dimming";
constexpr const char* key_mac         = "mac";
constexpr const char* key_module_name = "moduleName";
constexpr const char* key_fw_version  = "fwVersion";

/// JSON-RPC style code a device returns for a method its firmware does not know.
constexpr int error_code_method_not_found = -32601;

// Placeholder caller identity sent with the registration broadcast.
constexpr const char* discovery_phone_mac  = "AAAAAAAAAAAA";
constexpr const char* discovery_phone_ip   = "1.2.3.4";
constexpr const char* discovery_request_id = "1";

} // namespace protocol
} // namespace wizctl
