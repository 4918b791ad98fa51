#pragma once

#include "wizctl/exchange/exchange.hpp"
#include "wizctl/logging/wizctl_logging.hpp"
#include "wizctl/protocol/protocol_constants.hpp"
#include "wizctl/retry/retry_policy.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wizctl
{

/**
 * @brief Outcome of a group request for one device.
 */
struct GroupResult
{
    std::string address;
    bool success = false;
    std::exception_ptr error; ///< Set when success is false
    nlohmann::json reply;     ///< Whole reply body when success is true

    /// Message of the stored error, empty on success.
    std::string error_message() const;
};

/**
 * @brief Sends the same message to several devices at once.
 *
 * One Exchange per device, all running concurrently on a private io_context. A device that
 * fails, times out or cannot even be addressed is reported in its own GroupResult and does not
 * affect the others. Results are in the order of @p addresses.
 */
std::vector<GroupResult> send_to_group(const std::vector<std::string>& addresses, const nlohmann::json& message,
                                       unsigned short port = protocol::wiz_port,
                                       std::chrono::milliseconds timeout = protocol::default_timeout,
                                       const RetryPolicy& retry = default_send_retry_policy(),
                                       logging::Logger& logger = logging::null_logger());

} // namespace wizctl
