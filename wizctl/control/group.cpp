#include "wizctl/control/group.hpp"
#include "wizctl/errors/wiz_errors.hpp"
#include "wizctl/net/udp_transport.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace wizctl
{

std::string GroupResult::error_message() const
{
    if (!error)
    {
        return std::string();
    }

    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& exception)
    {
        return exception.what();
    }
    return std::string();
}

std::vector<GroupResult> send_to_group(const std::vector<std::string>& addresses, const nlohmann::json& message, unsigned short port,
                                       std::chrono::milliseconds timeout, const RetryPolicy& retry, logging::Logger& logger)
{
    boost::asio::io_context io_context;

    std::vector<GroupResult> results(addresses.size());
    std::vector<std::unique_ptr<Exchange>> exchanges(addresses.size());
    std::chrono::milliseconds bound = std::chrono::milliseconds::zero();

    for (std::size_t index = 0; index < addresses.size(); ++index)
    {
        results[index].address = addresses[index];
        try
        {
            exchanges[index] = std::make_unique<Exchange>(io_context, make_endpoint(addresses[index], port), message, timeout, retry, logger);
            exchanges[index]->async_start();
            bound = std::max(bound, exchanges[index]->worst_case_duration());
        }
        catch (const WizError& error)
        {
            WIZCTL_LOG_ERROR(logger, "Cannot reach " << addresses[index] << ": " << error.what());
            results[index].error = std::current_exception();
        }
    }

    run_within(io_context, saturating_add(bound, safety_grace));

    std::size_t succeeded = 0;
    for (std::size_t index = 0; index < addresses.size(); ++index)
    {
        if (!exchanges[index])
        {
            continue;
        }

        try
        {
            results[index].reply   = exchanges[index]->take_result().body;
            results[index].success = true;
            ++succeeded;
        }
        catch (const WizError&)
        {
            results[index].error = std::current_exception();
        }
    }

    WIZCTL_LOG_INFO(logger, "Group request: " << succeeded << "/" << addresses.size() << " device(s) succeeded");
    return results;
}

} // namespace wizctl
