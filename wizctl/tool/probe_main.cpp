#include "wizctl/control/group.hpp"
#include "wizctl/discovery/discovery_collector.hpp"
#include "wizctl/errors/wiz_errors.hpp"
#include "wizctl/exchange/exchange.hpp"
#include "wizctl/logging/wizctl_logging.hpp"
#include "wizctl/protocol/message.hpp"
#include "wizctl/tool/probe_cli.hpp"
#include "wizctl/tool/probe_output.hpp"

#include <boost/program_options/errors.hpp>
#include <algorithm>
#include <iostream>
#include <vector>

namespace
{

int run_discover(const wizctl::ProbeConfig& config, wizctl::logging::Logger& logger)
{
    std::vector<wizctl::DiscoveredDevice> devices;
    if (config.all_interfaces)
    {
        devices = wizctl::discover_on_all_interfaces(config.window, config.retry, config.port, logger);
    }
    else
    {
        devices = wizctl::discover(config.broadcast_address, config.window, config.retry, config.port, logger);
    }

    std::cout << wizctl::format_devices(devices) << '\n';
    return 0;
}

int run_send(const wizctl::ProbeConfig& config, wizctl::logging::Logger& logger)
{
    const nlohmann::json message = wizctl::protocol::make_request(config.method, config.params);

    if (config.addresses.size() == 1)
    {
        wizctl::Reply reply = wizctl::send(config.addresses.front(), config.port, message, config.timeout, config.retry, logger);
        std::cout << wizctl::format_reply(reply) << '\n';
        return 0;
    }

    auto results = wizctl::send_to_group(config.addresses, message, config.port, config.timeout, config.retry, logger);
    std::cout << wizctl::format_group_results(results) << '\n';

    const bool all_succeeded =
        std::all_of(results.begin(), results.end(), [](const wizctl::GroupResult& result) { return result.success; });
    return all_succeeded ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[])
{
    wizctl::ProbeConfig config;
    try
    {
        config = wizctl::parse_command_line(argc, argv);
    }
    catch (const boost::program_options::error&)
    {
        return 2;
    }

    wizctl::logging::ConsoleLogger logger(config.log_level);

    try
    {
        if (config.mode == wizctl::ProbeMode::discover)
        {
            return run_discover(config, logger);
        }
        return run_send(config, logger);
    }
    catch (const wizctl::WizError& error)
    {
        std::cerr << "Error: " << error.what() << '\n';
        return 1;
    }
    catch (const nlohmann::json::exception& error)
    {
        std::cerr << "Error: " << error.what() << '\n';
        return 1;
    }
}
